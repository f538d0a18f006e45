#include <app/pane_address.hpp>

std::optional<PaneAddress> parsePaneAddress(std::string_view address)
{
    constexpr std::string_view scheme{"sftp://"};
    if (!address.starts_with(scheme))
        return PaneAddress{.sessionName = std::nullopt, .path = std::string{address}};

    address.remove_prefix(scheme.size());
    const auto slash = address.find('/');
    const auto sessionName = address.substr(0, slash);
    if (sessionName.empty())
        return std::nullopt;

    // Without a path the session starts in its home directory.
    const auto path = slash == std::string_view::npos ? std::string_view{"."} : address.substr(slash);
    return PaneAddress{.sessionName = std::string{sessionName}, .path = std::string{path}};
}
