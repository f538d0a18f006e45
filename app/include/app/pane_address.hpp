#pragma once

#include <optional>
#include <string>
#include <string_view>

/**
 * @brief What the user typed to address a file in a pane.
 */
struct PaneAddress
{
    // Set for remote addresses.
    std::optional<std::string> sessionName{std::nullopt};
    // Relative paths are resolved against the current directory of the pane.
    std::string path{};

    bool isRemote() const
    {
        return sessionName.has_value();
    }
};

/**
 * @brief Splits "sftp://<session>/<path>" into session and path. Everything else is a local path.
 *
 * @return nullopt for a remote address without session name.
 */
std::optional<PaneAddress> parsePaneAddress(std::string_view address);
