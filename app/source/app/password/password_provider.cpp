#include <app/password/password_provider.hpp>
#include <log/log.hpp>

#include <cstring>

int askPassDefault(char const* prompt, char* buf, std::size_t length, int, int, void* userdata)
{
    auto const* data = static_cast<AskPassUserData const*>(userdata);
    if (data == nullptr || data->provider == nullptr || length == 0)
        return -1;

    std::optional<std::string> password{};
    data->provider->getPassword(data->whatFor, prompt, [&password](std::optional<std::string> pw) {
        password = std::move(pw);
    });

    if (!password.has_value())
    {
        Log::info("AskPass: No {} given.", data->whatFor);
        return -1;
    }

    std::memset(buf, 0, length);
    std::strncpy(buf, password->c_str(), length - 1);
    return 0;
}
