#pragma once

#include <functional>
#include <optional>
#include <string>

class PasswordProvider
{
  public:
    virtual void getPassword(
        std::string const& whatFor,
        std::string const& prompt,
        std::function<void(std::optional<std::string>)> const& onPasswordReady) = 0;
    virtual ~PasswordProvider() = default;
};

/**
 * @brief libssh compatible ask pass function. userdata must point to a AskPassUserData.
 */
int askPassDefault(char const* prompt, char* buf, std::size_t length, int echo, int verify, void* userdata);

struct AskPassUserData
{
    PasswordProvider* provider;
    std::string whatFor;
};
