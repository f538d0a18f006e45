#pragma once

#include <app/password/password_provider.hpp>

#include <cstdio>

/**
 * @brief Reads passwords from the terminal without echoing them.
 */
class ConsolePasswordPrompter : public PasswordProvider
{
  public:
    explicit ConsolePasswordPrompter(std::FILE* input = stdin, std::FILE* output = stderr);

    void getPassword(
        std::string const& whatFor,
        std::string const& prompt,
        std::function<void(std::optional<std::string>)> const& onPasswordReady) override;

  private:
    std::FILE* input_;
    std::FILE* output_;
};
