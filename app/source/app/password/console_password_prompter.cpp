#include <app/password/console_password_prompter.hpp>

#include <fmt/format.h>

#include <termios.h>
#include <unistd.h>

namespace
{
    class EchoDisabler
    {
      public:
        explicit EchoDisabler(int fd)
            : fd_{fd}
            , original_{}
            , active_{false}
        {
            if (!isatty(fd_) || tcgetattr(fd_, &original_) != 0)
                return;
            auto silent = original_;
            silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            active_ = tcsetattr(fd_, TCSAFLUSH, &silent) == 0;
        }
        ~EchoDisabler()
        {
            if (active_)
                tcsetattr(fd_, TCSAFLUSH, &original_);
        }
        EchoDisabler(EchoDisabler const&) = delete;
        EchoDisabler& operator=(EchoDisabler const&) = delete;

      private:
        int fd_;
        termios original_;
        bool active_;
    };
}

ConsolePasswordPrompter::ConsolePasswordPrompter(std::FILE* input, std::FILE* output)
    : input_{input}
    , output_{output}
{}

void ConsolePasswordPrompter::getPassword(
    std::string const& whatFor,
    std::string const& prompt,
    std::function<void(std::optional<std::string>)> const& onPasswordReady)
{
    fmt::print(output_, "{} ({}): ", prompt, whatFor);
    std::fflush(output_);

    std::string password{};
    {
        EchoDisabler echoDisabler{fileno(input_)};
        int c = 0;
        while ((c = std::fgetc(input_)) != EOF && c != '\n')
            password.push_back(static_cast<char>(c));
        if (c == EOF && password.empty())
        {
            fmt::print(output_, "\n");
            onPasswordReady(std::nullopt);
            return;
        }
    }
    fmt::print(output_, "\n");
    onPasswordReady(std::move(password));
}
