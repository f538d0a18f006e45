#include <app/command_line.hpp>

#include <fmt/format.h>

#include <string_view>
#include <unordered_map>

namespace
{
    std::optional<Command> commandFromString(std::string_view name)
    {
        static const std::unordered_map<std::string_view, Command> commands{
            {"copy", Command::Copy},
            {"cp", Command::Copy},
            {"move", Command::Move},
            {"mv", Command::Move},
            {"delete", Command::Delete},
            {"rm", Command::Delete},
            {"mkdir", Command::MakeDirectory},
            {"help", Command::Help},
        };
        if (const auto iter = commands.find(name); iter != commands.end())
            return iter->second;
        return std::nullopt;
    }
}

std::expected<CommandLine, std::string> parseCommandLine(int argc, char const* const* argv)
{
    CommandLine commandLine{};
    bool commandSeen = false;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view argument{argv[i]};

        if (!commandSeen && argument.starts_with("-"))
        {
            if (argument == "-h" || argument == "--help")
                return CommandLine{};

            const auto takeValue = [&]() -> std::expected<std::string, std::string> {
                if (i + 1 >= argc)
                    return std::unexpected(fmt::format("Option '{}' needs a value.", argument));
                return std::string{argv[++i]};
            };

            if (argument == "-c" || argument == "--config")
            {
                auto value = takeValue();
                if (!value)
                    return std::unexpected(value.error());
                commandLine.configFile = *value;
            }
            else if (argument == "--on-conflict")
            {
                auto value = takeValue();
                if (!value)
                    return std::unexpected(value.error());
                if (*value != "skip" && *value != "replace")
                    return std::unexpected(fmt::format("--on-conflict takes 'skip' or 'replace', not '{}'.", *value));
                commandLine.onConflict = *value;
            }
            else
                return std::unexpected(fmt::format("Unknown option '{}'.", argument));
            continue;
        }

        if (!commandSeen)
        {
            const auto command = commandFromString(argument);
            if (!command)
                return std::unexpected(fmt::format("Unknown command '{}'.", argument));
            commandLine.command = *command;
            commandSeen = true;
            continue;
        }

        commandLine.arguments.emplace_back(argument);
    }

    const auto count = commandLine.arguments.size();
    switch (commandLine.command)
    {
        case Command::Copy:
        case Command::Move:
            if (count < 2)
                return std::unexpected(std::string{"copy and move need at least one source and a target directory."});
            break;
        case Command::Delete:
            if (count < 1)
                return std::unexpected(std::string{"delete needs at least one path."});
            break;
        case Command::MakeDirectory:
            if (count != 2)
                return std::unexpected(std::string{"mkdir needs a directory and a name."});
            break;
        case Command::Help:
            break;
    }
    return commandLine;
}

std::string usage()
{
    return "Usage: twinpane [--config FILE] [--on-conflict skip|replace] <command> <arguments...>\n"
           "\n"
           "Commands:\n"
           "  copy SOURCE... TARGET_DIRECTORY   Copy files and directories.\n"
           "  move SOURCE... TARGET_DIRECTORY   Move files and directories.\n"
           "  delete PATH...                    Delete files and directories recursively.\n"
           "  mkdir DIRECTORY NAME              Create a folder.\n"
           "\n"
           "Remote paths are written sftp://<session>/<path>, where <session> names an entry of\n"
           "sshSessionOptions in the configuration. sftp://<session> alone is the home directory.\n";
}
