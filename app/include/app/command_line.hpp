#pragma once

#include <utility/describe.hpp>

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

BOOST_DEFINE_ENUM_CLASS(Command, Help, Copy, Move, Delete, MakeDirectory);

struct CommandLine
{
    Command command{Command::Help};
    std::optional<std::filesystem::path> configFile{std::nullopt};
    // Answer every conflict with this instead of asking. One of "skip", "replace".
    std::optional<std::string> onConflict{std::nullopt};
    std::vector<std::string> arguments{};
};

/**
 * @brief Parses "twinpane [options] <command> <arguments...>".
 *
 * @return The parsed command line or a message for the user.
 */
std::expected<CommandLine, std::string> parseCommandLine(int argc, char const* const* argv);

std::string usage();
