#pragma once

#include <log/level.hpp>
#include <persistence/state_core.hpp>
#include <persistence/state/ssh_options.hpp>
#include <persistence/state/ssh_session_options.hpp>
#include <persistence/state/transfer_options.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

namespace Persistence
{
    struct State
    {
        // Applied to every session for the fields the session does not set itself.
        SshOptions defaultSshOptions{};
        std::unordered_map<std::string, SshSessionOptions> sshSessionOptions{};
        TransferOptions transferOptions{};
        Log::Level logLevel{Log::Level::Info};
        std::optional<std::filesystem::path> logFile{std::nullopt};

        /**
         * @brief Returns the named session with defaults applied.
         */
        std::optional<SshSessionOptions> sessionOptions(std::string const& name) const;
    };

    void to_json(nlohmann::json& j, State const& state);
    void from_json(nlohmann::json const& j, State& state);
}
