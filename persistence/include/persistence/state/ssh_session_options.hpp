#pragma once

#include <persistence/state_core.hpp>
#include <persistence/state/ssh_options.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace Persistence
{
    /**
     * @brief Connection parameters of one remote pane.
     */
    struct SshSessionOptions
    {
        std::string host{};
        std::optional<int> port{std::nullopt};
        std::optional<std::string> user{std::nullopt};
        // Stored in plain text. Prefer keys or the agent.
        std::optional<std::string> password{std::nullopt};
        std::optional<std::string> sshKey{std::nullopt};
        // Remote working path the pane starts in. Defaults to the login directory.
        std::optional<std::string> defaultDirectory{std::nullopt};
        SshOptions sshOptions{};

        void useDefaultsFrom(SshSessionOptions const& other);
    };
    void to_json(nlohmann::json& j, SshSessionOptions const& options);
    void from_json(nlohmann::json const& j, SshSessionOptions& options);
}
