#pragma once

#include <persistence/state_core.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace Persistence
{
    struct SshOptions
    {
        std::optional<std::filesystem::path> sshDirectory{std::nullopt};
        std::optional<std::filesystem::path> knownHostsFile{std::nullopt};
        std::optional<bool> tryAgentForAuthentication{std::nullopt};
        std::optional<bool> usePublicKeyAutoAuth{std::nullopt};
        std::optional<std::string> logVerbosity{std::nullopt};
        std::optional<bool> strictHostKeyCheck{std::nullopt};
        std::optional<std::string> proxyCommand{std::nullopt};
        std::optional<int> connectTimeoutSeconds{std::nullopt};

        void useDefaultsFrom(SshOptions const& other);
    };
    void to_json(nlohmann::json& j, SshOptions const& options);
    void from_json(nlohmann::json const& j, SshOptions& options);
}
