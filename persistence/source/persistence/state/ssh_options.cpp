#include <persistence/state/ssh_options.hpp>

namespace Persistence
{
    void SshOptions::useDefaultsFrom(SshOptions const& other)
    {
        fillUnset(sshDirectory, other.sshDirectory);
        fillUnset(knownHostsFile, other.knownHostsFile);
        fillUnset(tryAgentForAuthentication, other.tryAgentForAuthentication);
        fillUnset(usePublicKeyAutoAuth, other.usePublicKeyAutoAuth);
        fillUnset(logVerbosity, other.logVerbosity);
        fillUnset(strictHostKeyCheck, other.strictHostKeyCheck);
        fillUnset(proxyCommand, other.proxyCommand);
        fillUnset(connectTimeoutSeconds, other.connectTimeoutSeconds);
    }

    void to_json(nlohmann::json& j, SshOptions const& options)
    {
        j = nlohmann::json::object();
        writeOptional(j, "sshDirectory", options.sshDirectory);
        writeOptional(j, "knownHostsFile", options.knownHostsFile);
        writeOptional(j, "tryAgentForAuthentication", options.tryAgentForAuthentication);
        writeOptional(j, "usePublicKeyAutoAuth", options.usePublicKeyAutoAuth);
        writeOptional(j, "logVerbosity", options.logVerbosity);
        writeOptional(j, "strictHostKeyCheck", options.strictHostKeyCheck);
        writeOptional(j, "proxyCommand", options.proxyCommand);
        writeOptional(j, "connectTimeoutSeconds", options.connectTimeoutSeconds);
    }

    void from_json(nlohmann::json const& j, SshOptions& options)
    {
        readOptional(j, "sshDirectory", options.sshDirectory);
        readOptional(j, "knownHostsFile", options.knownHostsFile);
        readOptional(j, "tryAgentForAuthentication", options.tryAgentForAuthentication);
        readOptional(j, "usePublicKeyAutoAuth", options.usePublicKeyAutoAuth);
        readOptional(j, "logVerbosity", options.logVerbosity);
        readOptional(j, "strictHostKeyCheck", options.strictHostKeyCheck);
        readOptional(j, "proxyCommand", options.proxyCommand);
        readOptional(j, "connectTimeoutSeconds", options.connectTimeoutSeconds);
    }
}
