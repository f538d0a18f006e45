#include <persistence/state/ssh_session_options.hpp>

namespace Persistence
{
    void SshSessionOptions::useDefaultsFrom(SshSessionOptions const& other)
    {
        if (host.empty())
            host = other.host;
        fillUnset(port, other.port);
        fillUnset(user, other.user);
        fillUnset(sshKey, other.sshKey);
        fillUnset(defaultDirectory, other.defaultDirectory);
        // Passwords are never inherited from the defaults entry.
        sshOptions.useDefaultsFrom(other.sshOptions);
    }

    void to_json(nlohmann::json& j, SshSessionOptions const& options)
    {
        j = nlohmann::json{{"host", options.host}, {"sshOptions", options.sshOptions}};
        writeOptional(j, "port", options.port);
        writeOptional(j, "user", options.user);
        writeOptional(j, "password", options.password);
        writeOptional(j, "sshKey", options.sshKey);
        writeOptional(j, "defaultDirectory", options.defaultDirectory);
    }

    void from_json(nlohmann::json const& j, SshSessionOptions& options)
    {
        options = {};
        options.host = j.value("host", std::string{});
        if (auto iter = j.find("sshOptions"); iter != j.end())
            iter->get_to(options.sshOptions);

        readOptional(j, "port", options.port);
        readOptional(j, "user", options.user);
        readOptional(j, "password", options.password);
        readOptional(j, "sshKey", options.sshKey);
        readOptional(j, "defaultDirectory", options.defaultDirectory);
    }
}
