#include <persistence/state/state.hpp>

namespace Persistence
{
    std::optional<SshSessionOptions> State::sessionOptions(std::string const& name) const
    {
        auto iter = sshSessionOptions.find(name);
        if (iter == sshSessionOptions.end())
            return std::nullopt;

        auto options = iter->second;
        options.sshOptions.useDefaultsFrom(defaultSshOptions);
        return options;
    }

    void to_json(nlohmann::json& j, State const& state)
    {
        j = nlohmann::json::object();
        j["defaultSshOptions"] = state.defaultSshOptions;
        j["sshSessionOptions"] = state.sshSessionOptions;
        j["transferOptions"] = state.transferOptions;
        j["logLevel"] = Log::levelToString(state.logLevel);
        if (state.logFile)
            j["logFile"] = state.logFile->string();
    }
    void from_json(nlohmann::json const& j, State& state)
    {
        state = {};
        if (j.contains("defaultSshOptions"))
            j.at("defaultSshOptions").get_to(state.defaultSshOptions);
        if (j.contains("sshSessionOptions"))
            j.at("sshSessionOptions").get_to(state.sshSessionOptions);
        if (j.contains("transferOptions"))
            j.at("transferOptions").get_to(state.transferOptions);
        if (j.contains("logLevel"))
            state.logLevel = Log::levelFromString(j.at("logLevel").get<std::string>());
        if (j.contains("logFile"))
            state.logFile = std::filesystem::path{j.at("logFile").get<std::string>()};
    }
}
