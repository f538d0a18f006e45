#include <persistence/state_holder.hpp>
#include <log/log.hpp>

#include <fmt/chrono.h>

#include <chrono>
#include <cstdlib>
#include <fstream>

namespace Persistence
{
    StateHolder::StateHolder(std::filesystem::path configPath)
        : configPath_{std::move(configPath)}
        , stateCache_{}
    {}

    std::filesystem::path StateHolder::defaultConfigPath()
    {
        if (char const* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0')
            return std::filesystem::path{xdg} / "twinpane" / "twinpane.json";
        if (char const* home = std::getenv("HOME"); home != nullptr && *home != '\0')
            return std::filesystem::path{home} / ".config" / "twinpane" / "twinpane.json";
        return std::filesystem::current_path() / "twinpane.json";
    }

    State& StateHolder::stateCache()
    {
        return stateCache_;
    }

    std::filesystem::path const& StateHolder::configPath() const
    {
        return configPath_;
    }

    void StateHolder::setupPersistence() const
    {
        const auto parentPath = configPath_.parent_path();
        std::error_code ec;
        if (!parentPath.empty() && !std::filesystem::exists(parentPath, ec))
            std::filesystem::create_directories(parentPath, ec);
        if (ec)
            Log::error("Failed to create config directory '{}': {}", parentPath.string(), ec.message());
    }

    void StateHolder::load(std::function<void(bool, StateHolder&)> const& onLoad)
    {
        setupPersistence();
        auto const& path = configPath_;

        auto makeBackup = [&path]() {
            const auto backupFileName = [&path]() {
                const auto now = std::chrono::system_clock::now();
                const auto time =
                    fmt::format("{:%Y-%m-%d_%H-%M-%S}", fmt::localtime(std::chrono::system_clock::to_time_t(now)));

                return path.parent_path() / (path.filename().string() + ".backup_" + time);
            }();

            {
                std::ifstream reader{path, std::ios_base::binary};
                std::ofstream writer{backupFileName, std::ios_base::binary};

                writer << reader.rdbuf();
            }
            Log::info("Copied config file to backup: {}", backupFileName.string());
        };

        try
        {
            const auto before = [&path, &makeBackup]() {
                try
                {
                    std::ifstream reader{path, std::ios_base::binary};
                    if (!reader.good())
                    {
                        Log::warn("Config file does not exist, creating it with defaults.");
                        return nlohmann::json(nullptr);
                    }
                    return nlohmann::json::parse(reader, nullptr, true, true);
                }
                catch (std::exception const& e)
                {
                    Log::error("Failed to parse config file: {}", e.what());
                    makeBackup();
                    return nlohmann::json(nullptr);
                }
            }();

            if (before.is_null())
            {
                stateCache_ = {};
                dataFixer(nlohmann::json::object());
                onLoad(true, *this);
                return;
            }

            before.get_to(stateCache_);
            dataFixer(before);
            onLoad(true, *this);
        }
        catch (std::exception const& e)
        {
            Log::error("Failed to load config file: {}", e.what());
            onLoad(false, *this);
        }
    }

    void StateHolder::dataFixer(nlohmann::json const& before)
    {
        bool mustSave = false;

        const auto transferDefaults = TransferOptions::defaults();
        if (!stateCache_.transferOptions.chunkSize || !stateCache_.transferOptions.operationTimeoutSeconds)
        {
            Log::warn("Config file misses transfer options, adding defaults.");
            stateCache_.transferOptions.useDefaultsFrom(transferDefaults);
        }

        if (!stateCache_.defaultSshOptions.tryAgentForAuthentication)
            stateCache_.defaultSshOptions.tryAgentForAuthentication = true;
        if (!stateCache_.defaultSshOptions.usePublicKeyAutoAuth)
            stateCache_.defaultSshOptions.usePublicKeyAutoAuth = true;

        const auto after = nlohmann::json(stateCache_);
        const auto diff = nlohmann::json::diff(before, after);
        if (!diff.empty())
        {
            Log::warn("Config diff: {}", diff.dump());
            mustSave = true;
        }

        if (mustSave)
        {
            Log::warn("Config file misses some defaults, writing them back to disk.");
            save();
        }
    }

    bool StateHolder::save()
    {
        setupPersistence();

        std::ofstream writer{configPath_, std::ios_base::binary};
        if (!writer.good())
        {
            Log::error("Failed to save config file: cannot open '{}'", configPath_.string());
            return false;
        }
        writer << nlohmann::json(stateCache_).dump(4);
        return writer.good();
    }
}
