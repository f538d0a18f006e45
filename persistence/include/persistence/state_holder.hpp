#pragma once

#include <persistence/state/state.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <functional>

namespace Persistence
{
    /**
     * @brief Owns the configuration and its file.
     */
    class StateHolder
    {
      public:
        explicit StateHolder(std::filesystem::path configPath);

        /**
         * @brief Loads the configuration. A missing file is created with defaults, a broken one is backed up and
         * replaced by defaults.
         *
         * @param onLoad Called with false only if the configuration could not be established at all.
         */
        void load(std::function<void(bool, StateHolder&)> const& onLoad);

        /**
         * @brief Writes the configuration to disk.
         *
         * @return false if the file could not be written.
         */
        bool save();

        State& stateCache();
        std::filesystem::path const& configPath() const;

        static std::filesystem::path defaultConfigPath();

      private:
        void dataFixer(nlohmann::json const& before);
        void setupPersistence() const;

      private:
        std::filesystem::path configPath_;
        State stateCache_;
    };
} // namespace Persistence
