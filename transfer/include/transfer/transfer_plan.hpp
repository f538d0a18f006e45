#pragma once

#include <vfs/backend.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Transfer
{
    /**
     * @brief One entry the user selected in a pane.
     */
    struct DisplayEntry
    {
        std::string displayName{};
        std::filesystem::path sourcePath{};
        // Overrides the target directory of the plan for this entry.
        std::optional<std::filesystem::path> targetDirectory{std::nullopt};
    };

    /**
     * @brief One top level file or directory to transfer. Directories are expanded while executing.
     */
    struct TransferTask
    {
        Vfs::Backend* sourceBackend{nullptr};
        Vfs::Backend* targetBackend{nullptr};
        std::filesystem::path sourcePath{};
        std::filesystem::path targetPath{};
        std::string displayName{};
        bool isDirectory{false};
        // Measured while planning, best effort.
        std::uint64_t bytes{0};
    };

    struct TransferPlan
    {
        std::vector<TransferTask> tasks{};
        std::uint64_t totalBytes{0};
    };
}
