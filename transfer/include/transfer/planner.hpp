#pragma once

#include <transfer/transfer_plan.hpp>

#include <expected>
#include <vector>

namespace Transfer
{
    /**
     * @brief Turns a selection into tasks and measures their size.
     * Entries that cannot be resolved are dropped, directories that cannot be read are not counted.
     *
     * @param targetDirectory Used for all entries without their own target directory.
     * @param sourceDirectory Relative source paths of the selection are resolved against this.
     * @return EmptySelection if no entry could be resolved.
     */
    std::expected<TransferPlan, SharedData::Error> planTransfer(
        std::vector<DisplayEntry> const& selection,
        Vfs::Backend& source,
        Vfs::Backend& target,
        std::filesystem::path const& targetDirectory,
        std::filesystem::path const& sourceDirectory = "/");

    /**
     * @brief Size of a file or the sum of all regular files below a directory. Best effort, symlinks in the tree are
     * not followed.
     */
    std::uint64_t measureBytes(Vfs::Backend& backend, std::filesystem::path const& path, bool isDirectory);
}
