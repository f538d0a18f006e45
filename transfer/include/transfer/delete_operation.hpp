#pragma once

#include <transfer/cancellation_token.hpp>
#include <transfer/transfer_plan.hpp>
#include <shared_data/file_operations/transfer_result.hpp>

#include <vector>

namespace Transfer
{
    /**
     * @brief Removes the selected entries, directories with all their contents.
     * A failing entry is recorded and the next one is removed. Stops between entries when cancelled.
     */
    SharedData::TransferResult
    deleteEntries(Vfs::Backend& backend, std::vector<DisplayEntry> const& selection, CancellationToken const& token);
}
