#pragma once

#include <transfer/cancellation_token.hpp>
#include <transfer/conflict_policy.hpp>
#include <transfer/progress_tracker.hpp>
#include <transfer/transfer_plan.hpp>
#include <shared_data/file_operations/transfer_mode.hpp>
#include <shared_data/file_operations/transfer_result.hpp>
#include <utility/describe.hpp>

#include <cstddef>
#include <functional>
#include <vector>

namespace Transfer
{
    BOOST_DEFINE_ENUM_CLASS(TaskState, Pending, ConflictCheck, Copying, Moving, Done, Skipped, Failed);
    BOOST_DEFINE_ENUM_CLASS(TransferStrategy, LocalToLocal, Upload, Download, RemoteToRemote);

    TransferStrategy strategyFor(Vfs::BackendKind source, Vfs::BackendKind target);

    struct ExecutorOptions
    {
        std::size_t chunkSize{8192};
    };

    /**
     * @brief How the executor talks back to the user. Both are called on the executing thread.
     */
    struct TransferCallbacks
    {
        ProgressTracker::Callback onProgress{};
        ConflictPolicy::Prompt onConflict{};
    };

    /**
     * @brief Executes a plan task by task. A failing task is recorded and the next one is started.
     * Cancellation stops the run, partially written targets are left as they are.
     * Cancelling at a conflict also cancels the token.
     */
    class TransferExecutor
    {
      public:
        explicit TransferExecutor(ExecutorOptions options = {});

        SharedData::TransferResult execute(
            TransferPlan const& plan,
            SharedData::TransferMode mode,
            TransferCallbacks const& callbacks,
            CancellationToken& token);

        /**
         * @brief The final state of every task of the last run, in plan order.
         */
        std::vector<TaskState> const& taskStates() const
        {
            return taskStates_;
        }

      private:
        ExecutorOptions options_;
        std::vector<TaskState> taskStates_;
    };
}
