#pragma once

#include <transfer/conflict_policy.hpp>

#include <functional>
#include <future>
#include <mutex>
#include <optional>

namespace Transfer
{
    /**
     * @brief Bridges the conflict prompt of a worker thread to a user interface running elsewhere.
     * The worker blocks in ask until answer or abandon is called from the interface side.
     */
    class BlockingConflictPrompter
    {
      public:
        /**
         * @brief Shows the question to the user. Must not block, the answer arrives through answer().
         */
        using Presenter = std::function<void(SharedData::ConflictQuestion const&)>;

        explicit BlockingConflictPrompter(Presenter presenter);
        BlockingConflictPrompter(BlockingConflictPrompter const&) = delete;
        BlockingConflictPrompter& operator=(BlockingConflictPrompter const&) = delete;

        /**
         * @brief Called on the worker thread, blocks until answered.
         */
        SharedData::ConflictDecision ask(SharedData::ConflictQuestion const& question);

        /**
         * @return false if no question is pending.
         */
        bool answer(SharedData::ConflictDecision decision);

        /**
         * @brief Answers the pending and all future questions with cancel. Call before the user interface goes away.
         */
        void abandon();

        bool hasPendingQuestion() const;

        /**
         * @brief The prompt to pass to the transfer. The prompter must outlive the transfer.
         */
        ConflictPolicy::Prompt asCallback();

      private:
        Presenter presenter_;
        mutable std::mutex mutex_;
        std::optional<std::promise<SharedData::ConflictDecision>> pending_;
        bool abandoned_;
    };
}
