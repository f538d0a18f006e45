#pragma once

#include <ssh/async/processing_thread.hpp>

#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>

namespace SecureShell
{
    /**
     * @brief This class makes it impossible to push tasks to a strand after it has been finalized.
     * Finalization usually means some close operation is happening and no more tasks should be pushed.
     * Like reading a file when the session is closed.
     */
    class ProcessingStrand
    {
      public:
        /**
         * @brief Construct a new Processing Strand object living on top of a processing thread.
         *
         * @param processingThread The processing thread to push tasks to.
         */
        explicit ProcessingStrand(ProcessingThread* processingThread)
            : processingThread_(processingThread)
        {}

        /**
         * @brief Pushes a task, but not if the strand has been finalized and not simultaneously with any other push.
         *
         * @return false If the strand has been finalized or the thread is shutting down.
         */
        bool pushTask(std::function<void()> task)
        {
            std::scoped_lock lock(mutex_);
            if (finalized_)
                return false;
            return processingThread_->pushTask(std::move(task));
        }

        /**
         * @brief Works like pushPromiseTask but makes any further pushes impossible.
         */
        template <typename FunctionT>
        auto pushFinalPromiseTask(FunctionT&& func) -> std::future<std::invoke_result_t<std::decay_t<FunctionT>>>
        {
            std::scoped_lock lock(mutex_);
            if (finalized_)
                return rejected<std::invoke_result_t<std::decay_t<FunctionT>>>();
            finalized_ = true;
            return processingThread_->pushPromiseTask(std::forward<FunctionT>(func));
        }

        /**
         * @brief Pushes a task the return of which is returned for a future.
         *
         * @tparam Func The type of the task.
         * @param func The task to push.
         * @return std::future<std::invoke_result_t<std::decay_t<Func>>> The future of the return value of the task.
         */
        template <typename Func>
        auto pushPromiseTask(Func&& func) -> std::future<std::invoke_result_t<std::decay_t<Func>>>
        {
            std::scoped_lock lock(mutex_);
            if (finalized_)
                return rejected<std::invoke_result_t<std::decay_t<Func>>>();
            return processingThread_->pushPromiseTask(std::forward<Func>(func));
        }

        /**
         * @brief Finalizes without pushing a task, for closing from within the processing thread.
         *
         * @return false if the strand was already finalized.
         */
        bool finalize()
        {
            std::scoped_lock lock(mutex_);
            if (finalized_)
                return false;
            finalized_ = true;
            return true;
        }

        bool withinProcessingThread() const noexcept
        {
            return processingThread_->withinProcessingThread();
        }

        bool isFinalized() const noexcept
        {
            std::scoped_lock lock(mutex_);
            return finalized_;
        }

      private:
        template <typename T>
        static std::future<T> rejected()
        {
            std::promise<T> promise{};
            promise.set_exception(std::make_exception_ptr(std::runtime_error("Cannot push task to finalized strand.")));
            return promise.get_future();
        }

      private:
        mutable std::recursive_mutex mutex_{};
        bool finalized_ = false;
        ProcessingThread* processingThread_{};
    };
}
