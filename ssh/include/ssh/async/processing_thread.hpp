#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>

namespace SecureShell
{
    class ProcessingStrand;

    /**
     * @brief Runs queued tasks one after another on a dedicated thread.
     * Each ssh session owns one, the transfer session uses another to keep transfers off the calling thread.
     */
    class ProcessingThread
    {
      public:
        constexpr static unsigned int maximumTasksProcessableAtOnce = 100;

        ProcessingThread();
        ~ProcessingThread();
        ProcessingThread(ProcessingThread const&) = delete;
        ProcessingThread& operator=(ProcessingThread const&) = delete;
        ProcessingThread(ProcessingThread&&) = delete;
        ProcessingThread& operator=(ProcessingThread&&) = delete;

        /**
         * @param waitCycleTimeout How long an idle thread sleeps before it rechecks for a stop request.
         */
        void start(std::chrono::milliseconds const& waitCycleTimeout = std::chrono::seconds{1});

        /// Drains the queue, then joins.
        void stop();

        bool isRunning() const;

        /// Refused with false once stop() began. Throws std::invalid_argument for an empty function.
        bool pushTask(std::function<void()> task);

        /**
         * @brief Like pushTask, but hands the result or the thrown exception to the returned future.
         * A refused task yields a future holding std::runtime_error.
         */
        template <typename Func>
        auto pushPromiseTask(Func&& func) -> std::future<std::invoke_result_t<std::decay_t<Func>>>
        {
            using ReturnType = std::invoke_result_t<std::decay_t<Func>>;
            auto promise = std::make_shared<std::promise<ReturnType>>();
            auto future = promise->get_future();
            const bool pushed = pushTask([promise, func = std::forward<Func>(func)]() mutable {
                try
                {
                    if constexpr (std::is_void_v<ReturnType>)
                    {
                        func();
                        promise->set_value();
                    }
                    else
                    {
                        promise->set_value(func());
                    }
                }
                catch (...)
                {
                    promise->set_exception(std::current_exception());
                }
            });
            if (!pushed)
            {
                promise->set_exception(
                    std::make_exception_ptr(std::runtime_error("Processing thread is shutting down.")));
            }
            return future;
        }

        /// Blocks until everything queued before this call has run. False on timeout or when not running.
        bool awaitCycle(std::chrono::milliseconds maxWait = std::chrono::seconds{5});

        bool withinProcessingThread() const
        {
            return processingThreadId_ == std::this_thread::get_id();
        }

        std::unique_ptr<ProcessingStrand> createStrand();

      private:
        void run(std::chrono::milliseconds const& waitCycleTimeout);
        void runTask(std::function<void()> const& task);

      private:
        std::thread thread_{};
        mutable std::mutex taskMutex_{};
        std::condition_variable taskCondition_{};
        std::atomic<bool> running_ = false;
        std::atomic<bool> shuttingDown_ = false;
        std::atomic<std::thread::id> processingThreadId_{};
        std::deque<std::function<void()>> tasks_{};
    };
}
