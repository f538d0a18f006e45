#include <ssh/async/processing_thread.hpp>
#include <ssh/async/processing_strand.hpp>
#include <log/log.hpp>

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <vector>

namespace SecureShell
{
    ProcessingThread::ProcessingThread()
    {}
    ProcessingThread::~ProcessingThread()
    {
        stop();
    }
    bool ProcessingThread::isRunning() const
    {
        return running_;
    }
    void ProcessingThread::start(std::chrono::milliseconds const& waitCycleTimeout)
    {
        if (running_)
            return;

        running_ = true;
        shuttingDown_ = false;
        std::promise<void> awaitThreadStart{};
        auto started = awaitThreadStart.get_future();
        thread_ = std::thread([this, &awaitThreadStart, waitCycleTimeout] {
            processingThreadId_.store(std::this_thread::get_id());
            awaitThreadStart.set_value();
            run(waitCycleTimeout);
        });
        started.wait();
    }
    void ProcessingThread::stop()
    {
        shuttingDown_ = true;
        {
            std::lock_guard lock{taskMutex_};
            running_ = false;
        }
        taskCondition_.notify_all();
        if (thread_.joinable())
            thread_.join();

        // execute all pending tasks:
        std::deque<std::function<void()>> remaining{};
        {
            std::lock_guard lock{taskMutex_};
            remaining.swap(tasks_);
        }
        for (auto const& task : remaining)
            runTask(task);

        processingThreadId_.store(std::thread::id{});
        shuttingDown_ = false;
    }
    bool ProcessingThread::pushTask(std::function<void()> task)
    {
        if (!task)
            throw std::invalid_argument("Task must not be empty.");

        if (shuttingDown_)
            return false;

        {
            std::lock_guard lock{taskMutex_};
            tasks_.push_back(std::move(task));
        }
        taskCondition_.notify_one();
        return true;
    }
    std::unique_ptr<ProcessingStrand> ProcessingThread::createStrand()
    {
        return std::make_unique<ProcessingStrand>(this);
    }
    void ProcessingThread::runTask(std::function<void()> const& task)
    {
        try
        {
            task();
        }
        catch (std::exception const& exc)
        {
            Log::error("ProcessingThread: Task threw an exception: {}", exc.what());
        }
    }
    void ProcessingThread::run(std::chrono::milliseconds const& waitCycleTimeout)
    {
        while (running_)
        {
            std::vector<std::function<void()>> tasks{};
            {
                std::unique_lock lock{taskMutex_};
                taskCondition_.wait_for(lock, waitCycleTimeout, [this] {
                    return !tasks_.empty() || !running_;
                });

                const auto count = std::min<std::size_t>(tasks_.size(), maximumTasksProcessableAtOnce);
                tasks.reserve(count);
                std::move(tasks_.begin(), tasks_.begin() + count, std::back_inserter(tasks));
                tasks_.erase(tasks_.begin(), tasks_.begin() + count);
            }

            for (auto const& task : tasks)
                runTask(task);
        }
    }
    bool ProcessingThread::awaitCycle(std::chrono::milliseconds maxWait)
    {
        if (!withinProcessingThread() && running_)
        {
            return pushPromiseTask([]() {
                       return true;
                   }).wait_for(maxWait) == std::future_status::ready;
        }
        return false;
    }
}
