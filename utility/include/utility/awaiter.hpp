#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

/**
 * Latch for tests: waiters block until arrive() was called `expected` times.
 */
class Awaiter
{
  public:
    explicit Awaiter(int expected = 1)
        : expected_{expected}
    {}

    bool waitFor(std::chrono::milliseconds timeout = std::chrono::seconds{1})
    {
        std::unique_lock lock{mutex_};
        return arrived_cv_.wait_for(lock, timeout, [this] {
            return arrivals_ >= expected_;
        });
    }

    void wait()
    {
        std::unique_lock lock{mutex_};
        arrived_cv_.wait(lock, [this] {
            return arrivals_ >= expected_;
        });
    }

    void arrive()
    {
        {
            std::scoped_lock lock{mutex_};
            ++arrivals_;
        }
        arrived_cv_.notify_all();
    }

    void reset()
    {
        std::scoped_lock lock{mutex_};
        arrivals_ = 0;
    }

    int arrivals() const
    {
        std::scoped_lock lock{mutex_};
        return arrivals_;
    }

  private:
    int const expected_;
    int arrivals_{0};
    mutable std::mutex mutex_{};
    std::condition_variable arrived_cv_{};
};
