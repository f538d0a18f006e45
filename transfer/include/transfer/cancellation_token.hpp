#pragma once

#include <atomic>

namespace Transfer
{
    /**
     * @brief Set once by the user, polled by the worker between tasks and between chunks.
     */
    class CancellationToken
    {
      public:
        CancellationToken() = default;
        CancellationToken(CancellationToken const&) = delete;
        CancellationToken& operator=(CancellationToken const&) = delete;
        CancellationToken(CancellationToken&&) = delete;
        CancellationToken& operator=(CancellationToken&&) = delete;

        void cancel() noexcept
        {
            cancelled_.store(true);
        }

        bool isCancelled() const noexcept
        {
            return cancelled_.load();
        }

      private:
        std::atomic_bool cancelled_{false};
    };
}
