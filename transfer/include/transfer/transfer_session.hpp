#pragma once

#include <transfer/cancellation_token.hpp>
#include <transfer/transfer_executor.hpp>
#include <transfer/transfer_plan.hpp>
#include <ssh/async/processing_thread.hpp>
#include <ids/ids.hpp>

#include <expected>
#include <future>
#include <memory>

namespace Transfer
{
    /**
     * @brief Runs one plan on its own worker thread while the caller stays responsive.
     * Both backends are leased for the whole run, a second transfer on the same backend is refused.
     */
    class TransferSession
    {
      public:
        explicit TransferSession(ExecutorOptions options = {});
        ~TransferSession();
        TransferSession(TransferSession const&) = delete;
        TransferSession& operator=(TransferSession const&) = delete;
        TransferSession(TransferSession&&) = delete;
        TransferSession& operator=(TransferSession&&) = delete;

        /**
         * @brief Starts the run. Callbacks are invoked on the worker thread.
         *
         * @return The result once the run is over, or EmptySelection / Busy if it could not be started.
         */
        std::expected<std::future<SharedData::TransferResult>, SharedData::Error>
        start(TransferPlan plan, SharedData::TransferMode mode, TransferCallbacks callbacks);

        /**
         * @brief Requests cancellation. The current chunk is finished first.
         */
        void cancel();

        Ids::TransferId const& id() const
        {
            return id_;
        }

        CancellationToken const& token() const
        {
            return *token_;
        }

      private:
        Ids::TransferId id_;
        ExecutorOptions options_;
        std::shared_ptr<CancellationToken> token_;
        SecureShell::ProcessingThread worker_;
        bool started_;
    };
}
