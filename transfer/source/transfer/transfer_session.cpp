#include <transfer/transfer_session.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <vector>

namespace Transfer
{
    TransferSession::TransferSession(ExecutorOptions options)
        : id_{Ids::generateTransferId()}
        , options_{options}
        , token_{std::make_shared<CancellationToken>()}
        , worker_{}
        , started_{false}
    {}

    TransferSession::~TransferSession()
    {
        token_->cancel();
        worker_.stop();
    }

    std::expected<std::future<SharedData::TransferResult>, SharedData::Error>
    TransferSession::start(TransferPlan plan, SharedData::TransferMode mode, TransferCallbacks callbacks)
    {
        using enum SharedData::ErrorKind;

        if (started_)
            return std::unexpected(SharedData::makeError(Busy, "This transfer was already started"));
        if (plan.tasks.empty())
            return std::unexpected(SharedData::makeError(EmptySelection, "Nothing to transfer"));

        std::vector<Vfs::Backend*> backends{};
        for (auto const& task : plan.tasks)
        {
            for (auto* backend : {task.sourceBackend, task.targetBackend})
            {
                if (std::find(backends.begin(), backends.end(), backend) == backends.end())
                    backends.push_back(backend);
            }
        }

        auto leases = std::make_shared<std::vector<Vfs::BackendLease>>();
        for (auto* backend : backends)
        {
            auto lease = backend->tryLease();
            if (!lease)
            {
                Log::warn("TransferSession {}: '{}' is busy with another transfer.", id_.value(), backend->describe());
                return std::unexpected(
                    SharedData::makeError(Busy, fmt::format("'{}' is busy with another transfer", backend->describe())));
            }
            leases->push_back(std::move(*lease));
        }

        started_ = true;
        worker_.start(std::chrono::milliseconds{100});

        Log::info(
            "TransferSession {}: Starting {} of {} items ({} bytes).",
            id_.value(),
            mode == SharedData::TransferMode::Move ? "move" : "copy",
            plan.tasks.size(),
            plan.totalBytes);

        return worker_.pushPromiseTask([id = id_.value(),
                                        options = options_,
                                        token = token_,
                                        leases,
                                        plan = std::move(plan),
                                        mode,
                                        callbacks = std::move(callbacks)]() {
            TransferExecutor executor{options};
            auto result = executor.execute(plan, mode, callbacks, *token);
            leases->clear();
            Log::info("TransferSession {}: Finished.", id);
            return result;
        });
    }

    void TransferSession::cancel()
    {
        Log::info("TransferSession {}: Cancel requested.", id_.value());
        token_->cancel();
    }
}
