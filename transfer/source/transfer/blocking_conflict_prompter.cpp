#include <transfer/blocking_conflict_prompter.hpp>
#include <log/log.hpp>

namespace Transfer
{
    BlockingConflictPrompter::BlockingConflictPrompter(Presenter presenter)
        : presenter_{std::move(presenter)}
        , mutex_{}
        , pending_{std::nullopt}
        , abandoned_{false}
    {}

    SharedData::ConflictDecision BlockingConflictPrompter::ask(SharedData::ConflictQuestion const& question)
    {
        std::future<SharedData::ConflictDecision> future;
        {
            std::lock_guard lock{mutex_};
            if (abandoned_)
                return SharedData::ConflictDecision::cancel();
            if (pending_)
            {
                Log::error("BlockingConflictPrompter: A question is already pending, cancelling.");
                return SharedData::ConflictDecision::cancel();
            }
            pending_.emplace();
            future = pending_->get_future();
        }

        presenter_(question);
        return future.get();
    }

    bool BlockingConflictPrompter::answer(SharedData::ConflictDecision decision)
    {
        std::lock_guard lock{mutex_};
        if (!pending_)
            return false;
        pending_->set_value(decision);
        pending_.reset();
        return true;
    }

    void BlockingConflictPrompter::abandon()
    {
        std::lock_guard lock{mutex_};
        abandoned_ = true;
        if (pending_)
        {
            pending_->set_value(SharedData::ConflictDecision::cancel());
            pending_.reset();
        }
    }

    bool BlockingConflictPrompter::hasPendingQuestion() const
    {
        std::lock_guard lock{mutex_};
        return pending_.has_value();
    }

    ConflictPolicy::Prompt BlockingConflictPrompter::asCallback()
    {
        return [this](SharedData::ConflictQuestion const& question) {
            return ask(question);
        };
    }
}
