#include <transfer/conflict_policy.hpp>
#include <log/log.hpp>

namespace Transfer
{
    ConflictPolicy::ConflictPolicy(Prompt prompt)
        : prompt_{std::move(prompt)}
        , state_{ConflictPolicyState::Unset}
        , promptCount_{0}
    {}

    SharedData::ConflictAction ConflictPolicy::resolve(SharedData::ConflictQuestion const& question)
    {
        using enum SharedData::ConflictAction;

        switch (state_)
        {
            case ConflictPolicyState::GlobalSkip:
                return Skip;
            case ConflictPolicyState::GlobalReplace:
                return Replace;
            case ConflictPolicyState::Unset:
                break;
        }

        if (!prompt_)
        {
            Log::warn("ConflictPolicy: Nobody to ask about '{}', skipping it.", question.targetPath);
            return Skip;
        }

        ++promptCount_;
        const auto decision = prompt_(question);
        if (decision.scope == SharedData::ConflictScope::AllRemaining)
        {
            if (decision.action == Skip)
                state_ = ConflictPolicyState::GlobalSkip;
            else if (decision.action == Replace)
                state_ = ConflictPolicyState::GlobalReplace;
        }
        return decision.action;
    }
}
