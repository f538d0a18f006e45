#pragma once

#include <shared_data/file_operations/conflict.hpp>
#include <utility/describe.hpp>

#include <functional>

namespace Transfer
{
    BOOST_DEFINE_ENUM_CLASS(ConflictPolicyState, Unset, GlobalSkip, GlobalReplace);

    /**
     * @brief Decides what happens to existing targets during one transfer. Once the user answers for all remaining
     * conflicts, the answer is final and the user is not asked again.
     */
    class ConflictPolicy
    {
      public:
        using Prompt = std::function<SharedData::ConflictDecision(SharedData::ConflictQuestion const&)>;

        /**
         * @param prompt Asks the user, blocking. Without one every conflict is skipped.
         */
        explicit ConflictPolicy(Prompt prompt);

        SharedData::ConflictAction resolve(SharedData::ConflictQuestion const& question);

        ConflictPolicyState state() const
        {
            return state_;
        }

        int promptCount() const
        {
            return promptCount_;
        }

      private:
        Prompt prompt_;
        ConflictPolicyState state_;
        int promptCount_;
    };
}
