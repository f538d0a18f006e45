#pragma once

#include <transfer/conflict_policy.hpp>

#include <gtest/gtest.h>

#include <queue>

namespace Transfer::Test
{
    class ConflictPolicyTests : public ::testing::Test
    {
      protected:
        ConflictPolicy::Prompt answering()
        {
            return [this](SharedData::ConflictQuestion const& question) {
                asked_.push_back(question.displayName);
                auto decision = answers_.front();
                answers_.pop();
                return decision;
            };
        }

        static SharedData::ConflictQuestion question(std::string const& name)
        {
            return SharedData::ConflictQuestion{.displayName = name, .sourcePath = "/a/" + name, .targetPath = "/b/" + name};
        }

      protected:
        std::queue<SharedData::ConflictDecision> answers_{};
        std::vector<std::string> asked_{};
    };

    TEST_F(ConflictPolicyTests, SingleAnswersAreAskedEveryTime)
    {
        answers_.push(SharedData::ConflictDecision::skip());
        answers_.push(SharedData::ConflictDecision::replace());
        ConflictPolicy policy{answering()};

        EXPECT_EQ(policy.resolve(question("1")), SharedData::ConflictAction::Skip);
        EXPECT_EQ(policy.resolve(question("2")), SharedData::ConflictAction::Replace);
        EXPECT_EQ(policy.promptCount(), 2);
        EXPECT_EQ(policy.state(), ConflictPolicyState::Unset);
    }

    TEST_F(ConflictPolicyTests, ReplaceAllIsRemembered)
    {
        answers_.push(SharedData::ConflictDecision::replaceAll());
        ConflictPolicy policy{answering()};

        EXPECT_EQ(policy.resolve(question("1")), SharedData::ConflictAction::Replace);
        EXPECT_EQ(policy.resolve(question("2")), SharedData::ConflictAction::Replace);
        EXPECT_EQ(policy.resolve(question("3")), SharedData::ConflictAction::Replace);
        EXPECT_EQ(policy.promptCount(), 1);
        EXPECT_EQ(policy.state(), ConflictPolicyState::GlobalReplace);
        EXPECT_EQ(asked_, std::vector<std::string>{"1"});
    }

    TEST_F(ConflictPolicyTests, SkipAllIsRemembered)
    {
        answers_.push(SharedData::ConflictDecision::skipAll());
        ConflictPolicy policy{answering()};

        EXPECT_EQ(policy.resolve(question("1")), SharedData::ConflictAction::Skip);
        EXPECT_EQ(policy.resolve(question("2")), SharedData::ConflictAction::Skip);
        EXPECT_EQ(policy.promptCount(), 1);
        EXPECT_EQ(policy.state(), ConflictPolicyState::GlobalSkip);
    }

    TEST_F(ConflictPolicyTests, CancelIsPassedThrough)
    {
        answers_.push(SharedData::ConflictDecision::cancel());
        ConflictPolicy policy{answering()};

        EXPECT_EQ(policy.resolve(question("1")), SharedData::ConflictAction::Cancel);
        EXPECT_EQ(policy.state(), ConflictPolicyState::Unset);
    }

    TEST_F(ConflictPolicyTests, WithoutPromptEverythingIsSkipped)
    {
        ConflictPolicy policy{{}};
        EXPECT_EQ(policy.resolve(question("1")), SharedData::ConflictAction::Skip);
        EXPECT_EQ(policy.promptCount(), 0);
    }
}
