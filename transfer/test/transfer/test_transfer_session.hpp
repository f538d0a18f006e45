#pragma once

#include "transfer_fixture.hpp"

#include <transfer/transfer_session.hpp>
#include <transfer/blocking_conflict_prompter.hpp>
#include <utility/awaiter.hpp>

#include <chrono>

using namespace std::chrono_literals;

namespace Transfer::Test
{
    class TransferSessionTests : public TransferFixture
    {};

    TEST_F(TransferSessionTests, RunsPlanInBackground)
    {
        const auto file = writeFile(sourceRoot() / "a", "a");
        TransferSession session{};

        auto future = session.start(plan({file}), SharedData::TransferMode::Copy, {});
        ASSERT_TRUE(future.has_value());
        ASSERT_EQ(future->wait_for(5s), std::future_status::ready);

        const auto result = future->get();
        EXPECT_EQ(result.successCount, 1);
        EXPECT_TRUE(std::filesystem::exists(targetRoot() / "a"));
        EXPECT_FALSE(local_.isLeased());
    }

    TEST_F(TransferSessionTests, EverySessionHasItsOwnId)
    {
        TransferSession first{};
        TransferSession second{};
        EXPECT_TRUE(first.id().isValid());
        EXPECT_NE(first.id(), second.id());
        EXPECT_FALSE(Ids::TransferId{}.isValid());
    }

    TEST_F(TransferSessionTests, EmptyPlanIsRejected)
    {
        TransferSession session{};
        const auto future = session.start({}, SharedData::TransferMode::Copy, {});
        ASSERT_FALSE(future.has_value());
        EXPECT_EQ(future.error().kind, SharedData::ErrorKind::EmptySelection);
    }

    TEST_F(TransferSessionTests, LeasedBackendIsBusy)
    {
        const auto file = writeFile(sourceRoot() / "a", "a");
        auto lease = local_.tryLease();
        ASSERT_TRUE(lease.has_value());

        TransferSession session{};
        const auto future = session.start(plan({file}), SharedData::TransferMode::Copy, {});
        ASSERT_FALSE(future.has_value());
        EXPECT_EQ(future.error().kind, SharedData::ErrorKind::Busy);
        EXPECT_FALSE(std::filesystem::exists(targetRoot() / "a"));
    }

    TEST_F(TransferSessionTests, SecondTransferOnSameBackendIsBusyUntilFirstIsDone)
    {
        const auto first = writeFile(sourceRoot() / "a", "a");
        const auto second = writeFile(sourceRoot() / "b", "b");
        writeFile(targetRoot() / "a", "old");

        BlockingConflictPrompter prompter{[](SharedData::ConflictQuestion const&) {}};
        TransferSession running{};
        auto runningFuture = running.start(
            plan({first}), SharedData::TransferMode::Copy, TransferCallbacks{.onConflict = prompter.asCallback()});
        ASSERT_TRUE(runningFuture.has_value());

        // The first transfer is now held by its conflict question.
        for (int i = 0; i != 500 && !prompter.hasPendingQuestion(); ++i)
            std::this_thread::sleep_for(10ms);
        ASSERT_TRUE(prompter.hasPendingQuestion());

        TransferSession blocked{};
        const auto blockedFuture = blocked.start(plan({second}), SharedData::TransferMode::Copy, {});
        ASSERT_FALSE(blockedFuture.has_value());
        EXPECT_EQ(blockedFuture.error().kind, SharedData::ErrorKind::Busy);

        EXPECT_TRUE(prompter.answer(SharedData::ConflictDecision::replace()));
        ASSERT_EQ(runningFuture->wait_for(5s), std::future_status::ready);
        EXPECT_EQ(runningFuture->get().successCount, 1);
        EXPECT_EQ(readFile(targetRoot() / "a"), "a");

        TransferSession later{};
        auto laterFuture = later.start(plan({second}), SharedData::TransferMode::Copy, {});
        ASSERT_TRUE(laterFuture.has_value());
        EXPECT_EQ(laterFuture->get().successCount, 1);
    }

    TEST_F(TransferSessionTests, CannotStartTwice)
    {
        const auto file = writeFile(sourceRoot() / "a", "a");
        TransferSession session{};
        auto future = session.start(plan({file}), SharedData::TransferMode::Copy, {});
        ASSERT_TRUE(future.has_value());
        future->wait();

        const auto again = session.start(plan({file}), SharedData::TransferMode::Copy, {});
        EXPECT_FALSE(again.has_value());
    }

    TEST_F(TransferSessionTests, CancelStopsRunningTransfer)
    {
        std::vector<std::filesystem::path> files{};
        for (int i = 0; i != 5; ++i)
            files.push_back(writeFile(sourceRoot() / fmt::format("{}.bin", i), 10));

        TransferSession session{};
        Awaiter firstDone{};
        std::promise<void> release{};
        auto released = release.get_future().share();

        auto future = session.start(
            plan(files),
            SharedData::TransferMode::Copy,
            TransferCallbacks{
                .onProgress =
                    [&firstDone, released, reported = false](SharedData::TransferProgress const&) mutable {
                        if (reported)
                            return;
                        reported = true;
                        firstDone.arrive();
                        released.wait();
                    },
            });
        ASSERT_TRUE(future.has_value());
        ASSERT_TRUE(firstDone.waitFor(5s));

        session.cancel();
        EXPECT_TRUE(session.token().isCancelled());
        release.set_value();

        const auto result = future->get();
        EXPECT_TRUE(result.cancelled);
        EXPECT_EQ(result.successCount, 1);
        EXPECT_FALSE(std::filesystem::exists(targetRoot() / "4.bin"));
    }

    class BlockingConflictPrompterTests : public ::testing::Test
    {};

    TEST_F(BlockingConflictPrompterTests, AnswerIsReturnedToAskingThread)
    {
        Awaiter presented{};
        BlockingConflictPrompter prompter{[&presented](SharedData::ConflictQuestion const&) {
            presented.arrive();
        }};

        auto asking = std::async(std::launch::async, [&prompter]() {
            return prompter.ask(SharedData::ConflictQuestion{.displayName = "a"});
        });
        ASSERT_TRUE(presented.waitFor(5s));
        EXPECT_TRUE(prompter.answer(SharedData::ConflictDecision::replaceAll()));

        const auto decision = asking.get();
        EXPECT_EQ(decision.action, SharedData::ConflictAction::Replace);
        EXPECT_EQ(decision.scope, SharedData::ConflictScope::AllRemaining);
        EXPECT_FALSE(prompter.hasPendingQuestion());
    }

    TEST_F(BlockingConflictPrompterTests, AnswerWithoutQuestionIsIgnored)
    {
        BlockingConflictPrompter prompter{[](SharedData::ConflictQuestion const&) {}};
        EXPECT_FALSE(prompter.answer(SharedData::ConflictDecision::skip()));
    }

    TEST_F(BlockingConflictPrompterTests, AbandonCancelsPendingAndFutureQuestions)
    {
        Awaiter presented{};
        BlockingConflictPrompter prompter{[&presented](SharedData::ConflictQuestion const&) {
            presented.arrive();
        }};

        auto asking = std::async(std::launch::async, [&prompter]() {
            return prompter.ask(SharedData::ConflictQuestion{.displayName = "a"});
        });
        ASSERT_TRUE(presented.waitFor(5s));
        prompter.abandon();

        EXPECT_EQ(asking.get().action, SharedData::ConflictAction::Cancel);
        EXPECT_EQ(prompter.ask(SharedData::ConflictQuestion{}).action, SharedData::ConflictAction::Cancel);
    }
}
