#pragma once

#include <shared_data/file_operations/transfer_result.hpp>
#include <shared_data/file_operations/conflict.hpp>

#include <gtest/gtest.h>

namespace SharedData::Test
{
    TEST(TransferResultTests, FailuresKeepKindAndMessage)
    {
        TransferResult result{};
        result.addFailure("a.txt", makeError(ErrorKind::PermissionDenied, "Cannot write '/b/a.txt'"));

        ASSERT_EQ(result.failures.size(), 1u);
        EXPECT_EQ(result.failures[0].displayName, "a.txt");
        EXPECT_EQ(result.failures[0].kind, ErrorKind::PermissionDenied);
        EXPECT_EQ(result.failures[0].errorMessage, "PermissionDenied: Cannot write '/b/a.txt'.");
        EXPECT_FALSE(result.allSucceeded());
    }

    TEST(TransferResultTests, CancelledIsNotASuccess)
    {
        TransferResult result{.successCount = 3, .cancelled = true};
        EXPECT_FALSE(result.allSucceeded());
        result.cancelled = false;
        EXPECT_TRUE(result.allSucceeded());
    }

    TEST(TransferResultTests, SerializesForReports)
    {
        TransferResult result{.successCount = 2, .skippedCount = 1};
        result.addFailure("c", makeError(ErrorKind::NotFound, ""));

        nlohmann::json j;
        to_json(j, result);
        EXPECT_EQ(j["successCount"], 2);
        EXPECT_EQ(j["skippedCount"], 1);
        EXPECT_EQ(j["cancelled"], false);
        ASSERT_EQ(j["failures"].size(), 1u);
        EXPECT_EQ(j["failures"][0]["kind"], "NotFound");
    }

    TEST(ConflictDecisionTests, HelpersSetScope)
    {
        EXPECT_EQ(ConflictDecision::skip().scope, ConflictScope::ThisItemOnly);
        EXPECT_EQ(ConflictDecision::skipAll().scope, ConflictScope::AllRemaining);
        EXPECT_EQ(ConflictDecision::replaceAll().action, ConflictAction::Replace);
        EXPECT_EQ(ConflictDecision::cancel().action, ConflictAction::Cancel);
    }
}
