#pragma once

#include "transfer_fixture.hpp"

#include <transfer/delete_operation.hpp>

namespace Transfer::Test
{
    class DeleteOperationTests : public TransferFixture
    {
      protected:
        CancellationToken token_{};
    };

    TEST_F(DeleteOperationTests, RemovesFilesAndDirectoryTrees)
    {
        const auto file = writeFile(sourceRoot() / "a.txt", "a");
        writeFile(sourceRoot() / "dir" / "b" / "c.txt", "c");

        const auto result = deleteEntries(local_, {select(file), select(sourceRoot() / "dir")}, token_);

        EXPECT_EQ(result.successCount, 2);
        EXPECT_TRUE(result.allSucceeded());
        EXPECT_FALSE(std::filesystem::exists(file));
        EXPECT_FALSE(std::filesystem::exists(sourceRoot() / "dir"));
    }

    TEST_F(DeleteOperationTests, MissingEntryIsRecordedAndOthersContinue)
    {
        const auto file = writeFile(sourceRoot() / "a.txt", "a");

        const auto result = deleteEntries(local_, {select(sourceRoot() / "missing"), select(file)}, token_);

        EXPECT_EQ(result.successCount, 1);
        ASSERT_EQ(result.failures.size(), 1u);
        EXPECT_EQ(result.failures[0].displayName, "missing");
        EXPECT_EQ(result.failures[0].kind, SharedData::ErrorKind::NotFound);
        EXPECT_FALSE(std::filesystem::exists(file));
    }

    TEST_F(DeleteOperationTests, CancelledTokenRemovesNothing)
    {
        const auto file = writeFile(sourceRoot() / "a.txt", "a");
        token_.cancel();

        const auto result = deleteEntries(local_, {select(file)}, token_);

        EXPECT_TRUE(result.cancelled);
        EXPECT_TRUE(std::filesystem::exists(file));
    }

    TEST_F(DeleteOperationTests, RootIsNeverRemoved)
    {
        const auto result = deleteEntries(local_, {DisplayEntry{.displayName = "/", .sourcePath = "/"}}, token_);
        ASSERT_EQ(result.failures.size(), 1u);
        EXPECT_EQ(result.failures[0].kind, SharedData::ErrorKind::InvalidTarget);
    }
}
