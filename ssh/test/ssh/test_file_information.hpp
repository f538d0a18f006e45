#pragma once

#include <ssh/file_information.hpp>
#include <ssh/sequential.hpp>
#include <ssh/sftp_error.hpp>

#include <gtest/gtest.h>

#include <cstring>

namespace SecureShell::Test
{
    class FileInformationTest : public ::testing::Test
    {
      protected:
        void SetUp() override
        {
            std::memset(&attributes_, 0, sizeof(attributes_));
            attributes_.name = name_;
        }

      protected:
        char name_[16] = "report.txt";
        sftp_attributes_struct attributes_{};
    };

    TEST_F(FileInformationTest, MapsSftpFileTypes)
    {
        EXPECT_EQ(fileTypeFromSftp(SSH_FILEXFER_TYPE_REGULAR), SharedData::FileType::Regular);
        EXPECT_EQ(fileTypeFromSftp(SSH_FILEXFER_TYPE_DIRECTORY), SharedData::FileType::Directory);
        EXPECT_EQ(fileTypeFromSftp(SSH_FILEXFER_TYPE_SYMLINK), SharedData::FileType::Symlink);
        EXPECT_EQ(fileTypeFromSftp(SSH_FILEXFER_TYPE_SPECIAL), SharedData::FileType::Special);
        EXPECT_EQ(fileTypeFromSftp(SSH_FILEXFER_TYPE_UNKNOWN), SharedData::FileType::Unknown);
    }

    TEST_F(FileInformationTest, ConvertsAttributes)
    {
        attributes_.type = SSH_FILEXFER_TYPE_REGULAR;
        attributes_.size = 3000;
        attributes_.permissions = 0100644;

        const auto info = fromSftpAttributes(&attributes_);
        EXPECT_EQ(info.path, std::filesystem::path{"report.txt"});
        EXPECT_TRUE(info.isRegularFile());
        EXPECT_EQ(info.size, 3000u);
        EXPECT_EQ(
            info.permissions,
            std::filesystem::perms::owner_read | std::filesystem::perms::owner_write |
                std::filesystem::perms::group_read | std::filesystem::perms::others_read);
        EXPECT_FALSE(info.mtime.has_value());
    }

    TEST_F(FileInformationTest, TakesModificationTimeOnlyWhenPresent)
    {
        attributes_.type = SSH_FILEXFER_TYPE_DIRECTORY;
        attributes_.flags = SSH_FILEXFER_ATTR_ACMODTIME;
        attributes_.mtime = 1700000000;

        const auto info = fromSftpAttributes(&attributes_);
        EXPECT_TRUE(info.isDirectory());
        ASSERT_TRUE(info.mtime.has_value());
        EXPECT_EQ(*info.mtime, 1700000000u);
    }

    TEST(SequentialTest, StopsAtFirstFailure)
    {
        int calls = 0;
        const auto result = Detail::sequential(
            [&] {
                ++calls;
                return 0;
            },
            [&] {
                ++calls;
                return -1;
            },
            [&] {
                ++calls;
                return 0;
            });
        EXPECT_FALSE(result.success());
        EXPECT_EQ(result.index, 2);
        EXPECT_EQ(result.total, 3);
        EXPECT_EQ(calls, 2);
    }

    TEST(SequentialTest, RunsAllOnSuccess)
    {
        const auto result = Detail::sequential(
            [] {
                return 0;
            },
            [] {
                return 0;
            });
        EXPECT_TRUE(result.success());
        EXPECT_TRUE(result.reachedEnd());
    }

    TEST(SftpErrorTest, WrapperErrorsAreDistinguishable)
    {
        const auto error = SftpError::fromWrapper(WrapperErrors::SessionClosed, "closed");
        EXPECT_TRUE(error.raisedByWrapper());
        EXPECT_EQ(error.toString(), "closed (SessionClosed)");

        const SftpError serverError{.message = "denied", .sshError = 0, .sftpError = SSH_FX_PERMISSION_DENIED};
        EXPECT_FALSE(serverError.raisedByWrapper());
        EXPECT_EQ(serverError.toString(), "denied (ssh error 0, sftp status 3)");
    }
}
