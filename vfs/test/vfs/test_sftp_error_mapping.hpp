#pragma once

#include <vfs/sftp_error_mapping.hpp>

#include <gtest/gtest.h>

#include <libssh/libssh.h>
#include <libssh/sftp.h>

using namespace std::chrono_literals;

namespace Vfs::Test
{
    class SftpErrorMappingTests : public ::testing::Test
    {
      protected:
        static SecureShell::SftpError sftpStatus(int status)
        {
            return SecureShell::SftpError{.message = "failure", .sshError = SSH_NO_ERROR, .sftpError = status};
        }
    };

    TEST_F(SftpErrorMappingTests, MapsStatusCodes)
    {
        EXPECT_EQ(errorKindFromSftp(sftpStatus(SSH_FX_NO_SUCH_FILE)), ErrorKind::NotFound);
        EXPECT_EQ(errorKindFromSftp(sftpStatus(SSH_FX_NO_SUCH_PATH)), ErrorKind::NotFound);
        EXPECT_EQ(errorKindFromSftp(sftpStatus(SSH_FX_PERMISSION_DENIED)), ErrorKind::PermissionDenied);
        EXPECT_EQ(errorKindFromSftp(sftpStatus(SSH_FX_WRITE_PROTECT)), ErrorKind::PermissionDenied);
        EXPECT_EQ(errorKindFromSftp(sftpStatus(SSH_FX_FILE_ALREADY_EXISTS)), ErrorKind::AlreadyExists);
        EXPECT_EQ(errorKindFromSftp(sftpStatus(SSH_FX_NO_CONNECTION)), ErrorKind::ConnectionLost);
        EXPECT_EQ(errorKindFromSftp(sftpStatus(SSH_FX_CONNECTION_LOST)), ErrorKind::ConnectionLost);
        EXPECT_EQ(errorKindFromSftp(sftpStatus(SSH_FX_FAILURE)), ErrorKind::Unknown);
    }

    TEST_F(SftpErrorMappingTests, FatalSshErrorIsConnectionLost)
    {
        EXPECT_EQ(
            errorKindFromSftp(SecureShell::SftpError{.message = "socket", .sshError = SSH_FATAL}),
            ErrorKind::ConnectionLost);
    }

    TEST_F(SftpErrorMappingTests, ClosedSessionIsConnectionLost)
    {
        EXPECT_EQ(
            errorKindFromSftp(SecureShell::SftpError{.wrapperError = SecureShell::WrapperErrors::SessionClosed}),
            ErrorKind::ConnectionLost);
        EXPECT_EQ(
            errorKindFromSftp(SecureShell::SftpError{.wrapperError = SecureShell::WrapperErrors::ShortWrite}),
            ErrorKind::Unknown);
    }

    TEST_F(SftpErrorMappingTests, ErrorKeepsSftpDetails)
    {
        const auto error = errorFromSftp(sftpStatus(SSH_FX_NO_SUCH_FILE), "Cannot stat '/x'");
        EXPECT_EQ(error.kind, ErrorKind::NotFound);
        EXPECT_EQ(error.message, "Cannot stat '/x'");
        ASSERT_TRUE(error.sftpError.has_value());
        EXPECT_EQ(error.sftpError->sftpError, SSH_FX_NO_SUCH_FILE);
    }

    TEST_F(SftpErrorMappingTests, AwaitTimesOutAsConnectionLost)
    {
        std::promise<std::expected<int, SecureShell::SftpError>> neverFulfilled{};
        const auto result = awaitSftp(neverFulfilled.get_future(), 10ms, "Cannot wait");
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, ErrorKind::ConnectionLost);
    }

    TEST_F(SftpErrorMappingTests, AwaitTurnsExceptionIntoConnectionLost)
    {
        std::promise<std::expected<void, SecureShell::SftpError>> promise{};
        promise.set_exception(std::make_exception_ptr(std::runtime_error("strand finalized")));
        const auto result = awaitSftp(promise.get_future(), 10ms, "Cannot wait");
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, ErrorKind::ConnectionLost);
    }

    TEST_F(SftpErrorMappingTests, AwaitPassesValue)
    {
        std::promise<std::expected<int, SecureShell::SftpError>> promise{};
        promise.set_value(7);
        const auto result = awaitSftp(promise.get_future(), 10ms, "Cannot wait");
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(*result, 7);
    }
}
