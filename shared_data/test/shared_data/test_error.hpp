#pragma once

#include <shared_data/error.hpp>

#include <gtest/gtest.h>

namespace SharedData::Test
{
    TEST(ErrorTests, OperatingSystemErrorsMapToKinds)
    {
        using enum ErrorKind;

        EXPECT_EQ(errorKindFromErrorCode(std::make_error_code(std::errc::no_such_file_or_directory)), NotFound);
        EXPECT_EQ(errorKindFromErrorCode(std::make_error_code(std::errc::permission_denied)), PermissionDenied);
        EXPECT_EQ(errorKindFromErrorCode(std::make_error_code(std::errc::read_only_file_system)), PermissionDenied);
        EXPECT_EQ(errorKindFromErrorCode(std::make_error_code(std::errc::file_exists)), AlreadyExists);
        EXPECT_EQ(errorKindFromErrorCode(std::make_error_code(std::errc::directory_not_empty)), NotEmpty);
        EXPECT_EQ(errorKindFromErrorCode(std::make_error_code(std::errc::cross_device_link)), CrossDevice);
        EXPECT_EQ(errorKindFromErrorCode(std::make_error_code(std::errc::no_space_on_device)), Unknown);
    }

    TEST(ErrorTests, ErrorFromErrorCodeKeepsWhatWasAttempted)
    {
        const auto error =
            errorFromErrorCode(std::make_error_code(std::errc::permission_denied), "Cannot open '/root/x'");
        EXPECT_EQ(error.kind, ErrorKind::PermissionDenied);
        EXPECT_NE(error.message.find("Cannot open '/root/x'"), std::string::npos);
        EXPECT_FALSE(error.sftpError.has_value());
    }

    TEST(ErrorTests, ToStringNamesTheKind)
    {
        EXPECT_EQ(makeError(ErrorKind::NotEmpty, "").toString(), "NotEmpty");
        EXPECT_EQ(makeError(ErrorKind::Busy, "In use").toString(), "Busy: In use.");
    }

    TEST(ErrorTests, CanBeSerialized)
    {
        const auto error = makeError(ErrorKind::InvalidName, "'a/b' is not a valid name");
        const nlohmann::json j = error;
        EXPECT_EQ(j["kind"], "InvalidName");

        const auto back = j.get<Error>();
        EXPECT_EQ(back.kind, ErrorKind::InvalidName);
        EXPECT_EQ(back.message, error.message);
    }
}
