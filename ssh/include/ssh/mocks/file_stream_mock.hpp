#pragma once

#include <ssh/file_stream_interface.hpp>

#include <gmock/gmock.h>

#include <cstddef>
#include <expected>
#include <future>
#include <string_view>

namespace SecureShell::Test
{
    class FileStreamMock : public SecureShell::IFileStream
    {
      public:
        MOCK_METHOD((std::future<std::expected<FileInformation, SftpError>>), stat, (), (override));
        MOCK_METHOD(
            (std::future<std::expected<std::size_t, SftpError>>),
            readSome,
            (char* buffer, std::size_t bufferSize),
            (override));
        MOCK_METHOD((std::future<std::expected<void, SftpError>>), write, (std::string_view data), (override));
        MOCK_METHOD(std::size_t, writeLengthLimit, (), (const, override));
        MOCK_METHOD(std::size_t, readLengthLimit, (), (const, override));
        MOCK_METHOD((std::future<std::expected<void, SftpError>>), close, (), (override));
        MOCK_METHOD(ProcessingStrand*, strand, (), (const, override));
    };
}
