#pragma once

#include <ssh/file_stream_interface.hpp>
#include <ssh/sftp_error.hpp>
#include <ssh/file_information.hpp>

#include <libssh/sftp.h>

#include <expected>
#include <functional>
#include <future>
#include <memory>

namespace SecureShell
{
    class SftpSession;

    class FileStream
        : public IFileStream
        , public std::enable_shared_from_this<FileStream>
    {
      public:
        FileStream(std::shared_ptr<SftpSession> sftp, sftp_file file, sftp_limits_struct limits);
        ~FileStream() override;
        FileStream(FileStream const&) = delete;
        FileStream& operator=(FileStream const&) = delete;
        FileStream(FileStream&&) = delete;
        FileStream& operator=(FileStream&&) = delete;

        std::future<std::expected<FileInformation, SftpError>> stat() override;
        std::future<std::expected<std::size_t, SftpError>> readSome(char* buffer, std::size_t bufferSize) override;
        std::future<std::expected<void, SftpError>> write(std::string_view data) override;
        std::size_t writeLengthLimit() const override;
        std::size_t readLengthLimit() const override;
        std::future<std::expected<void, SftpError>> close() override;
        ProcessingStrand* strand() const override;

      private:
        friend class SftpSession;

        template <typename FunctionT>
        auto performPromise(FunctionT&& func);

        SftpError lastError() const;

        /**
         * @brief Closes the handle and drops the stream from the session. Must run on the processing thread.
         * The stream may be destroyed when this returns.
         */
        std::expected<void, SftpError> closeWithinStrand(SftpSession& sftp);

      private:
        std::weak_ptr<SftpSession> sftp_;
        sftp_file file_;
        sftp_limits_struct limits_;
    };
}
