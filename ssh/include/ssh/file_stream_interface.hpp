#pragma once

#include <ssh/async/processing_strand.hpp>
#include <ssh/sftp_error.hpp>
#include <ssh/file_information.hpp>

#include <expected>
#include <future>
#include <string_view>

namespace SecureShell
{
    /**
     * @brief An open remote file. Every call is queued on the strand of the owning sftp session and answered
     * through a future.
     */
    class IFileStream
    {
      public:
        virtual ~IFileStream() = default;

        virtual std::future<std::expected<FileInformation, SftpError>> stat() = 0;

        /**
         * @brief Reads at most min(bufferSize, readLengthLimit()) bytes. Zero bytes read means end of file.
         *
         * @param buffer Must outlive the future.
         */
        virtual std::future<std::expected<std::size_t, SftpError>> readSome(char* buffer, std::size_t bufferSize) = 0;

        /**
         * @brief Writes all of data, split into pieces of writeLengthLimit() bytes.
         *
         * @param data Must outlive the future.
         */
        virtual std::future<std::expected<void, SftpError>> write(std::string_view data) = 0;

        // Limits negotiated with the server for a single sftp packet.
        virtual std::size_t writeLengthLimit() const = 0;
        virtual std::size_t readLengthLimit() const = 0;

        /// Closes the handle. The stream is unusable once the future is ready.
        virtual std::future<std::expected<void, SftpError>> close() = 0;

        virtual ProcessingStrand* strand() const = 0;
    };
}
