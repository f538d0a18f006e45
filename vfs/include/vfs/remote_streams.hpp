#pragma once

#include <vfs/backend.hpp>
#include <ssh/file_stream_interface.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace Vfs
{
    /**
     * @brief Reads an sftp file. Reads at most the server read limit per call.
     */
    class RemoteReadStream : public ReadStream
    {
      public:
        RemoteReadStream(
            std::weak_ptr<SecureShell::IFileStream> stream,
            std::filesystem::path path,
            std::chrono::milliseconds timeout);
        ~RemoteReadStream() override;
        RemoteReadStream(RemoteReadStream const&) = delete;
        RemoteReadStream& operator=(RemoteReadStream const&) = delete;
        RemoteReadStream(RemoteReadStream&&) = delete;
        RemoteReadStream& operator=(RemoteReadStream&&) = delete;

        std::expected<std::size_t, Error> read(char* buffer, std::size_t bufferSize) override;

      private:
        std::weak_ptr<SecureShell::IFileStream> stream_;
        std::filesystem::path path_;
        std::chrono::milliseconds timeout_;
        // The sftp call writes into this, so a timed out read cannot write into the caller's memory.
        std::vector<char> buffer_;
        // Set when an operation timed out or the session went away. The close is not attempted then.
        bool stalled_;
    };

    class RemoteWriteStream : public WriteStream
    {
      public:
        RemoteWriteStream(
            std::weak_ptr<SecureShell::IFileStream> stream,
            std::filesystem::path path,
            std::chrono::milliseconds timeout);
        ~RemoteWriteStream() override;
        RemoteWriteStream(RemoteWriteStream const&) = delete;
        RemoteWriteStream& operator=(RemoteWriteStream const&) = delete;
        RemoteWriteStream(RemoteWriteStream&&) = delete;
        RemoteWriteStream& operator=(RemoteWriteStream&&) = delete;

        std::expected<void, Error> write(std::string_view data) override;
        std::expected<void, Error> close() override;

      private:
        std::weak_ptr<SecureShell::IFileStream> stream_;
        std::filesystem::path path_;
        std::chrono::milliseconds timeout_;
        std::string pending_;
        bool closed_;
        bool stalled_;
    };
}
