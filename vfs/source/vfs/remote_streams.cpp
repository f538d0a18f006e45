#include <vfs/remote_streams.hpp>
#include <vfs/sftp_error_mapping.hpp>
#include <log/log.hpp>

#include <algorithm>
#include <cstring>

namespace Vfs
{
    namespace
    {
        Error streamGone(std::filesystem::path const& path)
        {
            return SharedData::makeError(
                ErrorKind::ConnectionLost, fmt::format("File '{}' was closed by the session", path.generic_string()));
        }

        Error stalledError(std::filesystem::path const& path)
        {
            return SharedData::makeError(
                ErrorKind::ConnectionLost,
                fmt::format("File '{}' is not closed, an earlier operation did not finish", path.generic_string()));
        }

        /// Waits at most timeout for the close. A close queued behind a hung operation cannot finish either.
        std::expected<void, Error> closeStream(
            std::weak_ptr<SecureShell::IFileStream> const& weakStream,
            std::filesystem::path const& path,
            std::chrono::milliseconds timeout)
        {
            auto stream = weakStream.lock();
            if (!stream)
                return std::unexpected(streamGone(path));
            return awaitSftp(stream->close(), timeout, fmt::format("Cannot close '{}'", path.generic_string()));
        }
    }

    RemoteReadStream::RemoteReadStream(
        std::weak_ptr<SecureShell::IFileStream> stream,
        std::filesystem::path path,
        std::chrono::milliseconds timeout)
        : stream_{std::move(stream)}
        , path_{std::move(path)}
        , timeout_{timeout}
        , buffer_{}
        , stalled_{false}
    {}

    RemoteReadStream::~RemoteReadStream()
    {
        if (stalled_)
        {
            Log::warn("RemoteReadStream: {}", stalledError(path_).toString());
            return;
        }
        if (stream_.expired())
            return;
        if (const auto result = closeStream(stream_, path_, timeout_); !result)
            Log::warn("RemoteReadStream: {}", result.error().toString());
    }

    std::expected<std::size_t, Error> RemoteReadStream::read(char* buffer, std::size_t bufferSize)
    {
        auto stream = stream_.lock();
        if (!stream)
            return std::unexpected(streamGone(path_));

        auto amount = bufferSize;
        if (const auto limit = stream->readLengthLimit(); limit > 0)
            amount = std::min(amount, limit);
        if (buffer_.size() < amount)
            buffer_.resize(amount);

        auto result = awaitSftp(
            stream->readSome(buffer_.data(), amount), timeout_, fmt::format("Cannot read '{}'", path_.generic_string()));
        if (!result)
        {
            stalled_ = result.error().kind == ErrorKind::ConnectionLost;
            return std::unexpected(std::move(result).error());
        }

        std::memcpy(buffer, buffer_.data(), *result);
        return *result;
    }

    RemoteWriteStream::RemoteWriteStream(
        std::weak_ptr<SecureShell::IFileStream> stream,
        std::filesystem::path path,
        std::chrono::milliseconds timeout)
        : stream_{std::move(stream)}
        , path_{std::move(path)}
        , timeout_{timeout}
        , pending_{}
        , closed_{false}
        , stalled_{false}
    {}

    RemoteWriteStream::~RemoteWriteStream()
    {
        if (!closed_)
        {
            if (const auto result = close(); !result)
                Log::warn("RemoteWriteStream: {}", result.error().toString());
        }
    }

    std::expected<void, Error> RemoteWriteStream::write(std::string_view data)
    {
        if (closed_)
            return std::unexpected(SharedData::makeError(
                ErrorKind::Unknown, fmt::format("File '{}' is already closed", path_.generic_string())));

        auto stream = stream_.lock();
        if (!stream)
            return std::unexpected(streamGone(path_));

        pending_.assign(data);
        auto result =
            awaitSftp(stream->write(pending_), timeout_, fmt::format("Cannot write '{}'", path_.generic_string()));
        if (!result)
            stalled_ = result.error().kind == ErrorKind::ConnectionLost;
        return result;
    }

    std::expected<void, Error> RemoteWriteStream::close()
    {
        if (closed_)
            return {};
        closed_ = true;

        if (stalled_)
            return std::unexpected(stalledError(path_));
        return closeStream(stream_, path_, timeout_);
    }
}
