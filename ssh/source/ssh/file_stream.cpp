#include <ssh/file_stream.hpp>
#include <ssh/sftp_session.hpp>
#include <log/log.hpp>

#include <algorithm>
#include <utility>

namespace SecureShell
{
#define VERIFY_FILE_STREAM() \
    if (file_ == nullptr) \
    return std::unexpected(SftpError::fromWrapper(WrapperErrors::FileNull, "File is null"))

    template <typename FunctionT>
    auto FileStream::performPromise(FunctionT&& func)
    {
        if (auto sftp = sftp_.lock(); sftp)
            return sftp->performPromise(std::forward<FunctionT>(func));

        using ResultType = std::invoke_result_t<std::decay_t<FunctionT>>;
        std::promise<ResultType> promise{};
        promise.set_value(std::unexpected(SftpError::fromWrapper(WrapperErrors::OwnerNull, "Owner is null")));
        return promise.get_future();
    }

    FileStream::FileStream(std::shared_ptr<SftpSession> sftp, sftp_file file, sftp_limits_struct limits)
        : sftp_{std::move(sftp)}
        , file_{file}
        , limits_{limits}
    {}
    FileStream::~FileStream()
    {
        if (file_ == nullptr)
            return;

        // Only reachable when the session is torn down without closing the stream.
        if (auto sftp = sftp_.lock(); sftp && sftp->strand_->withinProcessingThread())
            sftp_close(file_);
        else
            Log::warn("FileStream: Stream destroyed outside of its session, leaking the handle.");
    }
    std::expected<void, SftpError> FileStream::closeWithinStrand(SftpSession& sftp)
    {
        std::expected<void, SftpError> result{};
        if (file_ != nullptr)
        {
            if (sftp_close(file_) != SSH_NO_ERROR)
            {
                result = std::unexpected(sftp.lastError());
                Log::warn("FileStream: Failed to close file: {}", result.error().toString());
            }
            file_ = nullptr;
        }
        sftp.fileStreamRemoveItself(this);
        return result;
    }
    std::future<std::expected<void, SftpError>> FileStream::close()
    {
        auto sftp = sftp_.lock();
        if (sftp && sftp->strand_->withinProcessingThread())
        {
            std::promise<std::expected<void, SftpError>> promise{};
            promise.set_value(closeWithinStrand(*sftp));
            return promise.get_future();
        }

        return performPromise([self = shared_from_this()]() -> std::expected<void, SftpError> {
            auto sftp = self->sftp_.lock();
            if (!sftp)
                return std::unexpected(
                    SftpError::fromWrapper(WrapperErrors::SharedPtrDestroyed, "Sftp session already destroyed"));
            return self->closeWithinStrand(*sftp);
        });
    }
    std::future<std::expected<FileInformation, SftpError>> FileStream::stat()
    {
        return performPromise([this]() -> std::expected<FileInformation, SftpError> {
            VERIFY_FILE_STREAM();
            std::unique_ptr<sftp_attributes_struct, decltype(&sftp_attributes_free)> attributes{
                sftp_fstat(file_), sftp_attributes_free};
            if (attributes == nullptr)
                return std::unexpected(lastError());
            return fromSftpAttributes(attributes.get());
        });
    }
    SftpError FileStream::lastError() const
    {
        if (auto sftp = sftp_.lock(); sftp)
            return sftp->lastError();
        return SftpError::fromWrapper(WrapperErrors::SharedPtrDestroyed, "Sftp session already destroyed");
    }
    std::future<std::expected<std::size_t, SftpError>> FileStream::readSome(char* buffer, std::size_t bufferSize)
    {
        return performPromise([this, buffer, bufferSize]() -> std::expected<std::size_t, SftpError> {
            VERIFY_FILE_STREAM();
            const auto result = sftp_read(file_, buffer, std::min(bufferSize, readLengthLimit()));
            if (result < 0)
                return std::unexpected(lastError());
            return static_cast<std::size_t>(result);
        });
    }
    std::size_t FileStream::writeLengthLimit() const
    {
        return limits_.max_write_length;
    }
    std::size_t FileStream::readLengthLimit() const
    {
        return limits_.max_read_length;
    }
    ProcessingStrand* FileStream::strand() const
    {
        auto sftp = sftp_.lock();
        return sftp ? sftp->strand_.get() : nullptr;
    }
    std::future<std::expected<void, SftpError>> FileStream::write(std::string_view data)
    {
        return performPromise([this, data]() -> std::expected<void, SftpError> {
            VERIFY_FILE_STREAM();
            auto remaining = data;
            // Split into parts the server accepts:
            while (!remaining.empty())
            {
                const auto written =
                    sftp_write(file_, remaining.data(), std::min(remaining.size(), writeLengthLimit()));
                if (written < 0)
                    return std::unexpected(lastError());
                if (written == 0)
                {
                    return std::unexpected(
                        SftpError::fromWrapper(WrapperErrors::ShortWrite, "Server accepted no data"));
                }
                remaining.remove_prefix(static_cast<std::size_t>(written));
            }
            return {};
        });
    }
}
