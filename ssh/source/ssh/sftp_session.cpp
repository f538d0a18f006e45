#include <ssh/sftp_session.hpp>
#include <ssh/session.hpp>
#include <log/log.hpp>

#include <algorithm>
#include <cstdlib>
#include <functional>

namespace SecureShell
{
    SftpSession::SftpSession(Session* owner, std::unique_ptr<ProcessingStrand> strand, sftp_session session)
        : owner_{owner}
        , strand_{std::move(strand)}
        , session_{session}
        , fileStreams_{}
    {}
    SftpSession::~SftpSession()
    {
        if (session_ != nullptr)
            Log::warn("SftpSession: Destroyed without being closed.");
    }
    bool SftpSession::close()
    {
        if (strand_->isFinalized())
            return false;

        if (strand_->withinProcessingThread())
        {
            if (!strand_->finalize())
                return false;
            closeWithinStrand();
            return true;
        }

        try
        {
            return strand_
                ->pushFinalPromiseTask([self = shared_from_this()]() {
                    self->closeWithinStrand();
                    return true;
                })
                .get();
        }
        catch (std::exception const& exc)
        {
            Log::warn("SftpSession: Close failed: {}", exc.what());
            return false;
        }
    }
    void SftpSession::closeWithinStrand()
    {
        removeAllFileStreams();
        if (session_ != nullptr)
        {
            sftp_free(session_);
            session_ = nullptr;
        }
        owner_->sftpSessionRemoveItself(this);
    }
    void SftpSession::fileStreamRemoveItself(FileStream* stream)
    {
        fileStreams_.erase(
            std::remove_if(
                fileStreams_.begin(),
                fileStreams_.end(),
                [stream](auto const& item) {
                    return item.get() == stream;
                }),
            fileStreams_.end());
    }
    void SftpSession::removeAllFileStreams()
    {
        while (!fileStreams_.empty())
        {
            // Keeps the stream alive until close returns, it removes itself from the vector.
            auto stream = fileStreams_.back();
            // Failures are logged by the stream, the session is going away regardless.
            [[maybe_unused]] const auto closed = stream->closeWithinStrand(*this);
        }
    }

    std::future<std::expected<std::vector<FileInformation>, SftpSession::Error>>
    SftpSession::listDirectory(std::filesystem::path const& path)
    {
        return performPromise([this, path]() -> std::expected<std::vector<FileInformation>, Error> {
            int closeResult = SSH_OK;
            std::vector<FileInformation> entries{};

            {
                std::unique_ptr<sftp_dir_struct, std::function<void(sftp_dir_struct*)>> dir{
                    sftp_opendir(session_, path.generic_string().c_str()), [&](sftp_dir_struct* dir) {
                        if (dir != nullptr)
                            closeResult = sftp_closedir(dir);
                    }};
                if (dir == nullptr)
                    return std::unexpected(lastError());

                {
                    std::unique_ptr<sftp_attributes_struct, decltype(&sftp_attributes_free)> entry{
                        sftp_readdir(session_, dir.get()), sftp_attributes_free};

                    for (; entry != nullptr; entry.reset(sftp_readdir(session_, dir.get())))
                    {
                        auto info = fromSftpAttributes(entry.get());
                        if (info.path == "." || info.path == "..")
                            continue;
                        entries.push_back(std::move(info));
                    }
                }

                if (!sftp_dir_eof(dir.get()))
                    return std::unexpected(lastError());
            }
            if (closeResult != SSH_OK)
            {
                auto error = lastError();
                error.sshError = closeResult;
                return std::unexpected(std::move(error));
            }

            return entries;
        });
    }
    std::future<std::expected<void, SftpSession::Error>>
    SftpSession::createDirectory(std::filesystem::path const& path, std::filesystem::perms permissions)
    {
        return performPromise([this, path, permissions]() -> std::expected<void, Error> {
            auto result = sftp_mkdir(
                session_,
                path.generic_string().c_str(),
                static_cast<mode_t>(permissions & std::filesystem::perms::mask));
            if (result != SSH_OK)
                return std::unexpected(lastError());
            return {};
        });
    }

    std::future<std::expected<void, SftpSession::Error>> SftpSession::removeFile(std::filesystem::path const& path)
    {
        return performPromise([this, path]() -> std::expected<void, Error> {
            auto result = sftp_unlink(session_, path.generic_string().c_str());
            if (result != SSH_OK)
                return std::unexpected(lastError());
            return {};
        });
    }

    std::future<std::expected<void, SftpSession::Error>> SftpSession::removeDirectory(std::filesystem::path const& path)
    {
        return performPromise([this, path]() -> std::expected<void, Error> {
            auto result = sftp_rmdir(session_, path.generic_string().c_str());
            if (result != SSH_OK)
                return std::unexpected(lastError());
            return {};
        });
    }

    std::future<std::expected<FileInformation, SftpSession::Error>>
    SftpSession::stat(std::filesystem::path const& path)
    {
        return performPromise([this, path]() -> std::expected<FileInformation, Error> {
            return describe(sftp_stat(session_, path.generic_string().c_str()), path);
        });
    }

    std::future<std::expected<FileInformation, SftpSession::Error>>
    SftpSession::lstat(std::filesystem::path const& path)
    {
        return performPromise([this, path]() -> std::expected<FileInformation, Error> {
            return describe(sftp_lstat(session_, path.generic_string().c_str()), path);
        });
    }

    std::expected<FileInformation, SftpSession::Error>
    SftpSession::describe(sftp_attributes rawAttributes, std::filesystem::path const& path) const
    {
        std::unique_ptr<sftp_attributes_struct, decltype(&sftp_attributes_free)> attributes{
            rawAttributes, sftp_attributes_free};
        if (attributes == nullptr)
            return std::unexpected(lastError());

        auto info = fromSftpAttributes(attributes.get());
        info.path = path;
        return info;
    }

    std::future<std::expected<void, SftpSession::Error>>
    SftpSession::rename(std::filesystem::path const& source, std::filesystem::path const& destination)
    {
        return performPromise([this, source, destination]() -> std::expected<void, Error> {
            const auto s = source.generic_string();
            const auto d = destination.generic_string();

            auto result = sftp_rename(session_, s.c_str(), d.c_str());
            if (result != SSH_OK)
                return std::unexpected(lastError());
            return {};
        });
    }

    std::future<std::expected<std::filesystem::path, SftpSession::Error>>
    SftpSession::canonicalize(std::filesystem::path const& path)
    {
        return performPromise([this, path]() -> std::expected<std::filesystem::path, Error> {
            std::unique_ptr<char, decltype(&ssh_string_free_char)> resolved{
                sftp_canonicalize_path(session_, path.generic_string().c_str()), ssh_string_free_char};
            if (resolved == nullptr)
                return std::unexpected(lastError());
            return std::filesystem::path{resolved.get()};
        });
    }

    SftpError SftpSession::lastError() const
    {
        if (session_ == nullptr)
            return SftpError::fromWrapper(WrapperErrors::SessionClosed, "Sftp session is closed");
        return SftpError::fromLibrary(session_->session, session_);
    }

    std::future<std::expected<std::weak_ptr<FileStream>, SftpSession::Error>>
    SftpSession::openFile(std::filesystem::path const& path, int openFlags, std::filesystem::perms permissions)
    {
        return performPromise(
            [this, path, openFlags, permissions]() -> std::expected<std::weak_ptr<FileStream>, Error> {
                std::unique_ptr<sftp_file_struct, std::function<void(sftp_file_struct*)>> file{
                    sftp_open(
                        session_,
                        path.generic_string().c_str(),
                        openFlags,
                        static_cast<mode_t>(permissions & std::filesystem::perms::mask)),
                    [](sftp_file_struct* file) {
                        if (file != nullptr)
                            sftp_close(file);
                    }};

                if (!file)
                    return std::unexpected(lastError());

                sftp_limits_t limits = sftp_limits(session_);
                if (limits == nullptr)
                    return std::unexpected(lastError());
                const sftp_limits_struct limitsCopy = *limits;
                sftp_limits_free(limits);

                auto stream = std::make_shared<FileStream>(shared_from_this(), file.release(), limitsCopy);
                fileStreams_.push_back(stream);

                return std::weak_ptr<FileStream>{stream};
            });
    }
}
