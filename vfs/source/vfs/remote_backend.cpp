#include <vfs/remote_backend.hpp>
#include <vfs/remote_streams.hpp>
#include <vfs/path_resolver.hpp>
#include <vfs/sftp_error_mapping.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

namespace Vfs
{
    namespace
    {
        class RemoteDirectoryListing : public DirectoryListing
        {
          public:
            explicit RemoteDirectoryListing(std::vector<SharedData::DirectoryEntry> entries)
                : entries_{std::move(entries)}
                , index_{0}
            {}

            std::expected<std::optional<SharedData::DirectoryEntry>, Error> next() override
            {
                if (index_ >= entries_.size())
                    return std::nullopt;
                return std::move(entries_[index_++]);
            }

          private:
            std::vector<SharedData::DirectoryEntry> entries_;
            std::size_t index_;
        };
    }

    RemoteBackend::RemoteBackend(
        std::unique_ptr<SecureShell::Session> session,
        std::weak_ptr<SecureShell::SftpSession> sftp,
        std::string description,
        std::chrono::milliseconds operationTimeout)
        : id_{Ids::generateSessionId()}
        , session_{std::move(session)}
        , sftp_{std::move(sftp)}
        , description_{std::move(description)}
        , operationTimeout_{operationTimeout}
        , homeDirectory_{"/"}
    {}

    RemoteBackend::~RemoteBackend()
    {
        if (auto sftp = sftp_.lock(); sftp)
            sftp->close();
        if (session_)
            session_->shutdown();
    }

    std::string RemoteBackend::describe() const
    {
        return description_;
    }

    bool RemoteBackend::sharesStorageWith(Backend const& other) const
    {
        if (other.kind() != BackendKind::Remote)
            return false;
        auto const* remote = dynamic_cast<RemoteBackend const*>(&other);
        return remote != nullptr && remote->id() == id_;
    }

    std::expected<std::shared_ptr<SecureShell::SftpSession>, Error> RemoteBackend::sftp() const
    {
        if (auto sftp = sftp_.lock(); sftp)
            return sftp;
        return std::unexpected(SharedData::makeError(
            ErrorKind::ConnectionLost, fmt::format("Sftp session of {} is closed", description_)));
    }

    std::expected<bool, Error> RemoteBackend::exists(std::filesystem::path const& path)
    {
        const auto entry = stat(path);
        if (entry)
            return true;
        if (entry.error().kind == ErrorKind::NotFound)
            return false;
        return std::unexpected(entry.error());
    }

    std::expected<SharedData::DirectoryEntry, Error> RemoteBackend::stat(std::filesystem::path const& path)
    {
        auto sftp = this->sftp();
        if (!sftp)
            return std::unexpected(std::move(sftp).error());
        return awaitSftp(
            (*sftp)->stat(path), operationTimeout_, fmt::format("Cannot stat '{}'", path.generic_string()));
    }

    std::expected<SharedData::DirectoryEntry, Error> RemoteBackend::lstat(std::filesystem::path const& path)
    {
        auto sftp = this->sftp();
        if (!sftp)
            return std::unexpected(std::move(sftp).error());
        return awaitSftp(
            (*sftp)->lstat(path), operationTimeout_, fmt::format("Cannot lstat '{}'", path.generic_string()));
    }

    std::expected<std::unique_ptr<DirectoryListing>, Error>
    RemoteBackend::listEntries(std::filesystem::path const& path)
    {
        auto sftp = this->sftp();
        if (!sftp)
            return std::unexpected(std::move(sftp).error());

        auto entries = awaitSftp(
            (*sftp)->listDirectory(path), operationTimeout_, fmt::format("Cannot list '{}'", path.generic_string()));
        if (!entries)
        {
            if (entries.error().kind == ErrorKind::Unknown)
            {
                // Servers answer a generic failure for files.
                if (auto entry = stat(path); entry && !entry->isDirectory())
                {
                    return std::unexpected(SharedData::makeError(
                        ErrorKind::NotADirectory, fmt::format("'{}' is not a directory", path.generic_string())));
                }
            }
            return std::unexpected(std::move(entries).error());
        }
        return std::make_unique<RemoteDirectoryListing>(std::move(entries).value());
    }

    std::expected<std::unique_ptr<ReadStream>, Error> RemoteBackend::openRead(std::filesystem::path const& path)
    {
        auto entry = stat(path);
        if (!entry)
            return std::unexpected(std::move(entry).error());
        if (entry->isDirectory())
            return std::unexpected(SharedData::makeError(
                ErrorKind::IsADirectory, fmt::format("Cannot read directory '{}'", path.generic_string())));

        auto sftp = this->sftp();
        if (!sftp)
            return std::unexpected(std::move(sftp).error());

        auto stream = awaitSftp(
            (*sftp)->openFile(path, static_cast<int>(SecureShell::SftpSession::OpenType::Read), {}),
            operationTimeout_,
            fmt::format("Cannot open '{}'", path.generic_string()));
        if (!stream)
            return std::unexpected(std::move(stream).error());
        return std::make_unique<RemoteReadStream>(std::move(stream).value(), path, operationTimeout_);
    }

    std::expected<std::unique_ptr<WriteStream>, Error> RemoteBackend::openWrite(std::filesystem::path const& path)
    {
        if (isDirectory(path))
            return std::unexpected(SharedData::makeError(
                ErrorKind::IsADirectory, fmt::format("'{}' is a directory", path.generic_string())));

        auto sftp = this->sftp();
        if (!sftp)
            return std::unexpected(std::move(sftp).error());

        using enum SecureShell::SftpSession::OpenType;
        using std::filesystem::perms;
        auto stream = awaitSftp(
            (*sftp)->openFile(
                path,
                (Write | Create) | static_cast<int>(Truncate),
                perms::owner_read | perms::owner_write | perms::group_read | perms::others_read),
            operationTimeout_,
            fmt::format("Cannot open '{}' for writing", path.generic_string()));
        if (!stream)
            return std::unexpected(std::move(stream).error());
        return std::make_unique<RemoteWriteStream>(std::move(stream).value(), path, operationTimeout_);
    }

    std::expected<void, Error> RemoteBackend::createDirectory(std::filesystem::path const& path)
    {
        auto sftp = this->sftp();
        if (!sftp)
            return std::unexpected(std::move(sftp).error());

        auto result = awaitSftp(
            (*sftp)->createDirectory(path),
            operationTimeout_,
            fmt::format("Cannot create directory '{}'", path.generic_string()));
        if (!result && result.error().kind == ErrorKind::Unknown)
        {
            // OpenSSH reports an existing directory as a generic failure.
            if (auto existing = exists(path); existing && *existing)
                return std::unexpected(SharedData::makeError(
                    ErrorKind::AlreadyExists, fmt::format("'{}' already exists", path.generic_string())));
        }
        return result;
    }

    std::expected<void, Error> RemoteBackend::removeFile(std::filesystem::path const& path)
    {
        auto sftp = this->sftp();
        if (!sftp)
            return std::unexpected(std::move(sftp).error());
        return awaitSftp(
            (*sftp)->removeFile(path), operationTimeout_, fmt::format("Cannot remove '{}'", path.generic_string()));
    }

    std::expected<void, Error> RemoteBackend::removeEmptyDirectory(std::filesystem::path const& path)
    {
        auto listing = listEntries(path);
        if (!listing)
            return std::unexpected(std::move(listing).error());
        auto first = (*listing)->next();
        if (!first)
            return std::unexpected(std::move(first).error());
        if (first->has_value())
            return std::unexpected(SharedData::makeError(
                ErrorKind::NotEmpty, fmt::format("'{}' is not empty", path.generic_string())));

        auto sftp = this->sftp();
        if (!sftp)
            return std::unexpected(std::move(sftp).error());
        return awaitSftp(
            (*sftp)->removeDirectory(path),
            operationTimeout_,
            fmt::format("Cannot remove directory '{}'", path.generic_string()));
    }

    std::expected<void, Error>
    RemoteBackend::rename(std::filesystem::path const& source, std::filesystem::path const& destination)
    {
        const auto targetExists = exists(destination);
        if (!targetExists)
            return std::unexpected(targetExists.error());
        if (*targetExists)
            return std::unexpected(SharedData::makeError(
                ErrorKind::AlreadyExists, fmt::format("'{}' already exists", destination.generic_string())));

        auto sftp = this->sftp();
        if (!sftp)
            return std::unexpected(std::move(sftp).error());
        return awaitSftp(
            (*sftp)->rename(source, destination),
            operationTimeout_,
            fmt::format("Cannot move '{}' to '{}'", source.generic_string(), destination.generic_string()));
    }

    std::filesystem::path RemoteBackend::join(std::filesystem::path const& directory, std::string const& name) const
    {
        return joinRemotePath(directory, name);
    }

    std::filesystem::path RemoteBackend::normalize(std::string const& address, std::filesystem::path const& base) const
    {
        return normalizeRemotePath(address, base);
    }

    std::expected<std::filesystem::path, Error> RemoteBackend::canonicalize(std::filesystem::path const& path)
    {
        auto sftp = this->sftp();
        if (!sftp)
            return std::unexpected(std::move(sftp).error());
        return awaitSftp(
            (*sftp)->canonicalize(path),
            operationTimeout_,
            fmt::format("Cannot resolve '{}'", path.generic_string()));
    }

    std::expected<std::unique_ptr<RemoteBackend>, Error> connectRemote(
        Persistence::SshSessionOptions const& options,
        std::chrono::milliseconds operationTimeout,
        SecureShell::AskPassCallback askPass,
        void* askPassUserData)
    {
        const auto description = fmt::format(
            "sftp://{}{}:{}",
            options.user ? (options.user.value() + "@") : std::string{},
            options.host,
            options.port.value_or(22));

        Log::info("RemoteBackend: Connecting to {}.", description);
        auto session = SecureShell::makeSession(options, askPass, askPassUserData);
        if (!session)
        {
            Log::error("RemoteBackend: {}", session.error());
            return std::unexpected(SharedData::makeError(ErrorKind::ConnectionLost, session.error()));
        }
        (*session)->start();

        auto sftp = awaitSftp(
            (*session)->createSftpSession(),
            operationTimeout,
            fmt::format("Cannot open sftp subsystem on {}", description));
        if (!sftp)
        {
            Log::error("RemoteBackend: {}", sftp.error().toString());
            (*session)->shutdown();
            return std::unexpected(std::move(sftp).error());
        }

        auto backend = std::make_unique<RemoteBackend>(
            std::move(session).value(), std::move(sftp).value(), description, operationTimeout);

        auto home = backend->canonicalize(".");
        if (!home)
            return std::unexpected(std::move(home).error());

        backend->homeDirectory_ = *home;
        if (options.defaultDirectory)
            backend->homeDirectory_ = normalizeRemotePath(options.defaultDirectory.value(), *home);

        auto start = backend->stat(backend->homeDirectory_);
        if (!start)
            return std::unexpected(std::move(start).error());
        if (!start->isDirectory())
        {
            return std::unexpected(SharedData::makeError(
                ErrorKind::NotADirectory,
                fmt::format("Start directory '{}' is not a directory", backend->homeDirectory_.generic_string())));
        }

        Log::info("RemoteBackend: Connected to {}, starting in '{}'.", description, backend->homeDirectory_.generic_string());
        return backend;
    }
}
