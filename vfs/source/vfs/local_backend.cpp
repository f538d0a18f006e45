#include <vfs/local_backend.hpp>
#include <vfs/path_resolver.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <cerrno>
#include <chrono>
#include <fstream>

namespace Vfs
{
    namespace
    {
        SharedData::FileType fileTypeFromStatus(std::filesystem::file_status const& status)
        {
            using enum std::filesystem::file_type;
            switch (status.type())
            {
                case regular:
                    return SharedData::FileType::Regular;
                case directory:
                    return SharedData::FileType::Directory;
                case symlink:
                    return SharedData::FileType::Symlink;
                case block:
                case character:
                case fifo:
                case socket:
                    return SharedData::FileType::Special;
                default:
                    return SharedData::FileType::Unknown;
            }
        }

        std::optional<std::uint64_t> modificationTime(std::filesystem::path const& path)
        {
            std::error_code ec;
            const auto fileTime = std::filesystem::last_write_time(path, ec);
            if (ec)
                return std::nullopt;
            const auto systemTime = std::chrono::clock_cast<std::chrono::system_clock>(fileTime);
            const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(systemTime.time_since_epoch());
            if (seconds.count() < 0)
                return std::nullopt;
            return static_cast<std::uint64_t>(seconds.count());
        }

        std::expected<SharedData::DirectoryEntry, Error>
        describeEntry(std::filesystem::path const& path, std::filesystem::file_status const& status, std::error_code ec)
        {
            if (ec)
                return std::unexpected(
                    SharedData::errorFromErrorCode(ec, fmt::format("Cannot stat '{}'", path.string())));
            if (!std::filesystem::exists(status))
                return std::unexpected(
                    SharedData::makeError(ErrorKind::NotFound, fmt::format("'{}' does not exist", path.string())));

            SharedData::DirectoryEntry entry{
                .path = path,
                .type = fileTypeFromStatus(status),
                .permissions = status.permissions(),
                .mtime = modificationTime(path),
            };
            if (entry.isRegularFile())
            {
                const auto size = std::filesystem::file_size(path, ec);
                if (ec)
                    return std::unexpected(
                        SharedData::errorFromErrorCode(ec, fmt::format("Cannot get size of '{}'", path.string())));
                entry.size = size;
            }
            return entry;
        }

        Error errorFromErrno(std::string const& what)
        {
            const int error = errno;
            if (error == 0)
                return SharedData::makeError(ErrorKind::Unknown, what);
            return SharedData::errorFromErrorCode(std::error_code{error, std::generic_category()}, what);
        }

        class LocalDirectoryListing : public DirectoryListing
        {
          public:
            explicit LocalDirectoryListing(std::filesystem::directory_iterator iterator)
                : iterator_{std::move(iterator)}
                , started_{false}
            {}

            std::expected<std::optional<SharedData::DirectoryEntry>, Error> next() override
            {
                std::error_code ec;
                if (started_)
                {
                    iterator_.increment(ec);
                    if (ec)
                        return std::unexpected(SharedData::errorFromErrorCode(ec, "Cannot continue listing"));
                }
                started_ = true;

                if (iterator_ == std::filesystem::directory_iterator{})
                    return std::nullopt;

                auto const& dirEntry = *iterator_;
                SharedData::DirectoryEntry entry{
                    .path = dirEntry.path().filename(),
                };

                const auto status = dirEntry.symlink_status(ec);
                if (ec)
                {
                    Log::debug(
                        "LocalBackend: Cannot get status of '{}': {}", dirEntry.path().string(), ec.message());
                    return entry;
                }
                entry.type = fileTypeFromStatus(status);
                entry.permissions = status.permissions();
                if (entry.isRegularFile())
                {
                    const auto size = dirEntry.file_size(ec);
                    if (!ec)
                        entry.size = size;
                }
                entry.mtime = modificationTime(dirEntry.path());
                return entry;
            }

          private:
            std::filesystem::directory_iterator iterator_;
            bool started_;
        };

        class LocalReadStream : public ReadStream
        {
          public:
            LocalReadStream(std::ifstream file, std::filesystem::path path)
                : file_{std::move(file)}
                , path_{std::move(path)}
            {}

            std::expected<std::size_t, Error> read(char* buffer, std::size_t bufferSize) override
            {
                if (file_.eof())
                    return 0;

                file_.read(buffer, static_cast<std::streamsize>(bufferSize));
                if (file_.bad())
                    return std::unexpected(
                        SharedData::makeError(ErrorKind::Unknown, fmt::format("Cannot read '{}'", path_.string())));
                return static_cast<std::size_t>(file_.gcount());
            }

          private:
            std::ifstream file_;
            std::filesystem::path path_;
        };

        class LocalWriteStream : public WriteStream
        {
          public:
            LocalWriteStream(std::ofstream file, std::filesystem::path path)
                : file_{std::move(file)}
                , path_{std::move(path)}
            {}

            std::expected<void, Error> write(std::string_view data) override
            {
                file_.write(data.data(), static_cast<std::streamsize>(data.size()));
                if (!file_.good())
                    return std::unexpected(errorFromErrno(fmt::format("Cannot write '{}'", path_.string())));
                return {};
            }

            std::expected<void, Error> close() override
            {
                if (!file_.is_open())
                    return {};
                file_.close();
                if (file_.fail())
                    return std::unexpected(errorFromErrno(fmt::format("Cannot close '{}'", path_.string())));
                return {};
            }

          private:
            std::ofstream file_;
            std::filesystem::path path_;
        };
    }

    std::string LocalBackend::describe() const
    {
        return "local";
    }

    bool LocalBackend::sharesStorageWith(Backend const& other) const
    {
        return other.kind() == BackendKind::Local;
    }

    std::expected<bool, Error> LocalBackend::exists(std::filesystem::path const& path)
    {
        std::error_code ec;
        const auto status = std::filesystem::symlink_status(path, ec);
        if (ec && ec != std::errc::no_such_file_or_directory)
            return std::unexpected(SharedData::errorFromErrorCode(ec, fmt::format("Cannot check '{}'", path.string())));
        return std::filesystem::exists(status);
    }

    std::expected<SharedData::DirectoryEntry, Error> LocalBackend::stat(std::filesystem::path const& path)
    {
        std::error_code ec;
        return describeEntry(path, std::filesystem::status(path, ec), ec);
    }

    std::expected<SharedData::DirectoryEntry, Error> LocalBackend::lstat(std::filesystem::path const& path)
    {
        std::error_code ec;
        return describeEntry(path, std::filesystem::symlink_status(path, ec), ec);
    }

    std::expected<std::unique_ptr<DirectoryListing>, Error>
    LocalBackend::listEntries(std::filesystem::path const& path)
    {
        std::error_code ec;
        std::filesystem::directory_iterator iterator{path, ec};
        if (ec)
            return std::unexpected(SharedData::errorFromErrorCode(ec, fmt::format("Cannot list '{}'", path.string())));
        return std::make_unique<LocalDirectoryListing>(std::move(iterator));
    }

    std::expected<std::unique_ptr<ReadStream>, Error> LocalBackend::openRead(std::filesystem::path const& path)
    {
        auto entry = stat(path);
        if (!entry)
            return std::unexpected(std::move(entry).error());
        if (entry->isDirectory())
            return std::unexpected(
                SharedData::makeError(ErrorKind::IsADirectory, fmt::format("Cannot read directory '{}'", path.string())));

        errno = 0;
        std::ifstream file{path, std::ios_base::binary};
        if (!file.is_open())
            return std::unexpected(errorFromErrno(fmt::format("Cannot open '{}'", path.string())));
        return std::make_unique<LocalReadStream>(std::move(file), path);
    }

    std::expected<std::unique_ptr<WriteStream>, Error> LocalBackend::openWrite(std::filesystem::path const& path)
    {
        std::error_code ec;
        if (std::filesystem::is_directory(path, ec))
            return std::unexpected(
                SharedData::makeError(ErrorKind::IsADirectory, fmt::format("'{}' is a directory", path.string())));

        errno = 0;
        std::ofstream file{path, std::ios_base::binary | std::ios_base::trunc};
        if (!file.is_open())
            return std::unexpected(errorFromErrno(fmt::format("Cannot open '{}' for writing", path.string())));
        return std::make_unique<LocalWriteStream>(std::move(file), path);
    }

    std::expected<void, Error> LocalBackend::createDirectory(std::filesystem::path const& path)
    {
        std::error_code ec;
        const auto created = std::filesystem::create_directory(path, ec);
        if (ec)
            return std::unexpected(
                SharedData::errorFromErrorCode(ec, fmt::format("Cannot create directory '{}'", path.string())));
        if (!created)
            return std::unexpected(
                SharedData::makeError(ErrorKind::AlreadyExists, fmt::format("'{}' already exists", path.string())));
        return {};
    }

    std::expected<void, Error> LocalBackend::removeFile(std::filesystem::path const& path)
    {
        std::error_code ec;
        const auto status = std::filesystem::symlink_status(path, ec);
        if (ec)
            return std::unexpected(SharedData::errorFromErrorCode(ec, fmt::format("Cannot remove '{}'", path.string())));
        if (std::filesystem::is_directory(status))
            return std::unexpected(
                SharedData::makeError(ErrorKind::IsADirectory, fmt::format("'{}' is a directory", path.string())));

        if (!std::filesystem::remove(path, ec))
        {
            if (ec)
                return std::unexpected(
                    SharedData::errorFromErrorCode(ec, fmt::format("Cannot remove '{}'", path.string())));
            return std::unexpected(
                SharedData::makeError(ErrorKind::NotFound, fmt::format("'{}' does not exist", path.string())));
        }
        return {};
    }

    std::expected<void, Error> LocalBackend::removeEmptyDirectory(std::filesystem::path const& path)
    {
        std::error_code ec;
        const auto status = std::filesystem::symlink_status(path, ec);
        if (ec)
            return std::unexpected(SharedData::errorFromErrorCode(ec, fmt::format("Cannot remove '{}'", path.string())));
        if (!std::filesystem::is_directory(status))
            return std::unexpected(
                SharedData::makeError(ErrorKind::NotADirectory, fmt::format("'{}' is not a directory", path.string())));

        if (!std::filesystem::remove(path, ec))
        {
            if (ec)
                return std::unexpected(
                    SharedData::errorFromErrorCode(ec, fmt::format("Cannot remove '{}'", path.string())));
            return std::unexpected(
                SharedData::makeError(ErrorKind::NotFound, fmt::format("'{}' does not exist", path.string())));
        }
        return {};
    }

    std::expected<void, Error>
    LocalBackend::rename(std::filesystem::path const& source, std::filesystem::path const& destination)
    {
        const auto targetExists = exists(destination);
        if (!targetExists)
            return std::unexpected(targetExists.error());
        if (*targetExists)
            return std::unexpected(SharedData::makeError(
                ErrorKind::AlreadyExists, fmt::format("'{}' already exists", destination.string())));

        std::error_code ec;
        std::filesystem::rename(source, destination, ec);
        if (ec)
            return std::unexpected(SharedData::errorFromErrorCode(
                ec, fmt::format("Cannot move '{}' to '{}'", source.string(), destination.string())));
        return {};
    }

    std::filesystem::path LocalBackend::join(std::filesystem::path const& directory, std::string const& name) const
    {
        return joinLocalPath(directory, name);
    }

    std::filesystem::path LocalBackend::normalize(std::string const& address, std::filesystem::path const& base) const
    {
        return normalizeLocalPath(address, base);
    }
}
