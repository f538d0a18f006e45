#pragma once

#include <shared_data/directory_entry.hpp>
#include <shared_data/error.hpp>
#include <utility/describe.hpp>

#include <atomic>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Vfs
{
    BOOST_DEFINE_ENUM_CLASS(BackendKind, Local, Remote);

    using Error = SharedData::Error;
    using ErrorKind = SharedData::ErrorKind;

    /**
     * @brief A finite sequence of directory entries, consumed once. Never yields "." or "..".
     */
    class DirectoryListing
    {
      public:
        DirectoryListing() = default;
        virtual ~DirectoryListing() = default;
        DirectoryListing(DirectoryListing const&) = delete;
        DirectoryListing& operator=(DirectoryListing const&) = delete;
        DirectoryListing(DirectoryListing&&) = delete;
        DirectoryListing& operator=(DirectoryListing&&) = delete;

        /**
         * @brief Returns the next entry, or nullopt when the listing is exhausted.
         */
        virtual std::expected<std::optional<SharedData::DirectoryEntry>, Error> next() = 0;
    };

    /**
     * @brief A file opened for reading. Closed when destroyed.
     */
    class ReadStream
    {
      public:
        ReadStream() = default;
        virtual ~ReadStream() = default;
        ReadStream(ReadStream const&) = delete;
        ReadStream& operator=(ReadStream const&) = delete;
        ReadStream(ReadStream&&) = delete;
        ReadStream& operator=(ReadStream&&) = delete;

        /**
         * @brief Reads up to bufferSize bytes. Returns 0 at the end of the file.
         */
        virtual std::expected<std::size_t, Error> read(char* buffer, std::size_t bufferSize) = 0;
    };

    /**
     * @brief A file opened for writing. Closed when destroyed, call close to observe errors.
     */
    class WriteStream
    {
      public:
        WriteStream() = default;
        virtual ~WriteStream() = default;
        WriteStream(WriteStream const&) = delete;
        WriteStream& operator=(WriteStream const&) = delete;
        WriteStream(WriteStream&&) = delete;
        WriteStream& operator=(WriteStream&&) = delete;

        /**
         * @brief Writes all of data.
         */
        virtual std::expected<void, Error> write(std::string_view data) = 0;
        virtual std::expected<void, Error> close() = 0;
    };

    class Backend;

    /**
     * @brief Exclusive claim on a backend for the duration of one transfer. Released on destruction.
     */
    class BackendLease
    {
      public:
        friend class Backend;

        ~BackendLease();
        BackendLease(BackendLease const&) = delete;
        BackendLease& operator=(BackendLease const&) = delete;
        BackendLease(BackendLease&& other) noexcept;
        BackendLease& operator=(BackendLease&& other) noexcept;

        Backend* backend() const
        {
            return backend_;
        }

      private:
        explicit BackendLease(Backend* backend);
        void release();

      private:
        Backend* backend_;
    };

    /**
     * @brief A file system one pane browses. All paths given to a backend are absolute and normalized by it.
     */
    class Backend
    {
      public:
        Backend() = default;
        virtual ~Backend() = default;
        Backend(Backend const&) = delete;
        Backend& operator=(Backend const&) = delete;
        Backend(Backend&&) = delete;
        Backend& operator=(Backend&&) = delete;

        virtual BackendKind kind() const = 0;

        /**
         * @brief Human readable origin of the backend, like "local" or "sftp://user@host:22".
         */
        virtual std::string describe() const = 0;

        /**
         * @brief True if a rename between both backends can work. Backends that share storage may still report
         * CrossDevice on rename.
         */
        virtual bool sharesStorageWith(Backend const& other) const = 0;

        /**
         * @brief Checks if an entry exists, without following a symlink at the path.
         */
        virtual std::expected<bool, Error> exists(std::filesystem::path const& path) = 0;

        /**
         * @brief Retrieves the metadata of an entry. Follows symlinks. The returned entry holds the full path.
         */
        virtual std::expected<SharedData::DirectoryEntry, Error> stat(std::filesystem::path const& path) = 0;

        /**
         * @brief Like stat, but a symlink at the path is described itself.
         */
        virtual std::expected<SharedData::DirectoryEntry, Error> lstat(std::filesystem::path const& path) = 0;

        /**
         * @brief Lists a directory lazily. Entries hold their name only and are not followed if they are symlinks.
         */
        virtual std::expected<std::unique_ptr<DirectoryListing>, Error>
        listEntries(std::filesystem::path const& path) = 0;

        virtual std::expected<std::unique_ptr<ReadStream>, Error> openRead(std::filesystem::path const& path) = 0;

        /**
         * @brief Opens a file for writing. Creates it or truncates it.
         */
        virtual std::expected<std::unique_ptr<WriteStream>, Error> openWrite(std::filesystem::path const& path) = 0;

        /**
         * @brief Creates one directory. The parent must exist. AlreadyExists if anything is at the path.
         */
        virtual std::expected<void, Error> createDirectory(std::filesystem::path const& path) = 0;

        /**
         * @brief Removes anything but a directory. For a directory the error kind depends on the backend.
         */
        virtual std::expected<void, Error> removeFile(std::filesystem::path const& path) = 0;

        /**
         * @brief Removes a directory without children, NotEmpty otherwise.
         */
        virtual std::expected<void, Error> removeEmptyDirectory(std::filesystem::path const& path) = 0;

        /**
         * @brief Moves an entry within this backend. AlreadyExists if the destination exists.
         */
        virtual std::expected<void, Error>
        rename(std::filesystem::path const& source, std::filesystem::path const& destination) = 0;

        virtual std::filesystem::path join(std::filesystem::path const& directory, std::string const& name) const = 0;

        /**
         * @brief Resolves what a user typed into an absolute normalized path. Relative input is resolved against base.
         */
        virtual std::filesystem::path normalize(std::string const& address, std::filesystem::path const& base) const = 0;

        /**
         * @brief stat based. NotFound and all other errors yield false.
         */
        bool isDirectory(std::filesystem::path const& path);
        bool isFile(std::filesystem::path const& path);

        /**
         * @brief Drains a listing into a vector.
         */
        std::expected<std::vector<SharedData::DirectoryEntry>, Error> listAll(std::filesystem::path const& path);

        /**
         * @brief Claims the backend for one transfer. nullopt if it is already claimed.
         */
        std::optional<BackendLease> tryLease();
        bool isLeased() const;

      private:
        friend class BackendLease;
        std::atomic_bool leased_{false};
    };
}
