#pragma once

#include <ssh/async/processing_thread.hpp>
#include <ssh/async/processing_strand.hpp>
#include <ssh/file_information.hpp>
#include <ssh/file_stream.hpp>
#include <ssh/sftp_error.hpp>

#include <libssh/libsshpp.hpp>
#include <libssh/sftp.h>

#include <expected>
#include <filesystem>
#include <future>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#include <fcntl.h>

namespace SecureShell
{
    class Session;

    /**
     * @brief One sftp subsystem channel of a session. All calls are executed on the processing thread of the owning
     * session. The returned futures hold an exception instead of a value once the session is closing.
     */
    class SftpSession : public std::enable_shared_from_this<SftpSession>
    {
      public:
        using Error = SftpError;
        friend class FileStream;

        SftpSession(Session* owner, std::unique_ptr<ProcessingStrand> strand, sftp_session session);
        ~SftpSession();
        SftpSession(SftpSession const&) = delete;
        SftpSession& operator=(SftpSession const&) = delete;
        SftpSession(SftpSession&&) = delete;
        SftpSession& operator=(SftpSession&&) = delete;

        /**
         * @brief Closes all file streams and the sftp channel. Further calls fail.
         *
         * @return false if the session was already closed.
         */
        bool close();

        template <typename FunctionT>
        auto performPromise(FunctionT&& func) -> std::future<std::invoke_result_t<std::decay_t<FunctionT>>>
        {
            return strand_->pushPromiseTask(std::forward<FunctionT>(func));
        }

        /**
         * @brief Retrieves the last error that occurred. May contain success.
         */
        SftpError lastError() const;

        /**
         * @brief Lists the contents of a directory, excluding "." and "..".
         */
        std::future<std::expected<std::vector<FileInformation>, Error>>
        listDirectory(std::filesystem::path const& path);

        /**
         * @brief Create a directory.
         */
        std::future<std::expected<void, Error>> createDirectory(
            std::filesystem::path const& path,
            std::filesystem::perms permissions = std::filesystem::perms::owner_all |
                std::filesystem::perms::group_read | std::filesystem::perms::group_exec |
                std::filesystem::perms::others_read | std::filesystem::perms::others_exec);

        std::future<std::expected<void, Error>> removeFile(std::filesystem::path const& path);

        /**
         * @brief Removes a directory. Servers refuse to remove non empty directories.
         */
        std::future<std::expected<void, Error>> removeDirectory(std::filesystem::path const& path);

        /**
         * @brief Gets the attributes of a file or directory. Follows symlinks.
         */
        std::future<std::expected<FileInformation, Error>> stat(std::filesystem::path const& path);

        /**
         * @brief Like stat, but describes a symlink itself.
         */
        std::future<std::expected<FileInformation, Error>> lstat(std::filesystem::path const& path);

        /**
         * @brief Move a file or directory. Fails if the destination exists.
         */
        std::future<std::expected<void, Error>>
        rename(std::filesystem::path const& source, std::filesystem::path const& destination);

        /**
         * @brief Resolves a path on the server side, e.g. "." to the login directory.
         */
        std::future<std::expected<std::filesystem::path, Error>> canonicalize(std::filesystem::path const& path);

        enum class OpenType : int
        {
            Read = O_RDONLY,
            Write = O_WRONLY,
            ReadWrite = O_RDWR,
            Create = O_CREAT,
            Truncate = O_TRUNC,
            Exclusive = O_EXCL,
        };

        std::future<std::expected<std::weak_ptr<FileStream>, Error>>
        openFile(std::filesystem::path const& path, int openFlags, std::filesystem::perms permissions);

      private:
        // Takes ownership of the attributes. Null means the call failed.
        std::expected<FileInformation, Error> describe(sftp_attributes attributes, std::filesystem::path const& path) const;
        void closeWithinStrand();
        void fileStreamRemoveItself(FileStream* stream);
        void removeAllFileStreams();

      private:
        Session* owner_;
        std::unique_ptr<ProcessingStrand> strand_;
        sftp_session session_;
        std::vector<std::shared_ptr<FileStream>> fileStreams_;
    };

    constexpr int operator|(SftpSession::OpenType lhs, SftpSession::OpenType rhs)
    {
        return static_cast<int>(lhs) | static_cast<int>(rhs);
    }
}
