#pragma once

#include <vfs/backend.hpp>
#include <ids/ids.hpp>
#include <persistence/state/ssh_session_options.hpp>
#include <ssh/session.hpp>
#include <ssh/sftp_session.hpp>

#include <chrono>
#include <memory>

namespace Vfs
{
    /**
     * @brief The file system behind one sftp session. The backend owns the ssh session and closes it on destruction.
     * All sftp calls are serialized on the session's processing thread, each call waits at most the operation timeout.
     */
    class RemoteBackend : public Backend
    {
      public:
        RemoteBackend(
            std::unique_ptr<SecureShell::Session> session,
            std::weak_ptr<SecureShell::SftpSession> sftp,
            std::string description,
            std::chrono::milliseconds operationTimeout);
        ~RemoteBackend() override;
        RemoteBackend(RemoteBackend const&) = delete;
        RemoteBackend& operator=(RemoteBackend const&) = delete;
        RemoteBackend(RemoteBackend&&) = delete;
        RemoteBackend& operator=(RemoteBackend&&) = delete;

        BackendKind kind() const override
        {
            return BackendKind::Remote;
        }
        std::string describe() const override;
        bool sharesStorageWith(Backend const& other) const override;

        std::expected<bool, Error> exists(std::filesystem::path const& path) override;
        std::expected<SharedData::DirectoryEntry, Error> stat(std::filesystem::path const& path) override;
        std::expected<SharedData::DirectoryEntry, Error> lstat(std::filesystem::path const& path) override;
        std::expected<std::unique_ptr<DirectoryListing>, Error> listEntries(std::filesystem::path const& path) override;
        std::expected<std::unique_ptr<ReadStream>, Error> openRead(std::filesystem::path const& path) override;
        std::expected<std::unique_ptr<WriteStream>, Error> openWrite(std::filesystem::path const& path) override;
        std::expected<void, Error> createDirectory(std::filesystem::path const& path) override;
        std::expected<void, Error> removeFile(std::filesystem::path const& path) override;
        std::expected<void, Error> removeEmptyDirectory(std::filesystem::path const& path) override;
        std::expected<void, Error>
        rename(std::filesystem::path const& source, std::filesystem::path const& destination) override;
        std::filesystem::path join(std::filesystem::path const& directory, std::string const& name) const override;
        std::filesystem::path normalize(std::string const& address, std::filesystem::path const& base) const override;

        /**
         * @brief Resolves a path on the server, "." is the login directory.
         */
        std::expected<std::filesystem::path, Error> canonicalize(std::filesystem::path const& path);

        Ids::SessionId id() const
        {
            return id_;
        }

        std::filesystem::path const& homeDirectory() const
        {
            return homeDirectory_;
        }

      private:
        friend std::expected<std::unique_ptr<RemoteBackend>, Error> connectRemote(
            Persistence::SshSessionOptions const&,
            std::chrono::milliseconds,
            SecureShell::AskPassCallback,
            void*);

        std::expected<std::shared_ptr<SecureShell::SftpSession>, Error> sftp() const;

      private:
        Ids::SessionId id_;
        std::unique_ptr<SecureShell::Session> session_;
        std::weak_ptr<SecureShell::SftpSession> sftp_;
        std::string description_;
        std::chrono::milliseconds operationTimeout_;
        std::filesystem::path homeDirectory_;
    };

    /**
     * @brief Connects, authenticates, opens sftp and resolves the start directory of a session.
     *
     * @param options defaultDirectory must exist and be a directory. The login directory if unset.
     * @param operationTimeout Upper bound for connecting and for each single sftp call afterwards.
     * @param askPass Asks for passwords and key passphrases. May be null.
     */
    std::expected<std::unique_ptr<RemoteBackend>, Error> connectRemote(
        Persistence::SshSessionOptions const& options,
        std::chrono::milliseconds operationTimeout,
        SecureShell::AskPassCallback askPass,
        void* askPassUserData);
}
