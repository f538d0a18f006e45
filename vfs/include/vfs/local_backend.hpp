#pragma once

#include <vfs/backend.hpp>

namespace Vfs
{
    /**
     * @brief The file system of this machine.
     */
    class LocalBackend : public Backend
    {
      public:
        LocalBackend() = default;
        ~LocalBackend() override = default;
        LocalBackend(LocalBackend const&) = delete;
        LocalBackend& operator=(LocalBackend const&) = delete;
        LocalBackend(LocalBackend&&) = delete;
        LocalBackend& operator=(LocalBackend&&) = delete;

        BackendKind kind() const override
        {
            return BackendKind::Local;
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
    };
}
