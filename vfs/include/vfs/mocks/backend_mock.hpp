#pragma once

#include <vfs/backend.hpp>

#include <gmock/gmock.h>

namespace Vfs::Test
{
    class BackendMock : public Vfs::Backend
    {
      public:
        MOCK_METHOD(BackendKind, kind, (), (const, override));
        MOCK_METHOD(std::string, describe, (), (const, override));
        MOCK_METHOD(bool, sharesStorageWith, (Backend const& other), (const, override));
        MOCK_METHOD((std::expected<bool, Error>), exists, (std::filesystem::path const& path), (override));
        MOCK_METHOD(
            (std::expected<SharedData::DirectoryEntry, Error>),
            stat,
            (std::filesystem::path const& path),
            (override));
        MOCK_METHOD(
            (std::expected<SharedData::DirectoryEntry, Error>),
            lstat,
            (std::filesystem::path const& path),
            (override));
        MOCK_METHOD(
            (std::expected<std::unique_ptr<DirectoryListing>, Error>),
            listEntries,
            (std::filesystem::path const& path),
            (override));
        MOCK_METHOD(
            (std::expected<std::unique_ptr<ReadStream>, Error>),
            openRead,
            (std::filesystem::path const& path),
            (override));
        MOCK_METHOD(
            (std::expected<std::unique_ptr<WriteStream>, Error>),
            openWrite,
            (std::filesystem::path const& path),
            (override));
        MOCK_METHOD((std::expected<void, Error>), createDirectory, (std::filesystem::path const& path), (override));
        MOCK_METHOD((std::expected<void, Error>), removeFile, (std::filesystem::path const& path), (override));
        MOCK_METHOD(
            (std::expected<void, Error>),
            removeEmptyDirectory,
            (std::filesystem::path const& path),
            (override));
        MOCK_METHOD(
            (std::expected<void, Error>),
            rename,
            (std::filesystem::path const& source, std::filesystem::path const& destination),
            (override));
        MOCK_METHOD(
            std::filesystem::path,
            join,
            (std::filesystem::path const& directory, std::string const& name),
            (const, override));
        MOCK_METHOD(
            std::filesystem::path,
            normalize,
            (std::string const& address, std::filesystem::path const& base),
            (const, override));

        /**
         * @brief Forwards every call to another backend while pretending to be of the given kind.
         * Shares storage only with itself.
         */
        void delegateTo(Backend& real, BackendKind pretendedKind)
        {
            using ::testing::_;

            ON_CALL(*this, kind()).WillByDefault(::testing::Return(pretendedKind));
            ON_CALL(*this, describe()).WillByDefault([pretendedKind]() {
                return pretendedKind == BackendKind::Remote ? std::string{"sftp://mock"} : std::string{"local mock"};
            });
            ON_CALL(*this, sharesStorageWith(_)).WillByDefault([this](Backend const& other) {
                return &other == this;
            });
            ON_CALL(*this, exists(_)).WillByDefault([&real](auto const& path) {
                return real.exists(path);
            });
            ON_CALL(*this, stat(_)).WillByDefault([&real](auto const& path) {
                return real.stat(path);
            });
            ON_CALL(*this, lstat(_)).WillByDefault([&real](auto const& path) {
                return real.lstat(path);
            });
            ON_CALL(*this, listEntries(_)).WillByDefault([&real](auto const& path) {
                return real.listEntries(path);
            });
            ON_CALL(*this, openRead(_)).WillByDefault([&real](auto const& path) {
                return real.openRead(path);
            });
            ON_CALL(*this, openWrite(_)).WillByDefault([&real](auto const& path) {
                return real.openWrite(path);
            });
            ON_CALL(*this, createDirectory(_)).WillByDefault([&real](auto const& path) {
                return real.createDirectory(path);
            });
            ON_CALL(*this, removeFile(_)).WillByDefault([&real](auto const& path) {
                return real.removeFile(path);
            });
            ON_CALL(*this, removeEmptyDirectory(_)).WillByDefault([&real](auto const& path) {
                return real.removeEmptyDirectory(path);
            });
            ON_CALL(*this, rename(_, _)).WillByDefault([&real](auto const& source, auto const& destination) {
                return real.rename(source, destination);
            });
            ON_CALL(*this, join(_, _)).WillByDefault([&real](auto const& directory, auto const& name) {
                return real.join(directory, name);
            });
            ON_CALL(*this, normalize(_, _)).WillByDefault([&real](auto const& address, auto const& base) {
                return real.normalize(address, base);
            });
        }
    };
}
