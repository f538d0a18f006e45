#pragma once

#include <vfs/local_backend.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>
#include <string>

extern std::filesystem::path programDirectory;

namespace Vfs::Test
{
    class LocalBackendTests : public ::testing::Test
    {
      protected:
        std::filesystem::path writeFile(std::string const& name, std::string const& content)
        {
            const auto path = root() / name;
            std::ofstream{path, std::ios_base::binary} << content;
            return path;
        }

        std::filesystem::path root() const
        {
            return isolateDirectory_.path();
        }

        std::string readAll(std::filesystem::path const& path)
        {
            auto stream = backend_.openRead(path);
            EXPECT_TRUE(stream.has_value());
            if (!stream)
                return {};

            std::string content{};
            char buffer[7];
            while (true)
            {
                auto amount = (*stream)->read(buffer, sizeof(buffer));
                EXPECT_TRUE(amount.has_value());
                if (!amount || *amount == 0)
                    break;
                content.append(buffer, *amount);
            }
            return content;
        }

      protected:
        Utility::TemporaryDirectory isolateDirectory_{programDirectory / "temp_vfs", true};
        LocalBackend backend_{};
    };

    TEST_F(LocalBackendTests, StatReportsSizeAndType)
    {
        const auto file = writeFile("a.txt", "hello");
        const auto entry = backend_.stat(file);
        ASSERT_TRUE(entry.has_value());
        EXPECT_TRUE(entry->isRegularFile());
        EXPECT_EQ(entry->size, 5u);
        EXPECT_EQ(entry->path, file);
        EXPECT_TRUE(entry->mtime.has_value());

        EXPECT_TRUE(backend_.isFile(file));
        EXPECT_FALSE(backend_.isDirectory(file));
        EXPECT_TRUE(backend_.isDirectory(root()));
    }

    TEST_F(LocalBackendTests, StatOfMissingFileIsNotFound)
    {
        const auto entry = backend_.stat(root() / "missing");
        ASSERT_FALSE(entry.has_value());
        EXPECT_EQ(entry.error().kind, ErrorKind::NotFound);
        EXPECT_FALSE(backend_.isFile(root() / "missing"));
    }

    TEST_F(LocalBackendTests, ExistsDoesNotFailForMissingEntries)
    {
        writeFile("there", "");
        EXPECT_EQ(backend_.exists(root() / "there"), true);
        EXPECT_EQ(backend_.exists(root() / "not_there"), false);
    }

    TEST_F(LocalBackendTests, ListingYieldsNamesAndTypes)
    {
        writeFile("file", "12345678");
        std::filesystem::create_directory(root() / "dir");
        std::filesystem::create_symlink(root() / "dir", root() / "link");

        auto entries = backend_.listAll(root());
        ASSERT_TRUE(entries.has_value());
        ASSERT_EQ(entries->size(), 3u);
        std::sort(entries->begin(), entries->end(), [](auto const& lhs, auto const& rhs) {
            return lhs.path < rhs.path;
        });

        EXPECT_EQ((*entries)[0].path, std::filesystem::path{"dir"});
        EXPECT_TRUE((*entries)[0].isDirectory());
        EXPECT_EQ((*entries)[1].path, std::filesystem::path{"file"});
        EXPECT_EQ((*entries)[1].size, 8u);
        EXPECT_EQ((*entries)[2].path, std::filesystem::path{"link"});
        EXPECT_TRUE((*entries)[2].isSymlink());
    }

    TEST_F(LocalBackendTests, ListingAFileFails)
    {
        const auto file = writeFile("file", "");
        const auto listing = backend_.listEntries(file);
        ASSERT_FALSE(listing.has_value());
        EXPECT_EQ(listing.error().kind, ErrorKind::NotADirectory);
    }

    TEST_F(LocalBackendTests, ReadsFileInPieces)
    {
        const std::string content = "The quick brown fox jumps over the lazy dog";
        const auto file = writeFile("fox", content);
        EXPECT_EQ(readAll(file), content);
    }

    TEST_F(LocalBackendTests, OpenReadOnDirectoryFails)
    {
        const auto stream = backend_.openRead(root());
        ASSERT_FALSE(stream.has_value());
        EXPECT_EQ(stream.error().kind, ErrorKind::IsADirectory);
    }

    TEST_F(LocalBackendTests, OpenWriteTruncates)
    {
        const auto file = writeFile("file", "a long previous content");
        {
            auto stream = backend_.openWrite(file);
            ASSERT_TRUE(stream.has_value());
            ASSERT_TRUE((*stream)->write("new").has_value());
            ASSERT_TRUE((*stream)->close().has_value());
        }
        EXPECT_EQ(readAll(file), "new");
    }

    TEST_F(LocalBackendTests, OpenWriteInMissingDirectoryIsNotFound)
    {
        const auto stream = backend_.openWrite(root() / "nope" / "file");
        ASSERT_FALSE(stream.has_value());
        EXPECT_EQ(stream.error().kind, ErrorKind::NotFound);
    }

    TEST_F(LocalBackendTests, CreateDirectoryTwiceIsAlreadyExists)
    {
        ASSERT_TRUE(backend_.createDirectory(root() / "d").has_value());
        const auto again = backend_.createDirectory(root() / "d");
        ASSERT_FALSE(again.has_value());
        EXPECT_EQ(again.error().kind, ErrorKind::AlreadyExists);
    }

    TEST_F(LocalBackendTests, RemoveEmptyDirectoryRefusesNonEmpty)
    {
        std::filesystem::create_directory(root() / "d");
        std::ofstream{root() / "d" / "f"} << "x";
        const auto result = backend_.removeEmptyDirectory(root() / "d");
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, ErrorKind::NotEmpty);
        EXPECT_TRUE(std::filesystem::exists(root() / "d" / "f"));
    }

    TEST_F(LocalBackendTests, LstatDescribesSymlinkItself)
    {
        std::filesystem::create_directory(root() / "d");
        std::filesystem::create_directory_symlink(root() / "d", root() / "link");

        const auto followed = backend_.stat(root() / "link");
        ASSERT_TRUE(followed.has_value());
        EXPECT_TRUE(followed->isDirectory());

        const auto link = backend_.lstat(root() / "link");
        ASSERT_TRUE(link.has_value());
        EXPECT_TRUE(link->isSymlink());

        const auto missing = backend_.lstat(root() / "ghost");
        ASSERT_FALSE(missing.has_value());
        EXPECT_EQ(missing.error().kind, ErrorKind::NotFound);
    }

    TEST_F(LocalBackendTests, RemoveFileOnDirectoryIsADirectory)
    {
        std::filesystem::create_directory(root() / "d");
        const auto result = backend_.removeFile(root() / "d");
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, ErrorKind::IsADirectory);
    }

    TEST_F(LocalBackendTests, RenameMovesAndRefusesExistingTargets)
    {
        const auto source = writeFile("a", "a");
        const auto other = writeFile("b", "b");

        const auto blocked = backend_.rename(source, other);
        ASSERT_FALSE(blocked.has_value());
        EXPECT_EQ(blocked.error().kind, ErrorKind::AlreadyExists);

        ASSERT_TRUE(backend_.rename(source, root() / "c").has_value());
        EXPECT_FALSE(std::filesystem::exists(source));
        EXPECT_TRUE(std::filesystem::exists(root() / "c"));
    }

    TEST_F(LocalBackendTests, AllLocalBackendsShareStorage)
    {
        LocalBackend other{};
        EXPECT_TRUE(backend_.sharesStorageWith(other));
    }

    TEST_F(LocalBackendTests, LeaseIsExclusiveUntilReleased)
    {
        {
            auto lease = backend_.tryLease();
            ASSERT_TRUE(lease.has_value());
            EXPECT_TRUE(backend_.isLeased());
            EXPECT_FALSE(backend_.tryLease().has_value());

            auto moved = std::move(lease).value();
            EXPECT_EQ(moved.backend(), &backend_);
            EXPECT_TRUE(backend_.isLeased());
        }
        EXPECT_FALSE(backend_.isLeased());
        EXPECT_TRUE(backend_.tryLease().has_value());
    }
}
