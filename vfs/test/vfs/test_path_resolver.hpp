#pragma once

#include <vfs/path_resolver.hpp>

#include <gtest/gtest.h>

namespace Vfs::Test
{
    class PathResolverTests : public ::testing::Test
    {};

    TEST_F(PathResolverTests, StripsSchemeAndHost)
    {
        EXPECT_EQ(stripRemoteAddressPrefix("sftp://host:22/srv/data"), "/srv/data");
        EXPECT_EQ(stripRemoteAddressPrefix("sftp://user@host/"), "/");
        EXPECT_EQ(stripRemoteAddressPrefix("sftp://host"), "/");
        EXPECT_EQ(stripRemoteAddressPrefix("/plain/path"), "/plain/path");
        EXPECT_EQ(stripRemoteAddressPrefix("relative"), "relative");
    }

    TEST_F(PathResolverTests, RemotePathDropsDotsAndEmptySegments)
    {
        EXPECT_EQ(normalizeRemotePath("/a//b/./c/", "/"), std::filesystem::path{"/a/b/c"});
        EXPECT_EQ(normalizeRemotePath("/a/b/../c", "/"), std::filesystem::path{"/a/c"});
    }

    TEST_F(PathResolverTests, RemotePathNeverGoesAboveRoot)
    {
        EXPECT_EQ(normalizeRemotePath("/../../x", "/"), std::filesystem::path{"/x"});
        EXPECT_EQ(normalizeRemotePath("..", "/"), std::filesystem::path{"/"});
        EXPECT_EQ(normalizeRemotePath("sftp://host/..", "/home"), std::filesystem::path{"/"});
    }

    TEST_F(PathResolverTests, RemoteRelativePathResolvesAgainstBase)
    {
        EXPECT_EQ(normalizeRemotePath("docs", "/home/me"), std::filesystem::path{"/home/me/docs"});
        EXPECT_EQ(normalizeRemotePath("../you", "/home/me"), std::filesystem::path{"/home/you"});
        EXPECT_EQ(normalizeRemotePath("", "/home/me"), std::filesystem::path{"/home/me"});
    }

    TEST_F(PathResolverTests, SchemeAddressIgnoresBase)
    {
        EXPECT_EQ(normalizeRemotePath("sftp://host:2222/etc/./ssh", "/home/me"), std::filesystem::path{"/etc/ssh"});
    }

    TEST_F(PathResolverTests, RemoteJoinUsesSingleSeparator)
    {
        EXPECT_EQ(joinRemotePath("/", "a"), std::filesystem::path{"/a"});
        EXPECT_EQ(joinRemotePath("/srv/", "a"), std::filesystem::path{"/srv/a"});
        EXPECT_EQ(joinRemotePath("/srv", "/a"), std::filesystem::path{"/srv/a"});
    }

    TEST_F(PathResolverTests, LocalPathIsLexicallyNormal)
    {
        EXPECT_EQ(normalizeLocalPath("/tmp/a/../b/", "/"), std::filesystem::path{"/tmp/b"});
        EXPECT_EQ(normalizeLocalPath("x/./y", "/base"), std::filesystem::path{"/base/x/y"});
        EXPECT_EQ(normalizeLocalPath("/", "/base"), std::filesystem::path{"/"});
        EXPECT_EQ(joinLocalPath("/tmp", "file.txt"), std::filesystem::path{"/tmp/file.txt"});
    }

    TEST_F(PathResolverTests, DetectsNestedPaths)
    {
        EXPECT_TRUE(isSameOrInside("/a/b", "/a/b"));
        EXPECT_TRUE(isSameOrInside("/a/b/c", "/a/b"));
        EXPECT_TRUE(isSameOrInside("/a/b/c", "/"));
        EXPECT_FALSE(isSameOrInside("/a/bc", "/a/b"));
        EXPECT_FALSE(isSameOrInside("/a", "/a/b"));
    }
}
