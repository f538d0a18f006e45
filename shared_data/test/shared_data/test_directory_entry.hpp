#pragma once

#include <shared_data/directory_entry.hpp>

#include <gtest/gtest.h>

namespace SharedData::Test
{
    TEST(DirectoryEntryTests, TypeAndPermissionsAreWrittenReadably)
    {
        const DirectoryEntry entry{
            .path = "photos/a.jpg",
            .type = FileType::Regular,
            .size = 1000,
            .permissions = std::filesystem::perms::owner_read | std::filesystem::perms::owner_write |
                std::filesystem::perms::group_read,
        };
        const nlohmann::json j = entry;

        EXPECT_EQ(j.at("type"), "Regular");
        EXPECT_EQ(j.at("permissions"), "0640");
        EXPECT_FALSE(j.contains("mtime"));

        const auto back = j.get<DirectoryEntry>();
        EXPECT_EQ(back.path, std::filesystem::path{"photos/a.jpg"});
        EXPECT_EQ(back.permissions, entry.permissions);
        EXPECT_EQ(back.name(), "a.jpg");
    }

    TEST(DirectoryEntryTests, UnknownTypeNameIsRejected)
    {
        const auto j = nlohmann::json::parse(R"({"path": "x", "type": "Pipe"})");
        EXPECT_THROW(j.get<DirectoryEntry>(), std::invalid_argument);
    }

    TEST(DirectoryEntryTests, UnclassifiedEntriesCountAsSpecial)
    {
        EXPECT_TRUE(DirectoryEntry{.type = FileType::Unknown}.isSpecial());
        EXPECT_TRUE(DirectoryEntry{.type = FileType::Special}.isSpecial());
        EXPECT_FALSE(DirectoryEntry{.type = FileType::Symlink}.isSpecial());
    }
}
