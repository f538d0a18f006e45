#pragma once

#include <shared_data/shared_data.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace SharedData
{
    BOOST_DEFINE_FIXED_ENUM_CLASS(FileType, std::uint8_t, Unknown, Regular, Directory, Symlink, Special);

    /**
     * @brief What a backend knows about one file system object.
     *
     * Listings fill path with the bare name, stat fills it with the full path.
     * Size is only meaningful for regular files. Symlinks are reported as such and never followed.
     */
    struct DirectoryEntry
    {
        using FileType = SharedData::FileType;

        std::filesystem::path path{};
        FileType type{FileType::Unknown};
        std::uint64_t size{0};
        std::filesystem::perms permissions{std::filesystem::perms::unknown};
        // Modification time in seconds since the epoch.
        std::optional<std::uint64_t> mtime{std::nullopt};

        // Index of the containing directory while walking a tree.
        std::optional<std::size_t> parent{std::nullopt};

        bool isDirectory() const
        {
            return type == FileType::Directory;
        }
        bool isRegularFile() const
        {
            return type == FileType::Regular;
        }
        bool isSymlink() const
        {
            return type == FileType::Symlink;
        }
        // Devices, sockets, fifos and anything the backend could not classify.
        bool isSpecial() const
        {
            return type == FileType::Special || type == FileType::Unknown;
        }

        std::string name() const
        {
            return path.filename().string();
        }
    };

    void to_json(nlohmann::json& j, DirectoryEntry const& entry);
    void from_json(nlohmann::json const& j, DirectoryEntry& entry);
}
