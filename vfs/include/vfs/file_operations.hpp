#pragma once

#include <vfs/backend.hpp>

#include <expected>
#include <filesystem>
#include <string_view>

namespace Vfs
{
    /**
     * @brief Deletes a file, a symlink or a whole directory tree. Symlinks are removed, never followed.
     * Stops at the first error, what was deleted before stays deleted.
     */
    std::expected<void, Error> removeRecursively(Backend& backend, std::filesystem::path const& path);

    /**
     * @brief A name is valid if it is not empty, not "." or ".." and has none of <>"/\|*?:
     */
    bool isValidFileName(std::string_view name);

    /**
     * @brief Creates the directory "name" inside directory.
     *
     * @return The path of the new directory. InvalidName or AlreadyExists if it cannot be created.
     */
    std::expected<std::filesystem::path, Error>
    createFolder(Backend& backend, std::filesystem::path const& directory, std::string const& name);
}
