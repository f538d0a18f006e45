#include <vfs/file_operations.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

namespace Vfs
{
    std::expected<void, Error> removeRecursively(Backend& backend, std::filesystem::path const& path)
    {
        auto removed = backend.removeFile(path);
        if (removed || removed.error().kind == ErrorKind::NotFound || removed.error().kind == ErrorKind::ConnectionLost)
            return removed;

        // Unlinking a directory fails differently per server (EISDIR, EPERM, a generic failure).
        // lstat keeps a symlink to a directory from being descended into.
        const auto entry = backend.lstat(path);
        if (!entry || !entry->isDirectory())
            return removed;

        auto entries = backend.listAll(path);
        if (!entries)
            return std::unexpected(std::move(entries).error());

        for (auto const& entry : *entries)
        {
            const auto child = backend.join(path, entry.path.filename().string());
            const auto result =
                entry.isDirectory() ? removeRecursively(backend, child) : backend.removeFile(child);
            if (!result)
                return result;
        }

        Log::debug("FileOperations: Removing directory '{}'.", path.generic_string());
        return backend.removeEmptyDirectory(path);
    }

    bool isValidFileName(std::string_view name)
    {
        if (name.empty() || name == "." || name == "..")
            return false;
        return name.find_first_of("<>\"/\\|*?:") == std::string_view::npos;
    }

    std::expected<std::filesystem::path, Error>
    createFolder(Backend& backend, std::filesystem::path const& directory, std::string const& name)
    {
        if (!isValidFileName(name))
            return std::unexpected(
                SharedData::makeError(ErrorKind::InvalidName, fmt::format("'{}' is not a valid folder name", name)));

        const auto target = backend.join(directory, name);
        const auto existing = backend.exists(target);
        if (!existing)
            return std::unexpected(existing.error());
        if (*existing)
            return std::unexpected(SharedData::makeError(
                ErrorKind::AlreadyExists, fmt::format("'{}' already exists", target.generic_string())));

        if (auto created = backend.createDirectory(target); !created)
            return std::unexpected(std::move(created).error());

        Log::info("FileOperations: Created folder '{}' on {}.", target.generic_string(), backend.describe());
        return target;
    }
}
