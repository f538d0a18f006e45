#include <transfer/planner.hpp>
#include <utility/directory_traversal.hpp>
#include <log/log.hpp>

namespace Transfer
{
    std::uint64_t measureBytes(Vfs::Backend& backend, std::filesystem::path const& path, bool isDirectory)
    {
        if (!isDirectory)
        {
            const auto entry = backend.stat(path);
            if (!entry)
            {
                Log::debug("Planner: Cannot measure '{}': {}", path.generic_string(), entry.error().toString());
                return 0;
            }
            return entry->size;
        }

        auto scanner = [&backend](std::filesystem::path const& directory) {
            return backend.listAll(directory);
        };
        Utility::DeepDirectoryWalker<SharedData::DirectoryEntry, SharedData::Error, decltype(scanner)> walker{
            path, std::move(scanner)};

        while (!walker.completed())
        {
            const auto result = walker.walk();
            if (!result)
                Log::debug("Planner: Skipping unreadable directory below '{}': {}", path.generic_string(), result.error().toString());
        }
        return walker.totalBytes();
    }

    std::expected<TransferPlan, SharedData::Error> planTransfer(
        std::vector<DisplayEntry> const& selection,
        Vfs::Backend& source,
        Vfs::Backend& target,
        std::filesystem::path const& targetDirectory,
        std::filesystem::path const& sourceDirectory)
    {
        TransferPlan plan{};

        for (auto const& selected : selection)
        {
            const auto sourcePath = source.normalize(selected.sourcePath.generic_string(), sourceDirectory);
            const auto name = sourcePath.filename().string();
            if (name.empty())
            {
                Log::warn("Planner: Cannot transfer '{}', it has no name.", sourcePath.generic_string());
                continue;
            }

            const auto entry = source.stat(sourcePath);
            if (!entry)
            {
                Log::warn("Planner: Dropping '{}': {}", sourcePath.generic_string(), entry.error().toString());
                continue;
            }

            const auto directory =
                target.normalize(selected.targetDirectory.value_or(targetDirectory).generic_string(), "/");

            TransferTask task{
                .sourceBackend = &source,
                .targetBackend = &target,
                .sourcePath = sourcePath,
                .targetPath = target.join(directory, name),
                .displayName = selected.displayName.empty() ? name : selected.displayName,
                .isDirectory = entry->isDirectory(),
            };
            task.bytes = task.isDirectory ? measureBytes(source, sourcePath, true) : entry->size;
            plan.totalBytes += task.bytes;
            plan.tasks.push_back(std::move(task));
        }

        if (plan.tasks.empty())
            return std::unexpected(
                SharedData::makeError(SharedData::ErrorKind::EmptySelection, "Nothing to transfer"));

        Log::info("Planner: Planned {} tasks with {} bytes.", plan.tasks.size(), plan.totalBytes);
        return plan;
    }
}
