#include <transfer/delete_operation.hpp>
#include <vfs/file_operations.hpp>
#include <log/log.hpp>

namespace Transfer
{
    SharedData::TransferResult
    deleteEntries(Vfs::Backend& backend, std::vector<DisplayEntry> const& selection, CancellationToken const& token)
    {
        SharedData::TransferResult result{};

        for (auto const& selected : selection)
        {
            if (token.isCancelled())
            {
                result.cancelled = true;
                break;
            }

            const auto path = backend.normalize(selected.sourcePath.generic_string(), "/");
            const auto name = selected.displayName.empty() ? path.filename().string() : selected.displayName;

            if (path == path.root_path())
            {
                result.addFailure(
                    name, SharedData::makeError(SharedData::ErrorKind::InvalidTarget, "Refusing to delete the root"));
                continue;
            }

            if (auto removed = Vfs::removeRecursively(backend, path); !removed)
            {
                Log::error("Delete: '{}' failed: {}", path.generic_string(), removed.error().toString());
                result.addFailure(name, removed.error());
                continue;
            }
            Log::info("Delete: Removed '{}'.", path.generic_string());
            ++result.successCount;
        }
        return result;
    }
}
