#include <transfer/transfer_executor.hpp>
#include <vfs/file_operations.hpp>
#include <vfs/path_resolver.hpp>
#include <utility/enum_string_convert.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <string_view>

namespace Transfer
{
    namespace
    {
        using SharedData::Error;
        using SharedData::ErrorKind;

        Error cancelledError()
        {
            return SharedData::makeError(ErrorKind::Cancelled, "Transfer was cancelled");
        }

        bool sameStorage(TransferTask const& task)
        {
            return task.sourceBackend == task.targetBackend || task.sourceBackend->sharesStorageWith(*task.targetBackend);
        }

        bool targetLiesInSource(TransferTask const& task)
        {
            return sameStorage(task) && Vfs::isSameOrInside(task.targetPath, task.sourcePath);
        }

        /**
         * @brief State of one execute call.
         */
        class Run
        {
          public:
            Run(std::size_t chunkSize,
                std::uint64_t totalBytes,
                TransferCallbacks const& callbacks,
                CancellationToken const& token)
                : buffer_(std::max<std::size_t>(chunkSize, 1))
                , tracker_{totalBytes, callbacks.onProgress}
                , policy_{callbacks.onConflict}
                , token_{token}
            {}

            ProgressTracker& tracker()
            {
                return tracker_;
            }

            ConflictPolicy& policy()
            {
                return policy_;
            }

            bool cancelled() const
            {
                return token_.isCancelled();
            }

            std::expected<void, Error> copy(TransferTask const& task)
            {
                skipped_.clear();
                if (task.isDirectory)
                    return copyDirectory(*task.sourceBackend, *task.targetBackend, task.sourcePath, task.targetPath);
                return copyFile(
                    *task.sourceBackend, *task.targetBackend, task.sourcePath, task.targetPath, task.displayName);
            }

            std::expected<void, Error> move(TransferTask const& task)
            {
                auto& source = *task.sourceBackend;
                auto& target = *task.targetBackend;

                // Upload and download always copy, a rename only works within one storage.
                const auto strategy = strategyFor(source.kind(), target.kind());
                const bool renameable =
                    (strategy == TransferStrategy::LocalToLocal || strategy == TransferStrategy::RemoteToRemote) &&
                    sameStorage(task);
                if (renameable)
                {
                    const auto renamed = source.rename(task.sourcePath, task.targetPath);
                    if (renamed)
                    {
                        tracker_.advance(task.bytes);
                        tracker_.report(task.displayName);
                        return {};
                    }
                    if (renamed.error().kind != ErrorKind::CrossDevice)
                        return renamed;
                    Log::info(
                        "TransferExecutor: '{}' cannot be renamed across devices, copying instead.",
                        task.sourcePath.generic_string());
                }

                if (auto copied = copy(task); !copied)
                    return copied;
                if (skipped_.empty())
                    return Vfs::removeRecursively(source, task.sourcePath);

                // Whatever was not copied has to survive in the source.
                if (auto removed = removeCopied(source, task.sourcePath); !removed)
                    return removed;
                return std::unexpected(SharedData::makeError(
                    ErrorKind::NotEmpty,
                    fmt::format(
                        "'{}' was moved partially, {} entries that are neither files nor directories stay in the "
                        "source, first '{}'",
                        task.sourcePath.generic_string(),
                        skipped_.size(),
                        skipped_.front().generic_string())));
            }

          private:
            std::expected<void, Error> copyFile(
                Vfs::Backend& source,
                Vfs::Backend& target,
                std::filesystem::path const& sourcePath,
                std::filesystem::path const& targetPath,
                std::string const& itemName)
            {
                if (cancelled())
                    return std::unexpected(cancelledError());

                auto reader = source.openRead(sourcePath);
                if (!reader)
                    return std::unexpected(std::move(reader).error());
                auto writer = target.openWrite(targetPath);
                if (!writer)
                    return std::unexpected(std::move(writer).error());

                for (bool firstChunk = true;; firstChunk = false)
                {
                    if (cancelled())
                        return std::unexpected(cancelledError());

                    const auto amount = (*reader)->read(buffer_.data(), buffer_.size());
                    if (!amount)
                        return std::unexpected(amount.error());
                    if (*amount == 0)
                        break;

                    // Reads may be shorter than the buffer, so only a further chunk proves the file is not done.
                    if (!firstChunk)
                        tracker_.report(itemName);

                    if (auto written = (*writer)->write(std::string_view{buffer_.data(), *amount}); !written)
                        return written;
                    tracker_.advance(*amount);
                }

                if (auto closed = (*writer)->close(); !closed)
                    return closed;

                tracker_.report(itemName);
                return {};
            }

            std::expected<void, Error> copyDirectory(
                Vfs::Backend& source,
                Vfs::Backend& target,
                std::filesystem::path const& sourcePath,
                std::filesystem::path const& targetPath)
            {
                if (cancelled())
                    return std::unexpected(cancelledError());

                if (auto created = target.createDirectory(targetPath); !created)
                    return created;

                auto listing = source.listEntries(sourcePath);
                if (!listing)
                    return std::unexpected(std::move(listing).error());

                while (true)
                {
                    auto next = (*listing)->next();
                    if (!next)
                        return std::unexpected(std::move(next).error());
                    if (!next->has_value())
                        break;

                    if (cancelled())
                        return std::unexpected(cancelledError());

                    auto const& entry = next->value();
                    const auto name = entry.path.filename().string();
                    const auto childSource = source.join(sourcePath, name);
                    const auto childTarget = target.join(targetPath, name);

                    std::expected<void, Error> result{};
                    if (entry.isDirectory())
                        result = copyDirectory(source, target, childSource, childTarget);
                    else if (entry.isRegularFile())
                        result = copyFile(source, target, childSource, childTarget, name);
                    else
                    {
                        Log::warn(
                            "TransferExecutor: Skipping '{}', only files and directories are copied.",
                            childSource.generic_string());
                        skipped_.push_back(childSource);
                        continue;
                    }

                    if (!result)
                        return result;
                }
                return {};
            }

            /**
             * @brief Removes the regular files and directories of a tree and keeps everything copyDirectory skipped,
             * together with the directories containing it.
             */
            std::expected<void, Error> removeCopied(Vfs::Backend& backend, std::filesystem::path const& directory)
            {
                auto entries = backend.listAll(directory);
                if (!entries)
                    return std::unexpected(std::move(entries).error());

                for (auto const& entry : *entries)
                {
                    const auto child = backend.join(directory, entry.path.filename().string());
                    std::expected<void, Error> result{};
                    if (entry.isDirectory())
                        result = removeCopied(backend, child);
                    else if (entry.isRegularFile())
                        result = backend.removeFile(child);
                    if (!result)
                        return result;
                }

                auto removed = backend.removeEmptyDirectory(directory);
                if (!removed && removed.error().kind == ErrorKind::NotEmpty)
                    return {};
                return removed;
            }

          private:
            std::vector<char> buffer_;
            std::vector<std::filesystem::path> skipped_{};
            ProgressTracker tracker_;
            ConflictPolicy policy_;
            CancellationToken const& token_;
        };
    }

    TransferStrategy strategyFor(Vfs::BackendKind source, Vfs::BackendKind target)
    {
        using enum Vfs::BackendKind;

        if (source == Local)
            return target == Local ? TransferStrategy::LocalToLocal : TransferStrategy::Upload;
        return target == Local ? TransferStrategy::Download : TransferStrategy::RemoteToRemote;
    }

    TransferExecutor::TransferExecutor(ExecutorOptions options)
        : options_{options}
        , taskStates_{}
    {}

    SharedData::TransferResult TransferExecutor::execute(
        TransferPlan const& plan,
        SharedData::TransferMode mode,
        TransferCallbacks const& callbacks,
        CancellationToken& token)
    {
        using enum TaskState;

        SharedData::TransferResult result{};
        Run run{options_.chunkSize, plan.totalBytes, callbacks, token};
        taskStates_.assign(plan.tasks.size(), Pending);

        for (std::size_t i = 0; i < plan.tasks.size(); ++i)
        {
            auto const& task = plan.tasks[i];
            auto& state = taskStates_[i];

            if (token.isCancelled())
            {
                result.cancelled = true;
                break;
            }

            const auto bytesBefore = run.tracker().transferredBytes();
            const auto reportsBefore = run.tracker().reportCount();
            // Every task reports once, unless its copy already reported everything it accounted for.
            const auto accountRemainder = [&run, &task, bytesBefore, reportsBefore]() {
                const auto done = run.tracker().transferredBytes() - bytesBefore;
                const bool advanced = done < task.bytes;
                if (advanced)
                    run.tracker().advance(task.bytes - done);
                if (advanced || run.tracker().reportCount() == reportsBefore)
                    run.tracker().report(task.displayName);
            };
            const auto fail = [&](Error const& error) {
                Log::error("TransferExecutor: '{}' failed: {}", task.displayName, error.toString());
                state = Failed;
                result.addFailure(task.displayName, error);
                accountRemainder();
            };

            state = ConflictCheck;
            if (targetLiesInSource(task))
            {
                fail(SharedData::makeError(
                    ErrorKind::InvalidTarget,
                    fmt::format(
                        "Cannot transfer '{}' into itself ('{}')",
                        task.sourcePath.generic_string(),
                        task.targetPath.generic_string())));
                continue;
            }

            const auto targetExists = task.targetBackend->exists(task.targetPath);
            if (!targetExists)
            {
                fail(targetExists.error());
                continue;
            }

            if (*targetExists)
            {
                const auto action = run.policy().resolve(SharedData::ConflictQuestion{
                    .displayName = task.displayName,
                    .sourcePath = task.sourcePath.generic_string(),
                    .targetPath = task.targetPath.generic_string(),
                    .sourceIsDirectory = task.isDirectory,
                    .targetIsDirectory = task.targetBackend->isDirectory(task.targetPath),
                });

                if (action == SharedData::ConflictAction::Cancel)
                {
                    Log::info("TransferExecutor: Cancelled at '{}' by the user.", task.displayName);
                    token.cancel();
                    result.cancelled = true;
                    break;
                }
                if (action == SharedData::ConflictAction::Skip)
                {
                    Log::info("TransferExecutor: Skipping existing '{}'.", task.targetPath.generic_string());
                    state = Skipped;
                    ++result.skippedCount;
                    accountRemainder();
                    continue;
                }

                if (auto removed = Vfs::removeRecursively(*task.targetBackend, task.targetPath); !removed)
                {
                    fail(removed.error());
                    continue;
                }
            }

            state = mode == SharedData::TransferMode::Move ? Moving : Copying;
            Log::debug(
                "TransferExecutor: {} '{}' to '{}' ({}).",
                state == Moving ? "Moving" : "Copying",
                task.sourcePath.generic_string(),
                task.targetPath.generic_string(),
                Utility::enumToString(strategyFor(task.sourceBackend->kind(), task.targetBackend->kind())));
            const auto outcome = state == Moving ? run.move(task) : run.copy(task);
            if (!outcome)
            {
                if (outcome.error().kind == ErrorKind::Cancelled)
                {
                    Log::info("TransferExecutor: Cancelled while transferring '{}'.", task.displayName);
                    state = Failed;
                    result.cancelled = true;
                    break;
                }
                fail(outcome.error());
                continue;
            }

            state = Done;
            ++result.successCount;
            accountRemainder();
        }

        if (!result.cancelled)
            run.tracker().complete({});

        Log::info(
            "TransferExecutor: {} done, {} skipped, {} failed{}.",
            result.successCount,
            result.skippedCount,
            result.failures.size(),
            result.cancelled ? ", cancelled" : "");
        return result;
    }
}
