#include <app/main.hpp>
#include <app/console_conflict_presenter.hpp>
#include <app/pane_address.hpp>
#include <transfer/blocking_conflict_prompter.hpp>
#include <transfer/delete_operation.hpp>
#include <transfer/planner.hpp>
#include <transfer/transfer_session.hpp>
#include <vfs/file_operations.hpp>
#include <utility/format_bytes.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <future>
#include <iterator>

using namespace std::chrono_literals;

namespace
{
    constexpr int exitSuccess = 0;
    constexpr int exitFailures = 1;
    constexpr int exitUsage = 2;
    constexpr int exitCancelled = 130;

    std::atomic_bool interrupted{false};

    extern "C" void onInterrupt(int)
    {
        interrupted.store(true);
    }

    void installInterruptHandler()
    {
        struct sigaction action{};
        action.sa_handler = &onInterrupt;
        sigemptyset(&action.sa_mask);
        // No SA_RESTART, a blocking read of a conflict answer must return.
        action.sa_flags = 0;
        sigaction(SIGINT, &action, nullptr);
    }

    std::optional<std::string> readLine(std::FILE* input)
    {
        std::string line{};
        int c = 0;
        while ((c = std::fgetc(input)) != EOF && c != '\n')
            line.push_back(static_cast<char>(c));
        if (c == EOF && (line.empty() || std::ferror(input)))
            return std::nullopt;
        return line;
    }

    void printProgress(SharedData::TransferProgress const& progress)
    {
        fmt::print(stderr, "\r[{:5.1f}%] {:<60.60}", progress.percent, progress.currentItem);
        std::fflush(stderr);
    }
}

Main::Main(CommandLine commandLine, std::atomic_bool const& interrupted)
    : commandLine_{std::move(commandLine)}
    , interrupted_{interrupted}
    , stateHolder_{commandLine_.configFile.value_or(Persistence::StateHolder::defaultConfigPath())}
    , passwordPrompter_{}
    , askPassData_{.provider = &passwordPrompter_, .whatFor = "password or key phrase"}
    , local_{}
    , remotes_{}
{}

Main::~Main()
{
    remotes_.clear();
}

bool Main::loadConfig()
{
    bool loaded = false;
    stateHolder_.load([&loaded](bool success, Persistence::StateHolder& holder) {
        loaded = success;
        if (!success)
            return;
        auto const& state = holder.stateCache();
        Log::setupLogger(state.logLevel, state.logFile);
    });
    if (!loaded)
        Log::error("Main: Cannot load the configuration '{}'.", stateHolder_.configPath().string());
    return loaded;
}

std::expected<Vfs::Backend*, std::string> Main::remoteBackend(std::string const& sessionName)
{
    if (const auto iter = remotes_.find(sessionName); iter != remotes_.end())
        return iter->second.get();

    auto const& state = stateHolder_.stateCache();
    const auto options = state.sessionOptions(sessionName);
    if (!options)
        return std::unexpected(fmt::format("No session named '{}' in '{}'.", sessionName, stateHolder_.configPath().string()));

    Log::info("Main: Connecting to '{}'.", sessionName);
    auto backend = Vfs::connectRemote(
        *options,
        std::chrono::duration_cast<std::chrono::milliseconds>(state.transferOptions.effectiveOperationTimeout()),
        &askPassDefault,
        &askPassData_);
    if (!backend)
        return std::unexpected(fmt::format("Cannot connect to '{}': {}", sessionName, backend.error().toString()));

    auto* raw = backend->get();
    remotes_.emplace(sessionName, std::move(backend).value());
    return raw;
}

std::expected<Main::Location, std::string> Main::resolve(std::string const& address)
{
    const auto parsed = parsePaneAddress(address);
    if (!parsed)
        return std::unexpected(fmt::format("'{}' names no session.", address));

    if (!parsed->isRemote())
    {
        std::error_code ec;
        auto base = std::filesystem::current_path(ec);
        if (ec)
            base = "/";
        return Location{.backend = &local_, .path = local_.normalize(parsed->path, base)};
    }

    auto backend = remoteBackend(*parsed->sessionName);
    if (!backend)
        return std::unexpected(backend.error());
    auto* remote = remotes_.at(*parsed->sessionName).get();
    return Location{.backend = *backend, .path = remote->normalize(parsed->path, remote->homeDirectory())};
}

SharedData::TransferResult Main::superviseTransfer(Transfer::TransferPlan plan, SharedData::TransferMode mode)
{
    ConsoleConflictPresenter presenter{};
    Transfer::BlockingConflictPrompter prompter{[&presenter](SharedData::ConflictQuestion const& question) {
        presenter.present(question);
    }};

    Transfer::TransferCallbacks callbacks{.onProgress = &printProgress, .onConflict = prompter.asCallback()};
    if (commandLine_.onConflict)
    {
        const auto decision = *commandLine_.onConflict == "replace" ? SharedData::ConflictDecision::replaceAll()
                                                                    : SharedData::ConflictDecision::skipAll();
        callbacks.onConflict = [decision](SharedData::ConflictQuestion const&) {
            return decision;
        };
    }

    Transfer::TransferSession session{
        Transfer::ExecutorOptions{.chunkSize = stateHolder_.stateCache().transferOptions.effectiveChunkSize()}};
    auto future = session.start(std::move(plan), mode, std::move(callbacks));
    if (!future)
    {
        SharedData::TransferResult result{};
        result.addFailure("transfer", future.error());
        return result;
    }

    while (future->wait_for(100ms) != std::future_status::ready)
    {
        if (interrupted_.load() && !session.token().isCancelled())
        {
            fmt::print(stderr, "\nCancelling...\n");
            session.cancel();
            prompter.abandon();
        }

        auto question = presenter.takeQuestion();
        if (!question)
            continue;

        std::optional<SharedData::ConflictDecision> decision{};
        while (!decision)
        {
            fmt::print(stderr, "\n{}", formatConflictQuestion(*question));
            std::fflush(stderr);
            const auto line = readLine(stdin);
            if (!line || interrupted_.load())
                decision = SharedData::ConflictDecision::cancel();
            else
                decision = parseConflictAnswer(*line);
        }
        prompter.answer(*decision);
    }
    fmt::print(stderr, "\n");
    return future->get();
}

int Main::reportResult(SharedData::TransferResult const& result) const
{
    fmt::print("{} succeeded, {} skipped, {} failed{}\n",
               result.successCount,
               result.skippedCount,
               result.failures.size(),
               result.cancelled ? ", cancelled" : "");
    for (auto const& failure : result.failures)
        fmt::print("  {}: {}\n", failure.displayName, failure.errorMessage);

    if (result.cancelled)
        return exitCancelled;
    return result.failures.empty() ? exitSuccess : exitFailures;
}

int Main::runTransfer(SharedData::TransferMode mode)
{
    auto const& arguments = commandLine_.arguments;

    const auto target = resolve(arguments.back());
    if (!target)
    {
        fmt::print(stderr, "{}\n", target.error());
        return exitUsage;
    }
    if (!target->backend->isDirectory(target->path))
    {
        fmt::print(stderr, "'{}' is not a directory.\n", arguments.back());
        return exitUsage;
    }

    Vfs::Backend* source = nullptr;
    std::vector<Transfer::DisplayEntry> selection{};
    for (auto iter = arguments.begin(); iter != std::prev(arguments.end()); ++iter)
    {
        const auto location = resolve(*iter);
        if (!location)
        {
            fmt::print(stderr, "{}\n", location.error());
            return exitUsage;
        }
        if (source != nullptr && source != location->backend)
        {
            fmt::print(stderr, "All sources must be on the same side.\n");
            return exitUsage;
        }
        source = location->backend;
        selection.push_back(Transfer::DisplayEntry{
            .displayName = location->path.filename().string(),
            .sourcePath = location->path,
        });
    }

    auto plan = Transfer::planTransfer(selection, *source, *target->backend, target->path);
    if (!plan)
    {
        fmt::print(stderr, "{}\n", plan.error().toString());
        return exitFailures;
    }

    fmt::print(
        stderr,
        "{} {} item(s), {}\n",
        mode == SharedData::TransferMode::Move ? "Moving" : "Copying",
        plan->tasks.size(),
        Utility::formatBytes(plan->totalBytes));
    return reportResult(superviseTransfer(std::move(plan).value(), mode));
}

int Main::runDelete()
{
    Vfs::Backend* backend = nullptr;
    std::vector<Transfer::DisplayEntry> selection{};
    for (auto const& argument : commandLine_.arguments)
    {
        const auto location = resolve(argument);
        if (!location)
        {
            fmt::print(stderr, "{}\n", location.error());
            return exitUsage;
        }
        if (backend != nullptr && backend != location->backend)
        {
            fmt::print(stderr, "All paths must be on the same side.\n");
            return exitUsage;
        }
        backend = location->backend;
        selection.push_back(Transfer::DisplayEntry{.displayName = argument, .sourcePath = location->path});
    }

    Transfer::CancellationToken token{};
    auto future = std::async(std::launch::async, [backend, &selection, &token]() {
        return Transfer::deleteEntries(*backend, selection, token);
    });
    while (future.wait_for(100ms) != std::future_status::ready)
    {
        if (interrupted_.load())
            token.cancel();
    }
    return reportResult(future.get());
}

int Main::runMakeDirectory()
{
    const auto location = resolve(commandLine_.arguments[0]);
    if (!location)
    {
        fmt::print(stderr, "{}\n", location.error());
        return exitUsage;
    }

    const auto created = Vfs::createFolder(*location->backend, location->path, commandLine_.arguments[1]);
    if (!created)
    {
        fmt::print(stderr, "{}\n", created.error().toString());
        return exitFailures;
    }
    fmt::print("Created '{}'.\n", created->generic_string());
    return exitSuccess;
}

int Main::run()
{
    if (!loadConfig())
        return exitUsage;

    switch (commandLine_.command)
    {
        case Command::Copy:
            return runTransfer(SharedData::TransferMode::Copy);
        case Command::Move:
            return runTransfer(SharedData::TransferMode::Move);
        case Command::Delete:
            return runDelete();
        case Command::MakeDirectory:
            return runMakeDirectory();
        case Command::Help:
            break;
    }
    fmt::print("{}", usage());
    return exitSuccess;
}

int main(int argc, char** argv)
{
    Log::setupLogger(Log::Level::Warning);

    auto commandLine = parseCommandLine(argc, argv);
    if (!commandLine)
    {
        fmt::print(stderr, "{}\n\n{}", commandLine.error(), usage());
        return exitUsage;
    }
    if (commandLine->command == Command::Help)
    {
        fmt::print("{}", usage());
        return exitSuccess;
    }

    installInterruptHandler();

    Main app{std::move(commandLine).value(), interrupted};
    return app.run();
}
