#pragma once

#include <app/command_line.hpp>
#include <app/password/console_password_prompter.hpp>
#include <persistence/state_holder.hpp>
#include <transfer/transfer_plan.hpp>
#include <shared_data/file_operations/transfer_mode.hpp>
#include <shared_data/file_operations/transfer_result.hpp>
#include <vfs/local_backend.hpp>
#include <vfs/remote_backend.hpp>

#include <atomic>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

class Main
{
  public:
    Main(CommandLine commandLine, std::atomic_bool const& interrupted);
    ~Main();

    Main(Main const&) = delete;
    Main& operator=(Main const&) = delete;
    Main(Main&&) = delete;
    Main& operator=(Main&&) = delete;

    /**
     * @return The process exit code.
     */
    int run();

  private:
    struct Location
    {
        Vfs::Backend* backend;
        std::filesystem::path path;
    };

    bool loadConfig();
    std::expected<Location, std::string> resolve(std::string const& address);
    std::expected<Vfs::Backend*, std::string> remoteBackend(std::string const& sessionName);

    int runTransfer(SharedData::TransferMode mode);
    int runDelete();
    int runMakeDirectory();

    SharedData::TransferResult superviseTransfer(Transfer::TransferPlan plan, SharedData::TransferMode mode);
    int reportResult(SharedData::TransferResult const& result) const;

  private:
    CommandLine commandLine_;
    std::atomic_bool const& interrupted_;
    Persistence::StateHolder stateHolder_;
    ConsolePasswordPrompter passwordPrompter_;
    AskPassUserData askPassData_;
    Vfs::LocalBackend local_;
    std::unordered_map<std::string, std::unique_ptr<Vfs::RemoteBackend>> remotes_;
};
