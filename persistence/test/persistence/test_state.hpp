#pragma once

#include <persistence/state/state.hpp>

#include <gtest/gtest.h>

namespace Persistence::Test
{
    class StateTests : public ::testing::Test
    {};

    TEST_F(StateTests, SessionOptionsInheritDefaults)
    {
        State state{};
        state.defaultSshOptions.tryAgentForAuthentication = true;
        state.defaultSshOptions.connectTimeoutSeconds = 10;
        state.sshSessionOptions["build"] = SshSessionOptions{
            .host = "build.example.org",
            .sshOptions = SshOptions{.connectTimeoutSeconds = 3},
        };

        const auto options = state.sessionOptions("build");
        ASSERT_TRUE(options.has_value());
        EXPECT_EQ(options->host, "build.example.org");
        EXPECT_EQ(options->sshOptions.tryAgentForAuthentication, true);
        EXPECT_EQ(options->sshOptions.connectTimeoutSeconds, 3);
    }

    TEST_F(StateTests, UnknownSessionIsNullopt)
    {
        State state{};
        EXPECT_FALSE(state.sessionOptions("nope").has_value());
    }

    TEST_F(StateTests, CanReadStateFromJson)
    {
        const auto j = nlohmann::json::parse(R"({
            "sshSessionOptions": {
                "nas": {"host": "10.0.0.2", "port": 2222, "user": "pi", "defaultDirectory": "/srv"}
            },
            "transferOptions": {"chunkSize": 4096},
            "logLevel": "debug",
            "logFile": "/tmp/twinpane.log"
        })");

        const auto state = j.get<State>();
        ASSERT_EQ(state.sshSessionOptions.size(), 1u);
        auto const& nas = state.sshSessionOptions.at("nas");
        EXPECT_EQ(nas.host, "10.0.0.2");
        EXPECT_EQ(nas.port, 2222);
        EXPECT_EQ(nas.user, "pi");
        EXPECT_EQ(nas.defaultDirectory, "/srv");
        EXPECT_FALSE(nas.password.has_value());
        EXPECT_EQ(state.transferOptions.chunkSize, 4096u);
        EXPECT_FALSE(state.transferOptions.operationTimeoutSeconds.has_value());
        EXPECT_EQ(state.logLevel, Log::Level::Debug);
        EXPECT_EQ(state.logFile, std::filesystem::path{"/tmp/twinpane.log"});
    }

    TEST_F(StateTests, NullValuesAreTreatedAsAbsent)
    {
        const auto j = nlohmann::json::parse(R"({"host": "a", "port": null})");
        const auto options = j.get<SshSessionOptions>();
        EXPECT_FALSE(options.port.has_value());
    }

    TEST_F(StateTests, AbsentOptionalsAreNotWritten)
    {
        const nlohmann::json j = SshSessionOptions{.host = "a"};
        EXPECT_FALSE(j.contains("port"));
        EXPECT_FALSE(j.contains("password"));
        EXPECT_EQ(j.at("host"), "a");
    }

    TEST_F(StateTests, TransferOptionsFallBackToDefaults)
    {
        TransferOptions options{};
        EXPECT_EQ(options.effectiveChunkSize(), 8192u);
        EXPECT_EQ(options.effectiveOperationTimeout(), std::chrono::seconds{30});

        options.chunkSize = 0;
        options.operationTimeoutSeconds = -5;
        EXPECT_EQ(options.effectiveChunkSize(), 8192u);
        EXPECT_EQ(options.effectiveOperationTimeout(), std::chrono::seconds{30});

        options.chunkSize = 100;
        options.operationTimeoutSeconds = 2;
        EXPECT_EQ(options.effectiveChunkSize(), 100u);
        EXPECT_EQ(options.effectiveOperationTimeout(), std::chrono::seconds{2});
    }

    TEST_F(StateTests, LogLevelNamesAreCaseInsensitive)
    {
        EXPECT_EQ(Log::levelFromString("WARNING"), Log::Level::Warning);
        EXPECT_EQ(Log::levelFromString("Trace"), Log::Level::Trace);
        EXPECT_EQ(Log::levelFromString("verbose"), Log::Level::Info);
        EXPECT_EQ(Log::levelToString(Log::Level::Critical), "critical");
    }

    TEST_F(StateTests, LogLevelIsWrittenByName)
    {
        State state{};
        state.logLevel = Log::Level::Error;
        const nlohmann::json j = state;
        EXPECT_EQ(j.at("logLevel"), "error");
    }
}
