#pragma once

#include <persistence/state_holder.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <fstream>
#include <tuple>

extern std::filesystem::path programDirectory;

namespace Persistence::Test
{
    class StateHolderTests : public ::testing::Test
    {
      protected:
        std::filesystem::path configFile() const
        {
            return directory_.path() / "config" / "twinpane.json";
        }

        void writeConfig(std::string const& content) const
        {
            std::filesystem::create_directories(configFile().parent_path());
            std::ofstream{configFile(), std::ios_base::binary} << content;
        }

        bool load(StateHolder& holder) const
        {
            bool loaded = false;
            holder.load([&loaded](bool success, StateHolder&) {
                loaded = success;
            });
            return loaded;
        }

      protected:
        Utility::TemporaryDirectory directory_{programDirectory / "temp_persistence", true};
    };

    TEST_F(StateHolderTests, MissingFileIsCreatedWithDefaults)
    {
        StateHolder holder{configFile()};
        ASSERT_TRUE(load(holder));
        EXPECT_TRUE(std::filesystem::exists(configFile()));
        EXPECT_EQ(holder.stateCache().transferOptions.chunkSize, 8192u);
        EXPECT_EQ(holder.stateCache().transferOptions.operationTimeoutSeconds, 30);
        EXPECT_EQ(holder.stateCache().defaultSshOptions.tryAgentForAuthentication, true);
    }

    TEST_F(StateHolderTests, CommentsAreAllowed)
    {
        writeConfig(R"({
            // the nas in the closet
            "sshSessionOptions": {"nas": {"host": "nas.local"}}
        })");
        StateHolder holder{configFile()};
        ASSERT_TRUE(load(holder));
        EXPECT_EQ(holder.stateCache().sshSessionOptions.at("nas").host, "nas.local");
    }

    TEST_F(StateHolderTests, ExistingValuesAreKept)
    {
        writeConfig(R"({"transferOptions": {"chunkSize": 1024}})");
        StateHolder holder{configFile()};
        ASSERT_TRUE(load(holder));
        EXPECT_EQ(holder.stateCache().transferOptions.chunkSize, 1024u);
        EXPECT_EQ(holder.stateCache().transferOptions.operationTimeoutSeconds, 30);
    }

    TEST_F(StateHolderTests, BrokenFileIsBackedUpAndReplaced)
    {
        writeConfig("{ this is not json");
        StateHolder holder{configFile()};
        ASSERT_TRUE(load(holder));

        int backups = 0;
        for (auto const& entry : std::filesystem::directory_iterator{configFile().parent_path()})
        {
            if (entry.path().filename().string().starts_with("twinpane.json.backup_"))
                ++backups;
        }
        EXPECT_EQ(backups, 1);

        std::ifstream reader{configFile()};
        EXPECT_NO_THROW(std::ignore = nlohmann::json::parse(reader));
    }

    TEST_F(StateHolderTests, SavedStateCanBeReloaded)
    {
        {
            StateHolder holder{configFile()};
            ASSERT_TRUE(load(holder));
            holder.stateCache().sshSessionOptions["web"] = SshSessionOptions{.host = "web1", .port = 2200};
            ASSERT_TRUE(holder.save());
        }
        StateHolder holder{configFile()};
        ASSERT_TRUE(load(holder));
        ASSERT_TRUE(holder.stateCache().sshSessionOptions.contains("web"));
        EXPECT_EQ(holder.stateCache().sshSessionOptions.at("web").port, 2200);
    }
}
