#pragma once

#include <transfer/planner.hpp>
#include <vfs/local_backend.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fmt/format.h>

#include <fstream>
#include <iterator>
#include <string>
#include <vector>

extern std::filesystem::path programDirectory;

namespace Transfer::Test
{
    class TransferFixture : public ::testing::Test
    {
      protected:
        std::filesystem::path const& sourceRoot() const
        {
            return sourceDirectory_.path();
        }

        std::filesystem::path const& targetRoot() const
        {
            return targetDirectory_.path();
        }

        static std::filesystem::path writeFile(std::filesystem::path const& path, std::string const& content)
        {
            std::filesystem::create_directories(path.parent_path());
            std::ofstream{path, std::ios_base::binary} << content;
            return path;
        }

        static std::filesystem::path writeFile(std::filesystem::path const& path, std::size_t size, char fill = 'x')
        {
            return writeFile(path, std::string(size, fill));
        }

        static std::string readFile(std::filesystem::path const& path)
        {
            std::ifstream reader{path, std::ios_base::binary};
            return std::string{std::istreambuf_iterator<char>{reader}, std::istreambuf_iterator<char>{}};
        }

        static DisplayEntry select(std::filesystem::path const& path)
        {
            return DisplayEntry{.displayName = path.filename().string(), .sourcePath = path};
        }

        TransferPlan plan(
            std::vector<std::filesystem::path> const& paths,
            Vfs::Backend& source,
            Vfs::Backend& target,
            std::filesystem::path const& targetDirectory)
        {
            std::vector<DisplayEntry> selection{};
            for (auto const& path : paths)
                selection.push_back(select(path));

            auto result = planTransfer(selection, source, target, targetDirectory);
            EXPECT_TRUE(result.has_value());
            if (!result)
                return {};
            return std::move(result).value();
        }

        TransferPlan plan(std::vector<std::filesystem::path> const& paths)
        {
            return plan(paths, local_, local_, targetRoot());
        }

      protected:
        Utility::TemporaryDirectory sourceDirectory_{programDirectory / "temp_transfer", false};
        Utility::TemporaryDirectory targetDirectory_{programDirectory / "temp_transfer", false};
        Vfs::LocalBackend local_{};
    };
}
