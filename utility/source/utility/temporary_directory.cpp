#include <utility/temporary_directory.hpp>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/format.h>

#include <stdexcept>
#include <system_error>

namespace Utility
{
    namespace
    {
        constexpr int maxCreationAttempts = 16;
    }

    TemporaryDirectory::TemporaryDirectory()
        : TemporaryDirectory{std::filesystem::temp_directory_path() / "twinpane", false}
    {}

    TemporaryDirectory::TemporaryDirectory(std::filesystem::path basePath, bool removeBaseOnExit)
        : basePath_{std::move(basePath)}
        , removeBaseOnExit_{removeBaseOnExit}
    {
        std::error_code ec;
        std::filesystem::create_directories(basePath_, ec);
        if (ec)
            throw std::runtime_error(fmt::format("Cannot create '{}': {}", basePath_.string(), ec.message()));

        boost::uuids::random_generator generator{};
        for (int attempt = 0; attempt < maxCreationAttempts; ++attempt)
        {
            auto candidate = basePath_ / ("tmp-" + boost::uuids::to_string(generator()).substr(0, 8));
            // create_directory reports false when the name is already taken.
            if (std::filesystem::create_directory(candidate, ec))
            {
                path_ = std::filesystem::weakly_canonical(candidate, ec);
                if (ec)
                    path_ = std::move(candidate);
                return;
            }
            if (ec)
                break;
        }
        throw std::runtime_error(fmt::format("Cannot create a temporary directory in '{}'", basePath_.string()));
    }

    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code ec;
        if (!path_.empty())
            std::filesystem::remove_all(path_, ec);
        // remove() refuses non empty directories, other temporaries in the base stay intact.
        if (removeBaseOnExit_)
            std::filesystem::remove(basePath_, ec);
    }
}
