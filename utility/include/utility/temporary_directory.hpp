#pragma once

#include <filesystem>

namespace Utility
{
    /**
     * @brief A freshly created, uniquely named directory that is removed with all its content on destruction.
     */
    class TemporaryDirectory
    {
      public:
        TemporaryDirectory();

        /**
         * @param basePath Parent of the temporary directory. Created when missing.
         * @param removeBaseOnExit Also removes basePath on destruction, but only if it is empty by then.
         */
        TemporaryDirectory(std::filesystem::path basePath, bool removeBaseOnExit);
        ~TemporaryDirectory();

        TemporaryDirectory(TemporaryDirectory const&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory const&) = delete;
        TemporaryDirectory(TemporaryDirectory&&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory&&) = delete;

        std::filesystem::path const& path() const
        {
            return path_;
        }

      private:
        std::filesystem::path basePath_;
        std::filesystem::path path_{};
        bool removeBaseOnExit_;
    };
}
