#pragma once

#include <shared_data/file_operations/transfer_result.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace Transfer
{
    /**
     * @brief Turns transferred bytes into a percentage of the planned total. The reported value never decreases
     * and never exceeds 100. A total of 0 is always 100 percent.
     */
    class ProgressTracker
    {
      public:
        using Callback = std::function<void(SharedData::TransferProgress const&)>;

        ProgressTracker(std::uint64_t totalBytes, Callback callback);

        /**
         * @brief Accounts bytes without reporting.
         */
        void advance(std::uint64_t bytes);

        /**
         * @brief Reports the current percentage.
         */
        void report(std::string const& currentItem);

        /**
         * @brief Reports 100 percent.
         */
        void complete(std::string const& currentItem);

        double percent() const;

        std::uint64_t transferredBytes() const
        {
            return transferred_;
        }
        std::uint64_t totalBytes() const
        {
            return total_;
        }
        // Number of callbacks issued so far, complete included.
        std::size_t reportCount() const
        {
            return reportCount_;
        }

      private:
        std::uint64_t total_;
        std::uint64_t transferred_;
        double lastReported_;
        std::size_t reportCount_;
        Callback callback_;
    };
}
