#pragma once

#include <shared_data/shared_data.hpp>
#include <shared_data/error.hpp>
#include <utility/describe.hpp>

#include <string>
#include <vector>

namespace SharedData
{
    struct TransferFailure
    {
        std::string displayName{};
        ErrorKind kind{ErrorKind::Unknown};
        std::string errorMessage{};
    };
    BOOST_DESCRIBE_STRUCT(TransferFailure, (), (displayName, kind, errorMessage))

    /**
     * @brief Summary of one transfer or delete run.
     */
    struct TransferResult
    {
        int successCount{0};
        int skippedCount{0};
        std::vector<TransferFailure> failures{};
        bool cancelled{false};

        bool allSucceeded() const
        {
            return failures.empty() && !cancelled;
        }

        void addFailure(std::string displayName, Error const& error)
        {
            failures.push_back(TransferFailure{
                .displayName = std::move(displayName),
                .kind = error.kind,
                .errorMessage = error.toString(),
            });
        }
    };
    BOOST_DESCRIBE_STRUCT(TransferResult, (), (successCount, skippedCount, failures, cancelled))

    struct TransferProgress
    {
        double percent{0.0};
        std::string currentItem{};
    };
    BOOST_DESCRIBE_STRUCT(TransferProgress, (), (percent, currentItem))
}
