#include <transfer/progress_tracker.hpp>

#include <algorithm>

namespace Transfer
{
    ProgressTracker::ProgressTracker(std::uint64_t totalBytes, Callback callback)
        : total_{totalBytes}
        , transferred_{0}
        , lastReported_{0.0}
        , reportCount_{0}
        , callback_{std::move(callback)}
    {}

    void ProgressTracker::advance(std::uint64_t bytes)
    {
        transferred_ += bytes;
    }

    double ProgressTracker::percent() const
    {
        if (total_ == 0)
            return 100.0;
        const auto raw = static_cast<double>(transferred_) / static_cast<double>(total_) * 100.0;
        return std::clamp(raw, lastReported_, 100.0);
    }

    void ProgressTracker::report(std::string const& currentItem)
    {
        lastReported_ = percent();
        ++reportCount_;
        if (callback_)
            callback_(SharedData::TransferProgress{.percent = lastReported_, .currentItem = currentItem});
    }

    void ProgressTracker::complete(std::string const& currentItem)
    {
        lastReported_ = 100.0;
        ++reportCount_;
        if (callback_)
            callback_(SharedData::TransferProgress{.percent = lastReported_, .currentItem = currentItem});
    }
}
