#include "bsl_translate/frame_rate_tracker.hpp"
#include <algorithm>

namespace bsl {
namespace analysis {

FrameRateTracker::FrameRateTracker(size_t window)
    : window_(std::max<size_t>(2, window)) {}

double FrameRateTracker::record(uint64_t timestamp_ms)
{
    timestamps_.push_front(timestamp_ms);
    while (timestamps_.size() >= window_)
        timestamps_.pop_back();

    const uint64_t newest = timestamps_.front();
    const uint64_t oldest = timestamps_.back();
    if (newest <= oldest) {
        fps_ = -1.0;
        return fps_;
    }
    const double mean_interval = static_cast<double>(newest - oldest) /
                                 static_cast<double>(timestamps_.size());
    fps_ = 1000.0 / mean_interval;
    return fps_;
}

void FrameRateTracker::reset()
{
    timestamps_.clear();
    fps_ = -1.0;
}

} // namespace analysis
} // namespace bsl
