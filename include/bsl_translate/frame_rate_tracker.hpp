#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>

namespace bsl {
namespace analysis {

// Moving-average frame rate over recent arrival times (diagnostic only)
class FrameRateTracker {
public:
    explicit FrameRateTracker(size_t window = 8);

    // Record an arrival and return the updated estimate
    double record(uint64_t timestamp_ms);

    // Frames per second, or -1 while the span is empty
    double fps() const { return fps_; }
    size_t size() const { return timestamps_.size(); }
    void reset();

private:
    size_t window_;
    std::deque<uint64_t> timestamps_;  // newest at the front
    double fps_{-1.0};
};

} // namespace analysis
} // namespace bsl
