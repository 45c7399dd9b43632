#pragma once

#include "bsl_translate/hand_assignment.hpp"
#include "bsl_translate/landmarks.hpp"
#include "bsl_translate/resources.hpp"
#include <cstdint>
#include <vector>

namespace bsl {
namespace analysis {

// Build one frame's contribution to the classifier window.
// Layout: [leftX(21), rightX(21), leftY(21), rightY(21), leftZ(21), rightZ(21)],
// i.e. axis-major, then hand, then landmark, matching the (3, 42) trailing
// dimensions of the model input. Absent hands contribute zeros.
std::vector<float> normalize_frame(const std::vector<landmarks::HandObservation>& hands,
                                   const HandAssignment& assignment,
                                   const NormalizationTable& norm);

// Fixed-length window over the last frames_per_sign frames, stored flat so
// that data() can be handed straight to the classifier. Zero-filled until
// enough frames have been pushed. Not thread-safe; the owner serializes.
class CoordinateWindow {
public:
    explicit CoordinateWindow(int frames_per_sign,
                              int coords_per_frame = landmarks::constants::kCoordsPerFrame);

    // Drop the oldest frame and append this one. Returns false (and leaves
    // the window untouched) if the frame has the wrong length.
    bool push(const std::vector<float>& frame);

    // Append an all-zero frame
    void push_empty();

    void clear();

    const std::vector<float>& data() const { return data_; }
    size_t size() const { return data_.size(); }
    int frames_per_sign() const { return frames_per_sign_; }
    int coords_per_frame() const { return coords_per_frame_; }
    uint64_t frames_pushed() const { return frames_pushed_; }

    // Pointer to the newest frame's coords_per_frame values
    const float* newest() const { return data_.data() + data_.size() - coords_per_frame_; }

private:
    int frames_per_sign_;
    int coords_per_frame_;
    std::vector<float> data_;
    uint64_t frames_pushed_{0};

    void shift_out_oldest();
};

} // namespace analysis
} // namespace bsl
