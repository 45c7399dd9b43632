#include "bsl_translate/coordinate_window.hpp"
#include <algorithm>
#include <iostream>

namespace bsl {
namespace analysis {

using landmarks::constants::kAxes;
using landmarks::constants::kLandmarksPerHand;
using landmarks::constants::kMaxHands;

std::vector<float> normalize_frame(const std::vector<landmarks::HandObservation>& hands,
                                   const HandAssignment& assignment,
                                   const NormalizationTable& norm)
{
    std::vector<float> frame(landmarks::constants::kCoordsPerFrame, 0.0f);
    const int slots[kMaxHands] = {assignment.left, assignment.right};

    for (int slot = 0; slot < kMaxHands; ++slot) {
        const int idx = slots[slot];
        if (idx == HandAssignment::kAbsent || idx >= static_cast<int>(hands.size()))
            continue;
        const auto& hand = hands[static_cast<size_t>(idx)];
        for (int lm = 0; lm < kLandmarksPerHand; ++lm) {
            const float raw[kAxes] = {hand.landmarks[lm].x, hand.landmarks[lm].y, hand.landmarks[lm].z};
            for (int axis = 0; axis < kAxes; ++axis) {
                const size_t out = static_cast<size_t>((axis * kMaxHands + slot) * kLandmarksPerHand + lm);
                frame[out] = norm.normalize(static_cast<size_t>(lm * kAxes + axis), raw[axis]);
            }
        }
    }
    return frame;
}

CoordinateWindow::CoordinateWindow(int frames_per_sign, int coords_per_frame)
    : frames_per_sign_(std::max(1, frames_per_sign)),
      coords_per_frame_(std::max(1, coords_per_frame)),
      data_(static_cast<size_t>(frames_per_sign_) * coords_per_frame_, 0.0f) {}

bool CoordinateWindow::push(const std::vector<float>& frame)
{
    if (frame.size() != static_cast<size_t>(coords_per_frame_)) {
        std::cerr << "[CoordinateWindow] Frame has " << frame.size()
                  << " values, expected " << coords_per_frame_ << "\n";
        return false;
    }
    shift_out_oldest();
    std::copy(frame.begin(), frame.end(), data_.end() - coords_per_frame_);
    ++frames_pushed_;
    return true;
}

void CoordinateWindow::push_empty()
{
    shift_out_oldest();
    std::fill(data_.end() - coords_per_frame_, data_.end(), 0.0f);
    ++frames_pushed_;
}

void CoordinateWindow::clear()
{
    std::fill(data_.begin(), data_.end(), 0.0f);
    frames_pushed_ = 0;
}

void CoordinateWindow::shift_out_oldest()
{
    std::copy(data_.begin() + coords_per_frame_, data_.end(), data_.begin());
}

} // namespace analysis
} // namespace bsl
