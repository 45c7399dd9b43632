#pragma once

#include "bsl_translate/camera.hpp"
#include <array>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace bsl {
namespace landmarks {

// Named constants shared by every stage that touches landmark data
namespace constants {
    constexpr int kLandmarksPerHand = 21;
    constexpr int kAxes = 3;
    constexpr int kMaxHands = 2;
    constexpr int kCoordsPerFrame = kAxes * kLandmarksPerHand * kMaxHands; // 126
    constexpr const char* kLeftLabel = "Left";
    constexpr const char* kRightLabel = "Right";
} // namespace constants

// 3D keypoint in hand-relative (world) space
struct Landmark {
    float x;
    float y;
    float z;

    Landmark() : x(0.0f), y(0.0f), z(0.0f) {}
    Landmark(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}
};

// One detected hand for one frame
struct HandObservation {
    std::array<Landmark, constants::kLandmarksPerHand> landmarks;   // MediaPipe order, wrist first
    std::string handedness;   // "Left" or "Right"
    float confidence{0.0f};   // Handedness confidence [0, 1]
};

// Invoked once per submitted image with 0-2 observations
using ExtractionCallback = std::function<void(std::vector<HandObservation>)>;

// Hand pose estimation capability. Implementations own their native
// handles: init() once, close() on session teardown.
class LandmarkExtractor {
public:
    virtual ~LandmarkExtractor() = default;

    virtual bool init() = 0;

    // Queue an image for extraction. The image is owned by the extractor
    // from here on; the callback may run on another thread. Returns false
    // if the image could not be accepted (extractor closed or not
    // initialized), in which case the callback is never invoked.
    virtual bool submit(camera::Image image, uint64_t timestamp_ms,
                        ExtractionCallback callback) = 0;

    // Stop accepting work. Results still in flight are dropped.
    virtual void close() = 0;
};

} // namespace landmarks
} // namespace bsl
