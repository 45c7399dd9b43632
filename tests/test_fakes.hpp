#pragma once

#include "bsl_translate/camera.hpp"
#include "bsl_translate/classifier.hpp"
#include "bsl_translate/landmarks.hpp"
#include "bsl_translate/resources.hpp"
#include <atomic>
#include <deque>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

namespace test_fakes {

using bsl::landmarks::HandObservation;
using bsl::landmarks::Landmark;

// Hand with every landmark at (x, y, z)
inline HandObservation make_hand(const std::string& label, float confidence,
                                 float x = 0.0f, float y = 0.0f, float z = 0.0f)
{
    HandObservation hand;
    hand.handedness = label;
    hand.confidence = confidence;
    for (auto& lm : hand.landmarks)
        lm = Landmark(x, y, z);
    return hand;
}

// Identity normalization: mean 0, scale 1
inline bsl::analysis::NormalizationTable identity_norm()
{
    bsl::analysis::NormalizationTable norm;
    std::vector<float> means(bsl::landmarks::constants::kCoordsPerFrame, 0.0f);
    std::vector<float> scales(bsl::landmarks::constants::kCoordsPerFrame, 1.0f);
    bool ok = norm.assign(means, scales);
    (void)ok;
    return norm;
}

// Solid RGB888 frame
inline bsl::camera::Frame make_rgb_frame(uint32_t width, uint32_t height, uint8_t value)
{
    bsl::camera::Frame frame;
    frame.width = width;
    frame.height = height;
    frame.format = bsl::camera::PixelFormat::RGB888;
    frame.stride = static_cast<int>(width * 3);
    frame.data.assign(static_cast<size_t>(width) * height * 3, value);
    frame.size = frame.data.size();
    return frame;
}

inline bsl::analysis::Vocabulary small_vocab()
{
    bsl::analysis::Vocabulary vocab;
    std::istringstream in("0,<none>\n1,hello\n2,thanks\n3,please\n4,sorry\n");
    bool ok = vocab.load_from_stream(in);
    (void)ok;
    return vocab;
}

// Replays a scripted list of per-frame hand lists. Runs the callback on
// the submitting thread unless threaded is set.
class FakeExtractor : public bsl::landmarks::LandmarkExtractor {
public:
    explicit FakeExtractor(bool threaded = false) : threaded_(threaded) {}
    ~FakeExtractor() override { close(); }

    // Same contract as the TFLite extractor: init() is a no-op while open,
    // close() releases everything so a later init() starts over
    bool init() override {
        std::lock_guard<std::mutex> lock(mutex_);
        init_calls++;
        if (initialized)
            return true;
        if (!init_result)
            return false;
        initialized = true;
        open_ = true;
        return true;
    }

    bool submit(bsl::camera::Image image, uint64_t,
                bsl::landmarks::ExtractionCallback callback) override {
        std::vector<HandObservation> hands;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!open_)
                return false;
            submitted++;
            last_width = image.width;
            last_height = image.height;
            if (!image.pixels.empty())
                first_bytes.push_back(image.pixels[0]);
            if (!script.empty()) {
                hands = script.front();
                script.pop_front();
            }
        }
        if (threaded_) {
            if (worker_.joinable())
                worker_.join();
            worker_ = std::thread([cb = std::move(callback), hands]() mutable { cb(std::move(hands)); });
        } else {
            callback(std::move(hands));
        }
        return true;
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = false;
            initialized = false;
            closed = true;
        }
        if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
            worker_.join();
    }

    std::deque<std::vector<HandObservation>> script;
    bool init_result{true};
    bool initialized{false};
    int init_calls{0};
    std::atomic<bool> closed{false};
    std::atomic<int> submitted{0};
    uint32_t last_width{0};
    uint32_t last_height{0};
    std::vector<uint8_t> first_bytes;   // pixels[0] of each accepted image

private:
    bool threaded_;
    bool open_{false};
    std::mutex mutex_;
    std::thread worker_;
};

// Returns scripted top classes as one-hot score vectors
class FakeClassifier : public bsl::classifier::SequenceClassifier {
public:
    explicit FakeClassifier(size_t num_classes = 5) : num_classes_(num_classes) {}

    bool init() override { return init_result; }

    bool classify(const std::vector<float>& window, std::vector<float>& scores) override {
        calls++;
        last_window = window;
        if (fail_next) {
            fail_next = false;
            return false;
        }
        int top = next_class;
        if (!script.empty()) {
            top = script.front();
            script.pop_front();
        }
        scores.assign(num_classes_, 0.0f);
        if (top >= 0 && static_cast<size_t>(top) < num_classes_)
            scores[static_cast<size_t>(top)] = 1.0f;
        return true;
    }

    void close() override { closed = true; }

    std::deque<int> script;
    int next_class{0};
    bool fail_next{false};
    bool init_result{true};
    bool closed{false};
    int calls{0};
    std::vector<float> last_window;

private:
    size_t num_classes_;
};

} // namespace test_fakes
