/**
 * @file landmark_extractor_tflite.hpp
 * @brief TensorFlow Lite hand landmark extraction
 *
 * Two-stage MediaPipe-style extraction: a palm detector with
 * post-processed outputs finds up to two hands, each palm crop is run
 * through the hand landmark model, and the world landmarks plus
 * handedness are returned as HandObservations. Inference runs on a
 * dedicated worker thread so submit() never blocks on the models.
 */

#pragma once

#include "bsl_translate/landmarks.hpp"
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace bsl {
namespace landmarks {

/**
 * @brief TFLite extractor configuration
 */
struct TFLiteExtractorConfig {
    // Model settings
    std::string palm_model_path{"models/palm_detection.tflite"};
    std::string landmark_model_path{"models/hand_landmark_full.tflite"};
    float min_detection_confidence{0.5f};   // Palm score threshold
    float min_hand_presence{0.5f};          // Landmark model presence threshold
    int max_hands{constants::kMaxHands};
    int palm_margin_pixels{20};             // Crop margin around each palm

    // Landmark model output tensor indices
    int world_landmarks_output{3};          // 63 floats, metres, hand-centred
    int presence_output{1};                 // 1 float
    int handedness_output{2};               // 1 float, probability of right hand

    // Hardware acceleration
    int num_threads{4};
    bool use_xnnpack{true};

    bool verbose{false};
};

// Type and size of one model output tensor
struct OutputTensorInfo {
    bool is_float32{false};
    size_t elements{0};
};

// Palm model must expose post-processed float outputs:
// 0 = boxes (4 per detection), 1 = scores, 2 = detection count
bool palm_outputs_usable(const std::vector<OutputTensorInfo>& outputs);

// Landmark model outputs named in the config must exist and be float:
// 63 world coordinates, one presence value, one handedness value
bool landmark_outputs_usable(const std::vector<OutputTensorInfo>& outputs,
                             const TFLiteExtractorConfig& config);

// Map the model's right-hand probability to a label and the probability
// of that label. 0.5 and above is "Right".
void decode_handedness(float right_probability, std::string& label, float& confidence);

// Forward declaration
struct TFLiteLandmarkExtractorImpl;

/**
 * @brief LandmarkExtractor backed by TFLite palm + landmark models
 */
class TFLiteLandmarkExtractor : public LandmarkExtractor {
public:
    explicit TFLiteLandmarkExtractor(const TFLiteExtractorConfig& config);
    ~TFLiteLandmarkExtractor() override;

    /**
     * @brief Load both models, build interpreters, start the worker
     * @return true if successful, false otherwise
     */
    bool init() override;

    /**
     * @brief Queue one upright RGB888 image; replaces a job that has not
     *        started yet
     */
    bool submit(camera::Image image, uint64_t timestamp_ms,
                ExtractionCallback callback) override;

    /**
     * @brief Stop the worker; the pending job (if any) is dropped
     */
    void close() override;

    /**
     * @brief Run both stages synchronously on the calling thread
     */
    std::vector<HandObservation> extract(const camera::Image& image);

    const TFLiteExtractorConfig& get_config() const { return config_; }

private:
    struct Job {
        camera::Image image;
        uint64_t timestamp_ms{0};
        ExtractionCallback callback;
    };

    struct PalmBox {
        int x, y, width, height;
        float score;
    };

    TFLiteExtractorConfig config_;
    std::unique_ptr<TFLiteLandmarkExtractorImpl> impl_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::unique_ptr<Job> pending_;
    bool running_{false};
    std::thread worker_;

    void worker_fn();
    std::vector<PalmBox> detect_palms(const camera::Image& image);
    bool run_landmarks(const camera::Image& image, const PalmBox& palm,
                       HandObservation& out);

    // Disable copy
    TFLiteLandmarkExtractor(const TFLiteLandmarkExtractor&) = delete;
    TFLiteLandmarkExtractor& operator=(const TFLiteLandmarkExtractor&) = delete;
};

} // namespace landmarks
} // namespace bsl
