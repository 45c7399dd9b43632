#pragma once

#include "bsl_translate/classifier.hpp"
#include "bsl_translate/landmark_extractor_tflite.hpp"
#include <cstdint>
#include <string>

namespace bsl {
namespace analysis {

// Configuration for one analysis session
struct AnalyzerConfig {
    // Static resources
    std::string vocab_path{"assets/stream_cnn_3d_vocab.csv"};
    std::string norm_stats_path{"assets/stream_cnn_3d_norm_stats.csv"};

    // Temporal parameters
    int frames_per_sign{7};             // Frames in the classifier window
    int concurrent_preds_required{4};   // Agreeing frames before a label is shown
    int frame_rate_window{8};           // Arrival times kept for the fps estimate
    int transcript_length{6};           // Emitted labels remembered

    // Capabilities
    landmarks::TFLiteExtractorConfig extractor;
    classifier::TFLiteClassifierConfig classifier;

    // Logging
    bool verbose{false};
    int stats_interval_frames{300};     // Verbose stats every N analyzed frames (0 = off)

    // Load from JSON file; missing keys keep their defaults
    [[nodiscard]] bool load_from_file(const std::string& path);
    [[nodiscard]] bool load_from_string(const std::string& json_text);
    bool save_to_file(const std::string& path) const;
    std::string to_json_string() const;

    // Validation
    [[nodiscard]] bool validate() const noexcept;

    // Window length in floats
    size_t window_size() const;
};

} // namespace analysis
} // namespace bsl
