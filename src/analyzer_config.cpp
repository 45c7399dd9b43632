#include "bsl_translate/analyzer_config.hpp"
#include "bsl_translate/landmarks.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace bsl {
namespace analysis {

using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& j, const char* key, T& out)
{
    auto it = j.find(key);
    if (it != j.end() && !it->is_null())
        out = it->get<T>();
}

} // namespace

bool AnalyzerConfig::validate() const noexcept {
    if (frames_per_sign < 1) return false;
    if (concurrent_preds_required < 1) return false;
    if (frame_rate_window < 2) return false;
    if (transcript_length < 0) return false;
    if (stats_interval_frames < 0) return false;
    if (vocab_path.empty() || norm_stats_path.empty()) return false;
    if (extractor.max_hands < 1 || extractor.max_hands > landmarks::constants::kMaxHands) return false;
    if (extractor.min_detection_confidence < 0.0f || extractor.min_detection_confidence > 1.0f) return false;
    if (extractor.min_hand_presence < 0.0f || extractor.min_hand_presence > 1.0f) return false;
    if (extractor.num_threads < 1 || classifier.num_threads < 1) return false;
    return true;
}

size_t AnalyzerConfig::window_size() const
{
    return static_cast<size_t>(frames_per_sign) * landmarks::constants::kCoordsPerFrame;
}

bool AnalyzerConfig::load_from_file(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config] Failed to open: " << path << "\n";
        return false;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    if (!load_from_string(ss.str())) {
        std::cerr << "[Config] Invalid configuration in " << path << "\n";
        return false;
    }
    return true;
}

bool AnalyzerConfig::load_from_string(const std::string& json_text)
{
    AnalyzerConfig cfg = *this;
    try {
        json j = json::parse(json_text);
        if (!j.is_object()) {
            std::cerr << "[Config] Top level must be an object\n";
            return false;
        }

        read_key(j, "vocab_path", cfg.vocab_path);
        read_key(j, "norm_stats_path", cfg.norm_stats_path);
        read_key(j, "frames_per_sign", cfg.frames_per_sign);
        read_key(j, "concurrent_preds_required", cfg.concurrent_preds_required);
        read_key(j, "frame_rate_window", cfg.frame_rate_window);
        read_key(j, "transcript_length", cfg.transcript_length);
        read_key(j, "verbose", cfg.verbose);
        read_key(j, "stats_interval_frames", cfg.stats_interval_frames);

        auto ex = j.find("extractor");
        if (ex != j.end() && ex->is_object()) {
            read_key(*ex, "palm_model_path", cfg.extractor.palm_model_path);
            read_key(*ex, "landmark_model_path", cfg.extractor.landmark_model_path);
            read_key(*ex, "min_detection_confidence", cfg.extractor.min_detection_confidence);
            read_key(*ex, "min_hand_presence", cfg.extractor.min_hand_presence);
            read_key(*ex, "max_hands", cfg.extractor.max_hands);
            read_key(*ex, "palm_margin_pixels", cfg.extractor.palm_margin_pixels);
            read_key(*ex, "world_landmarks_output", cfg.extractor.world_landmarks_output);
            read_key(*ex, "presence_output", cfg.extractor.presence_output);
            read_key(*ex, "handedness_output", cfg.extractor.handedness_output);
            read_key(*ex, "num_threads", cfg.extractor.num_threads);
            read_key(*ex, "use_xnnpack", cfg.extractor.use_xnnpack);
            read_key(*ex, "verbose", cfg.extractor.verbose);
        }

        auto cl = j.find("classifier");
        if (cl != j.end() && cl->is_object()) {
            read_key(*cl, "model_path", cfg.classifier.model_path);
            read_key(*cl, "num_threads", cfg.classifier.num_threads);
            read_key(*cl, "use_xnnpack", cfg.classifier.use_xnnpack);
            read_key(*cl, "verbose", cfg.classifier.verbose);
        }
    } catch (const json::exception& e) {
        std::cerr << "[Config] JSON error: " << e.what() << "\n";
        return false;
    }

    if (!cfg.validate()) {
        std::cerr << "[Config] Validation failed\n";
        return false;
    }
    *this = cfg;
    return true;
}

std::string AnalyzerConfig::to_json_string() const
{
    json j;
    j["vocab_path"] = vocab_path;
    j["norm_stats_path"] = norm_stats_path;
    j["frames_per_sign"] = frames_per_sign;
    j["concurrent_preds_required"] = concurrent_preds_required;
    j["frame_rate_window"] = frame_rate_window;
    j["transcript_length"] = transcript_length;
    j["verbose"] = verbose;
    j["stats_interval_frames"] = stats_interval_frames;
    j["extractor"] = {
        {"palm_model_path", extractor.palm_model_path},
        {"landmark_model_path", extractor.landmark_model_path},
        {"min_detection_confidence", extractor.min_detection_confidence},
        {"min_hand_presence", extractor.min_hand_presence},
        {"max_hands", extractor.max_hands},
        {"palm_margin_pixels", extractor.palm_margin_pixels},
        {"world_landmarks_output", extractor.world_landmarks_output},
        {"presence_output", extractor.presence_output},
        {"handedness_output", extractor.handedness_output},
        {"num_threads", extractor.num_threads},
        {"use_xnnpack", extractor.use_xnnpack},
        {"verbose", extractor.verbose},
    };
    j["classifier"] = {
        {"model_path", classifier.model_path},
        {"num_threads", classifier.num_threads},
        {"use_xnnpack", classifier.use_xnnpack},
        {"verbose", classifier.verbose},
    };
    return j.dump(2);
}

bool AnalyzerConfig::save_to_file(const std::string& path) const
{
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config] Failed to save to: " << path << "\n";
        return false;
    }
    file << to_json_string() << "\n";
    return static_cast<bool>(file);
}

} // namespace analysis
} // namespace bsl
