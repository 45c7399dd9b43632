#pragma once

#include "bsl_translate/analyzer_config.hpp"
#include "bsl_translate/camera.hpp"
#include "bsl_translate/classifier.hpp"
#include "bsl_translate/coordinate_window.hpp"
#include "bsl_translate/frame_rate_tracker.hpp"
#include "bsl_translate/landmarks.hpp"
#include "bsl_translate/prediction_debouncer.hpp"
#include "bsl_translate/resources.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace bsl {
namespace analysis {

// Receives the current output string once per analyzed frame
using OutputListener = std::function<void(const std::string&)>;

enum class AnalyzerState {
    IDLE,
    AWAITING_EXTRACTION,
    CLASSIFYING,
    PUBLISHING
};

// Session statistics
struct AnalysisStats {
    uint64_t frames_received{0};
    uint64_t frames_skipped{0};         // No listeners, or session not running
    uint64_t frames_analyzed{0};
    uint64_t frames_with_hands{0};
    uint64_t classifications{0};
    uint64_t classification_failures{0};
    uint64_t labels_emitted{0};
    double last_fps{-1.0};
    double avg_process_time_ms{0.0};

    void reset() noexcept {
        frames_received = 0;
        frames_skipped = 0;
        frames_analyzed = 0;
        frames_with_hands = 0;
        classifications = 0;
        classification_failures = 0;
        labels_emitted = 0;
        last_fps = -1.0;
        avg_process_time_ms = 0.0;
    }
};

// Per-frame driver: frame -> landmarks -> window -> classifier -> debounce
// -> listeners. Owns the analysis session. Listeners are held weakly; the
// caller keeps the shared_ptr alive for as long as it wants updates.
class SignAnalyzer {
public:
    SignAnalyzer(const AnalyzerConfig& config,
                 Vocabulary vocab,
                 NormalizationTable norm,
                 std::unique_ptr<landmarks::LandmarkExtractor> extractor,
                 std::unique_ptr<classifier::SequenceClassifier> classifier);
    ~SignAnalyzer();

    // Initialize both capabilities and open the session
    bool init();

    // End the session: in-flight results are dropped, capabilities released
    void stop();

    bool is_running() const { return running_; }

    // Analyze one frame. The frame is closed as soon as its pixels are
    // copied; the call returns once this frame's result has been published
    // (or the session has ended).
    void analyze(camera::FrameProxy& frame);

    void add_listener(const std::shared_ptr<OutputListener>& listener);
    void remove_listener(const std::shared_ptr<OutputListener>& listener);
    size_t listener_count() const;

    AnalyzerState state() const { return state_; }
    std::string output() const;
    std::string transcript() const;
    double fps() const;

    AnalysisStats get_stats() const;
    void reset_stats();

    // Snapshots of session state
    std::vector<float> window_snapshot() const;
    std::vector<int> prediction_history() const;

    const AnalyzerConfig& get_config() const { return config_; }

    static std::string state_to_string(AnalyzerState s);

private:
    AnalyzerConfig config_;
    const Vocabulary vocab_;
    const NormalizationTable norm_;
    std::unique_ptr<landmarks::LandmarkExtractor> extractor_;
    std::unique_ptr<classifier::SequenceClassifier> classifier_;

    // Session state, single writer under session_mutex_
    mutable std::mutex session_mutex_;
    std::condition_variable frame_done_cv_;
    CoordinateWindow window_;
    PredictionDebouncer debouncer_;
    FrameRateTracker frame_rate_;
    AnalysisStats stats_;
    uint64_t submitted_frame_{0};
    uint64_t completed_frame_{0};
    std::vector<float> scores_;

    mutable std::mutex listeners_mutex_;
    std::vector<std::weak_ptr<OutputListener>> listeners_;

    std::atomic<AnalyzerState> state_{AnalyzerState::IDLE};
    std::atomic<bool> running_{false};
    bool initialized_{false};

    void on_landmarks(uint64_t frame_id, uint64_t started_ms, std::vector<landmarks::HandObservation> hands);
    void process_hands(const std::vector<landmarks::HandObservation>& hands, uint64_t frame_id);
    void publish(const std::string& output);
    std::vector<std::shared_ptr<OutputListener>> live_listeners();
    void log_stats_locked() const;

    // Disable copy
    SignAnalyzer(const SignAnalyzer&) = delete;
    SignAnalyzer& operator=(const SignAnalyzer&) = delete;
};

// Load resources, build the TFLite capabilities and initialize.
// Returns nullptr if anything required for a session is missing.
std::unique_ptr<SignAnalyzer> create_analyzer(const AnalyzerConfig& config);

} // namespace analysis
} // namespace bsl
