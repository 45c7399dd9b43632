#include "bsl_translate/sign_analyzer.hpp"
#include "bsl_translate/hand_assignment.hpp"
#include "bsl_translate/landmark_extractor_tflite.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>

using namespace std::chrono;

namespace bsl
{
namespace analysis
{

    namespace
    {
        uint64_t now_ms()
        {
            return static_cast<uint64_t>(
                duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
        }
    } // namespace

    SignAnalyzer::SignAnalyzer(const AnalyzerConfig &config,
                               Vocabulary vocab,
                               NormalizationTable norm,
                               std::unique_ptr<landmarks::LandmarkExtractor> extractor,
                               std::unique_ptr<classifier::SequenceClassifier> classifier)
        : config_(config),
          vocab_(std::move(vocab)),
          norm_(std::move(norm)),
          extractor_(std::move(extractor)),
          classifier_(std::move(classifier)),
          window_(config.frames_per_sign),
          debouncer_(static_cast<size_t>(std::max(1, config.concurrent_preds_required)),
                     static_cast<size_t>(std::max(0, config.transcript_length))),
          frame_rate_(static_cast<size_t>(std::max(2, config.frame_rate_window)))
    {
    }

    SignAnalyzer::~SignAnalyzer() { stop(); }

    bool SignAnalyzer::init()
    {
        if (initialized_)
            return running_;
        if (!config_.validate())
        {
            std::cerr << "[SignAnalyzer] Invalid configuration\n";
            return false;
        }
        if (vocab_.empty() || norm_.empty())
        {
            std::cerr << "[SignAnalyzer] Vocabulary and normalization stats are required\n";
            return false;
        }
        if (!extractor_ || !classifier_)
        {
            std::cerr << "[SignAnalyzer] Landmark extractor and classifier are required\n";
            return false;
        }
        if (!classifier_->init())
        {
            std::cerr << "[SignAnalyzer] Classifier initialization failed\n";
            return false;
        }
        if (!extractor_->init())
        {
            std::cerr << "[SignAnalyzer] Landmark extractor initialization failed\n";
            classifier_->close();
            return false;
        }

        {
            // A restarted session begins with an empty window and no label
            std::lock_guard<std::mutex> lock(session_mutex_);
            window_.clear();
            debouncer_.reset();
            frame_rate_.reset();
            scores_.clear();
        }
        initialized_ = true;
        running_ = true;
        state_ = AnalyzerState::IDLE;

        if (config_.verbose)
        {
            std::cerr << "[SignAnalyzer] Session started\n";
            std::cerr << "  Window: " << config_.frames_per_sign << " frames x "
                      << landmarks::constants::kCoordsPerFrame << " coords\n";
            std::cerr << "  Agreement: " << config_.concurrent_preds_required << " frames\n";
            std::cerr << "  Vocabulary: " << vocab_.size() << " signs\n";
        }
        return true;
    }

    void SignAnalyzer::stop()
    {
        {
            std::lock_guard<std::mutex> lock(session_mutex_);
            if (!running_ && !initialized_)
                return;
            running_ = false;
        }
        frame_done_cv_.notify_all();

        if (initialized_)
        {
            // The extractor worker may be inside on_landmarks, so it is joined unlocked
            extractor_->close();
            {
                std::lock_guard<std::mutex> lock(session_mutex_);
                classifier_->close();
            }
            initialized_ = false;
            if (config_.verbose)
            {
                std::lock_guard<std::mutex> lock(session_mutex_);
                std::cerr << "[SignAnalyzer] Session ended\n";
                log_stats_locked();
            }
        }
        state_ = AnalyzerState::IDLE;
    }

    void SignAnalyzer::analyze(camera::FrameProxy &frame)
    {
        // Nothing to publish to, so no analysis (the source still gets its frame back)
        if (!running_ || listener_count() == 0)
        {
            frame.close();
            std::lock_guard<std::mutex> lock(session_mutex_);
            stats_.frames_skipped++;
            return;
        }

        const uint64_t started_ms = now_ms();
        uint64_t frame_id = 0;
        {
            std::lock_guard<std::mutex> lock(session_mutex_);
            stats_.frames_received++;
            stats_.last_fps = frame_rate_.record(started_ms);
            frame_id = ++submitted_frame_;
        }
        state_ = AnalyzerState::AWAITING_EXTRACTION;

        camera::Image image;
        const bool copied = camera::utils::frame_to_image(frame.frame(), image);
        frame.close();

        bool accepted = false;
        if (copied)
        {
            accepted = extractor_->submit(std::move(image), started_ms,
                                          [this, frame_id, started_ms](std::vector<landmarks::HandObservation> hands)
                                          { on_landmarks(frame_id, started_ms, std::move(hands)); });
        }
        if (!accepted)
        {
            if (!running_)
                return;
            // Unusable pixels or a rejected submission: a frame without hands
            on_landmarks(frame_id, started_ms, {});
        }

        std::unique_lock<std::mutex> lock(session_mutex_);
        frame_done_cv_.wait(lock, [&]
                            { return completed_frame_ >= frame_id || !running_; });
    }

    void SignAnalyzer::on_landmarks(uint64_t frame_id, uint64_t started_ms,
                                    std::vector<landmarks::HandObservation> hands)
    {
        std::string output;
        {
            std::lock_guard<std::mutex> lock(session_mutex_);
            if (!running_)
                return;

            if (hands.empty())
            {
                window_.push_empty();
            }
            else
            {
                stats_.frames_with_hands++;
                process_hands(hands, frame_id);
            }
            output = debouncer_.output();
            state_ = AnalyzerState::PUBLISHING;
        }

        publish(output);

        {
            std::lock_guard<std::mutex> lock(session_mutex_);
            const double elapsed = static_cast<double>(now_ms() - started_ms);
            stats_.frames_analyzed++;
            stats_.avg_process_time_ms +=
                (elapsed - stats_.avg_process_time_ms) / static_cast<double>(stats_.frames_analyzed);
            completed_frame_ = std::max(completed_frame_, frame_id);
            state_ = AnalyzerState::IDLE;

            if (config_.verbose && config_.stats_interval_frames > 0 &&
                stats_.frames_analyzed % static_cast<uint64_t>(config_.stats_interval_frames) == 0)
                log_stats_locked();
        }
        frame_done_cv_.notify_all();
    }

    // Caller holds session_mutex_
    void SignAnalyzer::process_hands(const std::vector<landmarks::HandObservation> &hands, uint64_t frame_id)
    {
        const HandAssignment assignment = assign_hands(hands);
        if (!window_.push(normalize_frame(hands, assignment, norm_)))
            return;

        state_ = AnalyzerState::CLASSIFYING;
        if (!classifier_->classify(window_.data(), scores_))
        {
            stats_.classification_failures++;
            std::cerr << "[SignAnalyzer] Classification failed for frame " << frame_id << "\n";
            return;
        }
        const int top = classifier::top_class_index(scores_);
        if (top < 0)
        {
            stats_.classification_failures++;
            std::cerr << "[SignAnalyzer] Classifier returned no scores for frame " << frame_id << "\n";
            return;
        }
        stats_.classifications++;
        if (config_.verbose)
            std::cerr << "[SignAnalyzer] Prediction from frame " << frame_id << " is " << top << "\n";

        if (debouncer_.update(top, vocab_))
        {
            stats_.labels_emitted++;
            if (config_.verbose)
                std::cerr << "[SignAnalyzer] Output: " << debouncer_.output() << "\n";
        }
    }

    void SignAnalyzer::publish(const std::string &output)
    {
        for (const auto &listener : live_listeners())
        {
            if (*listener)
                (*listener)(output);
        }
    }

    void SignAnalyzer::add_listener(const std::shared_ptr<OutputListener> &listener)
    {
        if (!listener)
            return;
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners_.push_back(listener);
    }

    void SignAnalyzer::remove_listener(const std::shared_ptr<OutputListener> &listener)
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                        [&](const std::weak_ptr<OutputListener> &w)
                                        {
                                            auto l = w.lock();
                                            return !l || l == listener;
                                        }),
                         listeners_.end());
    }

    size_t SignAnalyzer::listener_count() const
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        return static_cast<size_t>(std::count_if(listeners_.begin(), listeners_.end(),
                                                 [](const std::weak_ptr<OutputListener> &w)
                                                 { return !w.expired(); }));
    }

    std::vector<std::shared_ptr<OutputListener>> SignAnalyzer::live_listeners()
    {
        std::vector<std::shared_ptr<OutputListener>> live;
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        auto it = listeners_.begin();
        while (it != listeners_.end())
        {
            if (auto l = it->lock())
            {
                live.push_back(std::move(l));
                ++it;
            }
            else
            {
                it = listeners_.erase(it);
            }
        }
        return live;
    }

    std::string SignAnalyzer::output() const
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        return debouncer_.output();
    }

    std::string SignAnalyzer::transcript() const
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        return debouncer_.transcript();
    }

    double SignAnalyzer::fps() const
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        return frame_rate_.fps();
    }

    AnalysisStats SignAnalyzer::get_stats() const
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        return stats_;
    }

    void SignAnalyzer::reset_stats()
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        stats_.reset();
    }

    std::vector<float> SignAnalyzer::window_snapshot() const
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        return window_.data();
    }

    std::vector<int> SignAnalyzer::prediction_history() const
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        const auto &h = debouncer_.history();
        return std::vector<int>(h.begin(), h.end());
    }

    std::string SignAnalyzer::state_to_string(AnalyzerState s)
    {
        switch (s)
        {
        case AnalyzerState::IDLE:
            return "Idle";
        case AnalyzerState::AWAITING_EXTRACTION:
            return "AwaitingExtraction";
        case AnalyzerState::CLASSIFYING:
            return "Classifying";
        case AnalyzerState::PUBLISHING:
            return "Publishing";
        default:
            return "Unknown";
        }
    }

    void SignAnalyzer::log_stats_locked() const
    {
        std::cerr << "[SignAnalyzer] Stats: received=" << stats_.frames_received
                  << " analyzed=" << stats_.frames_analyzed
                  << " skipped=" << stats_.frames_skipped
                  << " with_hands=" << stats_.frames_with_hands
                  << " classified=" << stats_.classifications
                  << " failed=" << stats_.classification_failures
                  << " emitted=" << stats_.labels_emitted
                  << " fps=" << stats_.last_fps
                  << " avg_ms=" << stats_.avg_process_time_ms << "\n";
    }

    std::unique_ptr<SignAnalyzer> create_analyzer(const AnalyzerConfig &config)
    {
        if (!config.validate())
        {
            std::cerr << "[SignAnalyzer] Invalid configuration\n";
            return nullptr;
        }

        Vocabulary vocab;
        if (!vocab.load_from_file(config.vocab_path))
            return nullptr;
        NormalizationTable norm;
        if (!norm.load_from_file(config.norm_stats_path))
            return nullptr;

        auto extractor = std::make_unique<landmarks::TFLiteLandmarkExtractor>(config.extractor);
        auto classifier = std::make_unique<classifier::TFLiteSequenceClassifier>(config.classifier,
                                                                                  config.window_size());
        auto analyzer = std::make_unique<SignAnalyzer>(config, std::move(vocab), std::move(norm),
                                                       std::move(extractor), std::move(classifier));
        if (!analyzer->init())
            return nullptr;
        return analyzer;
    }

} // namespace analysis
} // namespace bsl
