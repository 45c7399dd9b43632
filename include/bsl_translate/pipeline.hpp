#pragma once
#include "bsl_translate/camera.hpp"
#include "bsl_translate/sign_analyzer.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace bsl
{
namespace pipeline
{

    // Produces the next frame, or nullptr when the source is exhausted.
    // The returned frame must stay valid until the next call.
    using FrameSupplier = std::function<const camera::Frame *()>;

    struct PipelineConfig
    {
        bool debug = false;
    };

    // Frame delivery with back-pressure: the source thread hands one frame
    // to the analysis worker and does not fetch another until the analyzer
    // has closed it.
    class Pipeline
    {
    public:
        Pipeline(const PipelineConfig &cfg,
                 FrameSupplier supplier,
                 analysis::SignAnalyzer &analyzer);
        ~Pipeline();
        void start();
        void stop();
        bool is_running() const;

        // Block until the source is exhausted and the last frame analyzed
        void wait();

        uint64_t frames_delivered() const { return frames_delivered_; }

    private:
        void source_thread_fn();
        void analysis_thread_fn();
        void on_frame_released();

        PipelineConfig config_;
        FrameSupplier supplier_;
        analysis::SignAnalyzer &analyzer_;

        // One frame in flight
        std::unique_ptr<camera::FrameProxy> slot_;
        bool frame_released_ = true;
        bool source_done_ = false;

        mutable std::mutex slot_mutex_;
        std::condition_variable slot_cv_;     // slot filled / source done
        std::condition_variable release_cv_;  // frame closed by the analyzer
        std::condition_variable done_cv_;     // both threads finished
        std::atomic<bool> running_{false};
        std::atomic<uint64_t> frames_delivered_{0};
        bool analysis_finished_ = false;
        std::thread source_thread_, analysis_thread_;
    };

} // namespace pipeline
} // namespace bsl
