#include "bsl_translate/pipeline.hpp"
#include <iostream>

namespace bsl
{
namespace pipeline
{

    Pipeline::Pipeline(const PipelineConfig &cfg,
                       FrameSupplier supplier,
                       analysis::SignAnalyzer &analyzer)
        : config_(cfg), supplier_(std::move(supplier)), analyzer_(analyzer)
    {
    }

    Pipeline::~Pipeline() { stop(); }

    void Pipeline::start()
    {
        if (running_)
            return;
        {
            std::lock_guard<std::mutex> lock(slot_mutex_);
            frame_released_ = true;
            source_done_ = false;
            analysis_finished_ = false;
        }
        running_ = true;
        source_thread_ = std::thread(&Pipeline::source_thread_fn, this);
        analysis_thread_ = std::thread(&Pipeline::analysis_thread_fn, this);
    }

    void Pipeline::stop()
    {
        {
            std::lock_guard<std::mutex> lock(slot_mutex_);
            running_ = false;
        }
        slot_cv_.notify_all();
        release_cv_.notify_all();
        done_cv_.notify_all();
        if (source_thread_.joinable())
            source_thread_.join();
        if (analysis_thread_.joinable())
            analysis_thread_.join();
        // An undelivered frame is closed here so the source is never left waiting
        std::unique_ptr<camera::FrameProxy> leftover;
        {
            std::lock_guard<std::mutex> lock(slot_mutex_);
            leftover = std::move(slot_);
        }
    }

    bool Pipeline::is_running() const { return running_; }

    void Pipeline::wait()
    {
        std::unique_lock<std::mutex> lock(slot_mutex_);
        done_cv_.wait(lock, [&]
                      { return analysis_finished_ || !running_; });
    }

    void Pipeline::on_frame_released()
    {
        {
            std::lock_guard<std::mutex> lock(slot_mutex_);
            frame_released_ = true;
        }
        release_cv_.notify_one();
    }

    void Pipeline::source_thread_fn()
    {
        while (running_)
        {
            const camera::Frame *frame = supplier_();
            if (!frame)
                break;

            std::unique_lock<std::mutex> lock(slot_mutex_);
            if (!running_)
                break;
            frame_released_ = false;
            slot_ = std::make_unique<camera::FrameProxy>(frame, [this]
                                                         { on_frame_released(); });
            frames_delivered_++;
            slot_cv_.notify_one();

            // Back-pressure: the frame buffer is reused by the supplier
            release_cv_.wait(lock, [&]
                             { return frame_released_ || !running_; });
        }

        {
            std::lock_guard<std::mutex> lock(slot_mutex_);
            source_done_ = true;
        }
        slot_cv_.notify_all();
        if (config_.debug)
            std::cerr << "[Pipeline] Source finished after " << frames_delivered_ << " frames\n";
    }

    void Pipeline::analysis_thread_fn()
    {
        while (true)
        {
            std::unique_ptr<camera::FrameProxy> proxy;
            {
                std::unique_lock<std::mutex> lock(slot_mutex_);
                slot_cv_.wait(lock, [&]
                              { return slot_ != nullptr || source_done_ || !running_; });
                if (!running_ || !slot_)
                    break;
                proxy = std::move(slot_);
            }
            analyzer_.analyze(*proxy);
            // Closes the frame if the analyzer did not
            proxy.reset();
        }

        {
            std::lock_guard<std::mutex> lock(slot_mutex_);
            analysis_finished_ = true;
        }
        done_cv_.notify_all();
        if (config_.debug)
            std::cerr << "[Pipeline] Analysis worker finished\n";
    }

} // namespace pipeline
} // namespace bsl
