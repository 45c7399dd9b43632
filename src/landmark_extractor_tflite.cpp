/**
 * @file landmark_extractor_tflite.cpp
 * @brief TensorFlow Lite hand landmark extraction
 *
 * Palm detection (post-processed SSD outputs: boxes, scores, count) followed
 * by the 21-point hand landmark model on each palm crop. World landmarks are
 * reported, which are hand-centred and independent of where the hand is in
 * the image.
 */

#define BSL_TRANSLATE_DEBUG_TIMING 0
#include "bsl_translate/landmark_extractor_tflite.hpp"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <iostream>

#include <tensorflow/lite/interpreter.h>
#include <tensorflow/lite/kernels/register.h>
#include <tensorflow/lite/model.h>

#ifdef BSL_TRANSLATE_USE_XNNPACK
#include <tensorflow/lite/delegates/xnnpack/xnnpack_delegate.h>
#endif

namespace bsl {
namespace landmarks {

namespace {

#ifdef BSL_TRANSLATE_USE_XNNPACK
using DelegatePtr = std::unique_ptr<TfLiteDelegate, decltype(&TfLiteXNNPackDelegateDelete)>;
#endif

struct ModelHandle {
    std::unique_ptr<tflite::FlatBufferModel> model;
#ifdef BSL_TRANSLATE_USE_XNNPACK
    // Must outlive the interpreter
    DelegatePtr delegate{nullptr, &TfLiteXNNPackDelegateDelete};
#endif
    std::unique_ptr<tflite::Interpreter> interpreter;
};

bool load_model(const std::string& path, const TFLiteExtractorConfig& config, ModelHandle& handle)
{
    handle.model = tflite::FlatBufferModel::BuildFromFile(path.c_str());
    if (!handle.model) {
        std::cerr << "[TFLiteLandmarkExtractor] Failed to load model: " << path << std::endl;
        return false;
    }
    tflite::ops::builtin::BuiltinOpResolver resolver;
    tflite::InterpreterBuilder builder(*handle.model, resolver);
    if (builder(&handle.interpreter) != kTfLiteOk || !handle.interpreter) {
        std::cerr << "[TFLiteLandmarkExtractor] Failed to create interpreter for " << path << std::endl;
        return false;
    }
    handle.interpreter->SetNumThreads(config.num_threads);

#ifdef BSL_TRANSLATE_USE_XNNPACK
    if (config.use_xnnpack) {
        TfLiteXNNPackDelegateOptions opts = TfLiteXNNPackDelegateOptionsDefault();
        opts.num_threads = config.num_threads;
        handle.delegate.reset(TfLiteXNNPackDelegateCreate(&opts));
        if (handle.interpreter->ModifyGraphWithDelegate(handle.delegate.get()) != kTfLiteOk) {
            std::cerr << "[TFLiteLandmarkExtractor] XNNPACK delegate rejected, using CPU kernels" << std::endl;
        }
    }
#endif

    if (handle.interpreter->AllocateTensors() != kTfLiteOk) {
        std::cerr << "[TFLiteLandmarkExtractor] Failed to allocate tensors for " << path << std::endl;
        return false;
    }
    return true;
}

// Fill an RGB input tensor from an RGB888 image region resized to the tensor size
bool fill_input(TfLiteTensor* tensor, const uint8_t* rgb, uint32_t w, uint32_t h)
{
    if (!tensor || tensor->dims->size != 4 || tensor->dims->data[3] != 3)
        return false;
    const uint32_t in_h = static_cast<uint32_t>(tensor->dims->data[1]);
    const uint32_t in_w = static_cast<uint32_t>(tensor->dims->data[2]);

    if (tensor->type == kTfLiteUInt8) {
        camera::utils::resize_bilinear(rgb, tensor->data.uint8, w, h, in_w, in_h, 3);
        return true;
    }
    if (tensor->type == kTfLiteFloat32) {
        std::vector<uint8_t> tmp(static_cast<size_t>(in_w) * in_h * 3);
        camera::utils::resize_bilinear(rgb, tmp.data(), w, h, in_w, in_h, 3);
        float* dst = tensor->data.f;
        for (size_t i = 0; i < tmp.size(); ++i)
            dst[i] = tmp[i] / 255.0f;
        return true;
    }
    return false;
}

size_t element_count(const TfLiteTensor* tensor)
{
    size_t n = 1;
    for (int i = 0; i < tensor->dims->size; ++i)
        n *= static_cast<size_t>(tensor->dims->data[i]);
    return n;
}

std::vector<OutputTensorInfo> describe_outputs(const tflite::Interpreter& interp)
{
    std::vector<OutputTensorInfo> infos;
    for (size_t i = 0; i < interp.outputs().size(); ++i) {
        const TfLiteTensor* tensor = interp.output_tensor(i);
        OutputTensorInfo info;
        if (tensor) {
            info.is_float32 = tensor->type == kTfLiteFloat32;
            info.elements = element_count(tensor);
        }
        infos.push_back(info);
    }
    return infos;
}

// Interpreter first, then the delegate it uses, then the model it reads
void release_model(ModelHandle& handle)
{
    handle.interpreter.reset();
#ifdef BSL_TRANSLATE_USE_XNNPACK
    handle.delegate.reset();
#endif
    handle.model.reset();
}

bool float_output(const std::vector<OutputTensorInfo>& outputs, int index, size_t min_elements)
{
    if (index < 0 || static_cast<size_t>(index) >= outputs.size())
        return false;
    const auto& info = outputs[static_cast<size_t>(index)];
    return info.is_float32 && info.elements >= min_elements;
}

} // namespace

bool palm_outputs_usable(const std::vector<OutputTensorInfo>& outputs)
{
    if (outputs.size() < 3) {
        std::cerr << "[TFLiteLandmarkExtractor] Palm model has " << outputs.size()
                  << " outputs, expected boxes, scores and count" << std::endl;
        return false;
    }
    if (!float_output(outputs, 0, 4) || !float_output(outputs, 1, 1) || !float_output(outputs, 2, 1)) {
        std::cerr << "[TFLiteLandmarkExtractor] Palm model outputs must be non-empty float32" << std::endl;
        return false;
    }
    if (outputs[0].elements < 4 * outputs[1].elements) {
        std::cerr << "[TFLiteLandmarkExtractor] Palm boxes output holds " << outputs[0].elements
                  << " values for " << outputs[1].elements << " scores" << std::endl;
        return false;
    }
    return true;
}

bool landmark_outputs_usable(const std::vector<OutputTensorInfo>& outputs,
                             const TFLiteExtractorConfig& config)
{
    const size_t world_size = static_cast<size_t>(constants::kLandmarksPerHand * constants::kAxes);
    if (!float_output(outputs, config.world_landmarks_output, world_size)) {
        std::cerr << "[TFLiteLandmarkExtractor] World landmark output " << config.world_landmarks_output
                  << " missing, not float32 or smaller than " << world_size << std::endl;
        return false;
    }
    if (!float_output(outputs, config.presence_output, 1)) {
        std::cerr << "[TFLiteLandmarkExtractor] Presence output " << config.presence_output
                  << " missing or not float32" << std::endl;
        return false;
    }
    if (!float_output(outputs, config.handedness_output, 1)) {
        std::cerr << "[TFLiteLandmarkExtractor] Handedness output " << config.handedness_output
                  << " missing or not float32" << std::endl;
        return false;
    }
    return true;
}

void decode_handedness(float right_probability, std::string& label, float& confidence)
{
    if (right_probability >= 0.5f) {
        label = constants::kRightLabel;
        confidence = right_probability;
    } else {
        label = constants::kLeftLabel;
        confidence = 1.0f - right_probability;
    }
}

struct TFLiteLandmarkExtractorImpl {
    bool initialized = false;
    ModelHandle palm;
    ModelHandle landmark;
};

TFLiteLandmarkExtractor::TFLiteLandmarkExtractor(const TFLiteExtractorConfig& config)
    : config_(config), impl_(std::make_unique<TFLiteLandmarkExtractorImpl>()) {}

TFLiteLandmarkExtractor::~TFLiteLandmarkExtractor() { close(); }

bool TFLiteLandmarkExtractor::init()
{
    if (impl_->initialized)
        return true;
    if (!load_model(config_.palm_model_path, config_, impl_->palm) ||
        !load_model(config_.landmark_model_path, config_, impl_->landmark) ||
        !palm_outputs_usable(describe_outputs(*impl_->palm.interpreter)) ||
        !landmark_outputs_usable(describe_outputs(*impl_->landmark.interpreter), config_)) {
        release_model(impl_->landmark);
        release_model(impl_->palm);
        return false;
    }

    impl_->initialized = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = true;
    }
    worker_ = std::thread(&TFLiteLandmarkExtractor::worker_fn, this);

    if (config_.verbose) {
        std::cerr << "[TFLiteLandmarkExtractor] Initialized\n";
        std::cerr << "  Palm model: " << config_.palm_model_path << "\n";
        std::cerr << "  Landmark model: " << config_.landmark_model_path << "\n";
        std::cerr << "  Threads: " << config_.num_threads << "\n";
    }
    return true;
}

bool TFLiteLandmarkExtractor::submit(camera::Image image, uint64_t timestamp_ms,
                                     ExtractionCallback callback)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_)
            return false;
        if (pending_ && config_.verbose)
            std::cerr << "[TFLiteLandmarkExtractor] Replacing unstarted job " << pending_->timestamp_ms << "\n";
        pending_ = std::make_unique<Job>();
        pending_->image = std::move(image);
        pending_->timestamp_ms = timestamp_ms;
        pending_->callback = std::move(callback);
    }
    cv_.notify_one();
    return true;
}

void TFLiteLandmarkExtractor::close()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        pending_.reset();
    }
    cv_.notify_all();
    if (worker_.joinable())
        worker_.join();

    // A later init() reloads the models and starts a new worker
    impl_->initialized = false;
    release_model(impl_->landmark);
    release_model(impl_->palm);
}

void TFLiteLandmarkExtractor::worker_fn()
{
    while (true) {
        std::unique_ptr<Job> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [&] { return pending_ != nullptr || !running_; });
            if (!running_)
                break;
            job = std::move(pending_);
        }

        auto hands = extract(job->image);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_)
                break;
        }
        if (job->callback)
            job->callback(std::move(hands));
    }
}

std::vector<HandObservation> TFLiteLandmarkExtractor::extract(const camera::Image& image)
{
    std::vector<HandObservation> hands;
    if (!impl_->initialized || image.empty())
        return hands;

    auto t0 = std::chrono::steady_clock::now();
    auto palms = detect_palms(image);
    for (const auto& palm : palms) {
        HandObservation obs;
        if (run_landmarks(image, palm, obs))
            hands.push_back(std::move(obs));
    }

    auto t1 = std::chrono::steady_clock::now();
    float ms = std::chrono::duration<float, std::milli>(t1 - t0).count();
#if BSL_TRANSLATE_DEBUG_TIMING
    std::cerr << "[TFLiteLandmarkExtractor] " << palms.size() << " palms, "
              << hands.size() << " hands in " << ms << " ms\n";
#else
    (void)ms;
#endif
    return hands;
}

std::vector<TFLiteLandmarkExtractor::PalmBox>
TFLiteLandmarkExtractor::detect_palms(const camera::Image& image)
{
    std::vector<PalmBox> palms;
    auto* interp = impl_->palm.interpreter.get();
    if (!fill_input(interp->input_tensor(0), image.pixels.data(), image.width, image.height)) {
        std::cerr << "[TFLiteLandmarkExtractor] Unsupported palm model input tensor" << std::endl;
        return palms;
    }
    if (interp->Invoke() != kTfLiteOk) {
        std::cerr << "[TFLiteLandmarkExtractor] Palm detection inference failed" << std::endl;
        return palms;
    }

    // Box format: [ymin, xmin, ymax, xmax] normalized
    const float* boxes = interp->output_tensor(0)->data.f;
    const float* scores = interp->output_tensor(1)->data.f;
    const size_t capacity = element_count(interp->output_tensor(1));
    int num = static_cast<int>(interp->output_tensor(2)->data.f[0]);
    num = std::clamp(num, 0, static_cast<int>(capacity));

    const int fw = static_cast<int>(image.width);
    const int fh = static_cast<int>(image.height);
    for (int i = 0; i < num; ++i) {
        float score = scores[i];
        if (score < config_.min_detection_confidence)
            continue;
        float ymin = boxes[i * 4 + 0];
        float xmin = boxes[i * 4 + 1];
        float ymax = boxes[i * 4 + 2];
        float xmax = boxes[i * 4 + 3];
        PalmBox box;
        box.x = std::clamp(static_cast<int>(xmin * fw), 0, fw - 1);
        box.y = std::clamp(static_cast<int>(ymin * fh), 0, fh - 1);
        box.width = std::clamp(static_cast<int>((xmax - xmin) * fw), 1, fw - box.x);
        box.height = std::clamp(static_cast<int>((ymax - ymin) * fh), 1, fh - box.y);
        box.score = score;
        palms.push_back(box);
    }

    std::stable_sort(palms.begin(), palms.end(),
                     [](const PalmBox& a, const PalmBox& b) { return a.score > b.score; });
    if (palms.size() > static_cast<size_t>(config_.max_hands))
        palms.resize(static_cast<size_t>(config_.max_hands));
    return palms;
}

bool TFLiteLandmarkExtractor::run_landmarks(const camera::Image& image, const PalmBox& palm,
                                            HandObservation& out)
{
    // Crop palm region (with margin)
    const int margin = config_.palm_margin_pixels;
    const int fw = static_cast<int>(image.width);
    const int fh = static_cast<int>(image.height);
    int x = std::max(0, palm.x - margin);
    int y = std::max(0, palm.y - margin);
    int w = std::min(fw - x, palm.width + 2 * margin);
    int h = std::min(fh - y, palm.height + 2 * margin);
    if (w <= 0 || h <= 0)
        return false;

    std::vector<uint8_t> crop(static_cast<size_t>(w) * h * 3);
    for (int row = 0; row < h; ++row) {
        std::memcpy(&crop[static_cast<size_t>(row) * w * 3],
                    &image.pixels[(static_cast<size_t>(y + row) * fw + x) * 3],
                    static_cast<size_t>(w) * 3);
    }

    auto* interp = impl_->landmark.interpreter.get();
    if (!fill_input(interp->input_tensor(0), crop.data(), static_cast<uint32_t>(w), static_cast<uint32_t>(h))) {
        std::cerr << "[TFLiteLandmarkExtractor] Unsupported landmark model input tensor" << std::endl;
        return false;
    }
    if (interp->Invoke() != kTfLiteOk) {
        std::cerr << "[TFLiteLandmarkExtractor] Landmark inference failed" << std::endl;
        return false;
    }

    float presence = interp->output_tensor(config_.presence_output)->data.f[0];
    if (presence < config_.min_hand_presence)
        return false;

    const float* world = interp->output_tensor(config_.world_landmarks_output)->data.f;
    for (int i = 0; i < constants::kLandmarksPerHand; ++i) {
        out.landmarks[i] = Landmark(world[i * constants::kAxes],
                                    world[i * constants::kAxes + 1],
                                    world[i * constants::kAxes + 2]);
    }

    decode_handedness(interp->output_tensor(config_.handedness_output)->data.f[0],
                      out.handedness, out.confidence);
    return true;
}

} // namespace landmarks
} // namespace bsl
