#include "bsl_translate/classifier.hpp"
#include <algorithm>
#include <cstring>
#include <iostream>
#include <limits>

#include <tensorflow/lite/interpreter.h>
#include <tensorflow/lite/kernels/register.h>
#include <tensorflow/lite/model.h>

#ifdef BSL_TRANSLATE_USE_XNNPACK
#include <tensorflow/lite/delegates/xnnpack/xnnpack_delegate.h>
#endif

namespace bsl {
namespace classifier {

int top_class_index(const std::vector<float>& scores)
{
    if (scores.empty())
        return -1;
    float max_score = -std::numeric_limits<float>::infinity();
    int max_idx = -1;
    // NaN never compares greater, so it is skipped
    for (size_t i = 0; i < scores.size(); ++i) {
        if (scores[i] > max_score) {
            max_score = scores[i];
            max_idx = static_cast<int>(i);
        }
    }
    // All -inf or NaN
    return max_idx < 0 ? 0 : max_idx;
}

struct TFLiteSequenceClassifierImpl {
    bool initialized = false;
    std::unique_ptr<tflite::FlatBufferModel> model;
#ifdef BSL_TRANSLATE_USE_XNNPACK
    std::unique_ptr<TfLiteDelegate, decltype(&TfLiteXNNPackDelegateDelete)> delegate{nullptr, &TfLiteXNNPackDelegateDelete};
#endif
    std::unique_ptr<tflite::Interpreter> interpreter;
    size_t num_outputs = 0;
};

namespace {

size_t element_count(const TfLiteTensor* tensor)
{
    size_t n = 1;
    for (int i = 0; i < tensor->dims->size; ++i)
        n *= static_cast<size_t>(tensor->dims->data[i]);
    return n;
}

} // namespace

TFLiteSequenceClassifier::TFLiteSequenceClassifier(const TFLiteClassifierConfig& config,
                                                   size_t expected_inputs)
    : config_(config), expected_inputs_(expected_inputs),
      impl_(std::make_unique<TFLiteSequenceClassifierImpl>()) {}

TFLiteSequenceClassifier::~TFLiteSequenceClassifier() { close(); }

bool TFLiteSequenceClassifier::init()
{
    impl_->model = tflite::FlatBufferModel::BuildFromFile(config_.model_path.c_str());
    if (!impl_->model) {
        std::cerr << "[TFLiteClassifier] Failed to load model: " << config_.model_path << std::endl;
        return false;
    }
    tflite::ops::builtin::BuiltinOpResolver resolver;
    tflite::InterpreterBuilder builder(*impl_->model, resolver);
    if (builder(&impl_->interpreter) != kTfLiteOk || !impl_->interpreter) {
        std::cerr << "[TFLiteClassifier] Failed to create interpreter" << std::endl;
        return false;
    }
    impl_->interpreter->SetNumThreads(config_.num_threads);

#ifdef BSL_TRANSLATE_USE_XNNPACK
    if (config_.use_xnnpack) {
        TfLiteXNNPackDelegateOptions opts = TfLiteXNNPackDelegateOptionsDefault();
        opts.num_threads = config_.num_threads;
        impl_->delegate.reset(TfLiteXNNPackDelegateCreate(&opts));
        if (impl_->interpreter->ModifyGraphWithDelegate(impl_->delegate.get()) != kTfLiteOk)
            std::cerr << "[TFLiteClassifier] XNNPACK delegate rejected, using CPU kernels" << std::endl;
    }
#endif

    if (impl_->interpreter->AllocateTensors() != kTfLiteOk) {
        std::cerr << "[TFLiteClassifier] Failed to allocate tensors" << std::endl;
        return false;
    }

    const TfLiteTensor* input = impl_->interpreter->input_tensor(0);
    if (input->type != kTfLiteFloat32 || element_count(input) != expected_inputs_) {
        std::cerr << "[TFLiteClassifier] Input tensor mismatch: model takes " << element_count(input)
                  << " values, window has " << expected_inputs_ << std::endl;
        return false;
    }
    const TfLiteTensor* output = impl_->interpreter->output_tensor(0);
    if (output->type != kTfLiteFloat32 || element_count(output) == 0) {
        std::cerr << "[TFLiteClassifier] Unsupported output tensor" << std::endl;
        return false;
    }
    impl_->num_outputs = element_count(output);
    impl_->initialized = true;

    if (config_.verbose) {
        std::cerr << "[TFLiteClassifier] Initialized " << config_.model_path << "\n";
        std::cerr << "  Inputs: " << expected_inputs_ << ", classes: " << impl_->num_outputs << "\n";
    }
    return true;
}

bool TFLiteSequenceClassifier::classify(const std::vector<float>& window, std::vector<float>& scores)
{
    if (!impl_->initialized) {
        std::cerr << "[TFLiteClassifier] Not initialized" << std::endl;
        return false;
    }
    if (window.size() != expected_inputs_) {
        std::cerr << "[TFLiteClassifier] Window has " << window.size() << " values, model takes "
                  << expected_inputs_ << std::endl;
        return false;
    }

    float* input = impl_->interpreter->typed_input_tensor<float>(0);
    std::memcpy(input, window.data(), window.size() * sizeof(float));
    if (impl_->interpreter->Invoke() != kTfLiteOk) {
        std::cerr << "[TFLiteClassifier] Inference failed" << std::endl;
        return false;
    }
    const float* output = impl_->interpreter->typed_output_tensor<float>(0);
    scores.assign(output, output + impl_->num_outputs);
    return true;
}

void TFLiteSequenceClassifier::close()
{
    impl_->initialized = false;
    impl_->interpreter.reset();
#ifdef BSL_TRANSLATE_USE_XNNPACK
    impl_->delegate.reset();
#endif
    impl_->model.reset();
}

size_t TFLiteSequenceClassifier::num_classes() const
{
    return impl_->num_outputs;
}

} // namespace classifier
} // namespace bsl
