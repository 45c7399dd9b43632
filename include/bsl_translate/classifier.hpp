#pragma once

#include <memory>
#include <string>
#include <vector>

namespace bsl {
namespace classifier {

// Sequence-to-class model capability. Input is the flattened window of
// shape (1, 1, frames_per_sign, 3, 42); output is one score per class.
class SequenceClassifier {
public:
    virtual ~SequenceClassifier() = default;

    virtual bool init() = 0;

    // Returns false on any inference failure; scores is then unspecified
    virtual bool classify(const std::vector<float>& window, std::vector<float>& scores) = 0;

    virtual void close() = 0;
};

// Index of the highest score, first occurrence on ties; NaN scores are
// skipped. 0 if no score is above -inf, -1 for no scores
int top_class_index(const std::vector<float>& scores);

/**
 * @brief TFLite classifier configuration
 */
struct TFLiteClassifierConfig {
    std::string model_path{"models/stream_cnn_3d.tflite"};
    int num_threads{2};
    bool use_xnnpack{true};
    bool verbose{false};
};

// Forward declaration
struct TFLiteSequenceClassifierImpl;

/**
 * @brief SequenceClassifier backed by a TFLite model
 *
 * The model input must hold exactly expected_inputs floats; anything else
 * is rejected at init() so a mismatched model never reaches inference.
 */
class TFLiteSequenceClassifier : public SequenceClassifier {
public:
    TFLiteSequenceClassifier(const TFLiteClassifierConfig& config, size_t expected_inputs);
    ~TFLiteSequenceClassifier() override;

    bool init() override;
    bool classify(const std::vector<float>& window, std::vector<float>& scores) override;
    void close() override;

    size_t num_classes() const;

private:
    TFLiteClassifierConfig config_;
    size_t expected_inputs_;
    std::unique_ptr<TFLiteSequenceClassifierImpl> impl_;

    // Disable copy
    TFLiteSequenceClassifier(const TFLiteSequenceClassifier&) = delete;
    TFLiteSequenceClassifier& operator=(const TFLiteSequenceClassifier&) = delete;
};

} // namespace classifier
} // namespace bsl
