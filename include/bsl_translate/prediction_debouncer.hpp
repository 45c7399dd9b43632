#pragma once

#include "bsl_translate/resources.hpp"
#include <cstddef>
#include <deque>
#include <string>

namespace bsl {
namespace analysis {

// Reserved "no sign" class, never displayed
constexpr int kBackgroundClass = 0;

// Turns per-frame top classes into a stable, sticky output label.
// A label is emitted only when the last `required` predictions are all the
// same non-background class. The output never goes back to empty.
class PredictionDebouncer {
public:
    explicit PredictionDebouncer(size_t required, size_t transcript_length = 6);

    // Record one frame's top class. Returns true if the output changed.
    bool update(int class_index, const Vocabulary& vocab);

    // Class on which the full history agrees, or -1
    int stable_prediction() const;

    const std::string& output() const { return output_; }
    const std::deque<int>& history() const { return history_; }
    size_t required() const { return required_; }

    // Last emitted labels, oldest first
    const std::deque<std::string>& emitted() const { return emitted_; }
    std::string transcript() const;

    void reset();

private:
    size_t required_;
    size_t transcript_length_;
    std::deque<int> history_;   // newest at the back
    std::string output_;
    std::deque<std::string> emitted_;
};

} // namespace analysis
} // namespace bsl
