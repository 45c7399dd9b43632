#include "bsl_translate/prediction_debouncer.hpp"
#include <algorithm>
#include <iostream>

namespace bsl {
namespace analysis {

PredictionDebouncer::PredictionDebouncer(size_t required, size_t transcript_length)
    : required_(std::max<size_t>(1, required)), transcript_length_(transcript_length) {}

bool PredictionDebouncer::update(int class_index, const Vocabulary& vocab)
{
    history_.push_back(class_index);
    while (history_.size() > required_)
        history_.pop_front();

    const int stable = stable_prediction();
    if (stable < 0 || stable == kBackgroundClass)
        return false;

    std::string label;
    if (!vocab.lookup(stable, label)) {
        std::cerr << "[Debouncer][WARN] Class " << stable << " has no vocabulary entry\n";
        return false;
    }
    if (label == output_)
        return false;

    output_ = label;
    if (transcript_length_ > 0) {
        emitted_.push_back(label);
        while (emitted_.size() > transcript_length_)
            emitted_.pop_front();
    }
    return true;
}

int PredictionDebouncer::stable_prediction() const
{
    if (history_.size() < required_)
        return -1;
    const int first = history_.front();
    bool unanimous = std::all_of(history_.begin(), history_.end(),
                                 [first](int p) { return p == first; });
    return unanimous ? first : -1;
}

std::string PredictionDebouncer::transcript() const
{
    std::string out;
    for (const auto& label : emitted_) {
        if (!out.empty())
            out += ' ';
        out += label;
    }
    return out;
}

void PredictionDebouncer::reset()
{
    history_.clear();
    output_.clear();
    emitted_.clear();
}

} // namespace analysis
} // namespace bsl
