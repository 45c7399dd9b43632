#pragma once

#include "bsl_translate/landmarks.hpp"
#include <vector>

namespace bsl {
namespace analysis {

// Which observation fills each hand slot; -1 when the slot is empty
struct HandAssignment {
    static constexpr int kAbsent = -1;

    int left{kAbsent};
    int right{kAbsent};

    bool has_left() const { return left != kAbsent; }
    bool has_right() const { return right != kAbsent; }
    bool empty() const { return !has_left() && !has_right(); }
};

// Probability that an observation is the signer's left hand
float left_likelihood(const landmarks::HandObservation& hand);

// Assign observations to the left and right slots.
//  - one hand goes to the slot named by its label (unknown labels are dropped)
//  - two hands: higher left-likelihood is left, the other right, whatever
//    the labels say; on a tie the first observation is left
//  - observations past the second are ignored
HandAssignment assign_hands(const std::vector<landmarks::HandObservation>& hands);

} // namespace analysis
} // namespace bsl
