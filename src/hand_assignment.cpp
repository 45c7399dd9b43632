#include "bsl_translate/hand_assignment.hpp"

namespace bsl {
namespace analysis {

float left_likelihood(const landmarks::HandObservation& hand)
{
    if (hand.handedness == landmarks::constants::kLeftLabel)
        return hand.confidence;
    return 1.0f - hand.confidence;
}

HandAssignment assign_hands(const std::vector<landmarks::HandObservation>& hands)
{
    HandAssignment result;

    if (hands.size() == 1) {
        const auto& label = hands[0].handedness;
        if (label == landmarks::constants::kLeftLabel)
            result.left = 0;
        else if (label == landmarks::constants::kRightLabel)
            result.right = 0;
        return result;
    }

    if (hands.size() >= 2) {
        const float first = left_likelihood(hands[0]);
        const float second = left_likelihood(hands[1]);
        if (second > first) {
            result.left = 1;
            result.right = 0;
        } else {
            result.left = 0;
            result.right = 1;
        }
    }
    return result;
}

} // namespace analysis
} // namespace bsl
