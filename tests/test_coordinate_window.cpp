#include <gtest/gtest.h>
#include "bsl_translate/coordinate_window.hpp"
#include "test_fakes.hpp"

using namespace bsl::analysis;
using bsl::landmarks::constants::kCoordsPerFrame;
using bsl::landmarks::constants::kLandmarksPerHand;
using test_fakes::make_hand;

namespace {
// Output index for (axis, slot, landmark)
size_t at(int axis, int slot, int lm) {
    return static_cast<size_t>((axis * 2 + slot) * kLandmarksPerHand + lm);
}
} // namespace

class NormalizeFrameTest : public ::testing::Test {
protected:
    void SetUp() override {
        norm = test_fakes::identity_norm();
    }

    NormalizationTable norm;
};

TEST_F(NormalizeFrameTest, IdentityStatsKeepRawValues) {
    std::vector<bsl::landmarks::HandObservation> hands = {make_hand("Left", 1.0f, 0.5f, -0.3f, 0.1f)};
    auto frame = normalize_frame(hands, assign_hands(hands), norm);

    ASSERT_EQ(frame.size(), static_cast<size_t>(kCoordsPerFrame));
    for (int lm = 0; lm < kLandmarksPerHand; ++lm) {
        EXPECT_FLOAT_EQ(frame[at(0, 0, lm)], 0.5f);
        EXPECT_FLOAT_EQ(frame[at(1, 0, lm)], -0.3f);
        EXPECT_FLOAT_EQ(frame[at(2, 0, lm)], 0.1f);
    }
}

TEST_F(NormalizeFrameTest, AbsentHandIsZero) {
    std::vector<bsl::landmarks::HandObservation> hands = {make_hand("Left", 1.0f, 0.5f, -0.3f, 0.1f)};
    auto frame = normalize_frame(hands, assign_hands(hands), norm);
    for (int axis = 0; axis < 3; ++axis)
        for (int lm = 0; lm < kLandmarksPerHand; ++lm)
            EXPECT_FLOAT_EQ(frame[at(axis, 1, lm)], 0.0f);
}

TEST_F(NormalizeFrameTest, LayoutIsAxisThenHandThenLandmark) {
    auto left = make_hand("Left", 0.9f);
    auto right = make_hand("Right", 0.9f);
    for (int lm = 0; lm < kLandmarksPerHand; ++lm) {
        left.landmarks[lm] = bsl::landmarks::Landmark(1.0f + lm, 2.0f + lm, 3.0f + lm);
        right.landmarks[lm] = bsl::landmarks::Landmark(-1.0f - lm, -2.0f - lm, -3.0f - lm);
    }
    std::vector<bsl::landmarks::HandObservation> hands = {right, left};
    auto frame = normalize_frame(hands, assign_hands(hands), norm);

    EXPECT_FLOAT_EQ(frame[0], 1.0f);                    // leftX[0]
    EXPECT_FLOAT_EQ(frame[20], 21.0f);                  // leftX[20]
    EXPECT_FLOAT_EQ(frame[21], -1.0f);                  // rightX[0]
    EXPECT_FLOAT_EQ(frame[42], 2.0f);                   // leftY[0]
    EXPECT_FLOAT_EQ(frame[63], -2.0f);                  // rightY[0]
    EXPECT_FLOAT_EQ(frame[84], 3.0f);                   // leftZ[0]
    EXPECT_FLOAT_EQ(frame[125], -23.0f);                // rightZ[20]
}

TEST_F(NormalizeFrameTest, AppliesMeanAndScalePerLandmarkAxis) {
    std::vector<float> means(kCoordsPerFrame, 0.0f);
    std::vector<float> scales(kCoordsPerFrame, 1.0f);
    // landmark 2, axis y -> index 2 * 3 + 1
    means[7] = 1.0f;
    scales[7] = 2.0f;
    ASSERT_TRUE(norm.assign(means, scales));

    std::vector<bsl::landmarks::HandObservation> hands = {make_hand("Right", 1.0f, 0.0f, 5.0f, 0.0f)};
    auto frame = normalize_frame(hands, assign_hands(hands), norm);
    EXPECT_FLOAT_EQ(frame[at(1, 1, 2)], 2.0f);
    EXPECT_FLOAT_EQ(frame[at(1, 1, 3)], 5.0f);
}

TEST(CoordinateWindowTest, StartsZeroFilled) {
    CoordinateWindow window(7);
    EXPECT_EQ(window.size(), static_cast<size_t>(7 * kCoordsPerFrame));
    for (float v : window.data())
        EXPECT_FLOAT_EQ(v, 0.0f);
    EXPECT_EQ(window.frames_pushed(), 0u);
}

TEST(CoordinateWindowTest, LengthIsInvariant) {
    CoordinateWindow window(3);
    std::vector<float> frame(kCoordsPerFrame, 1.0f);
    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(window.push(frame));
        window.push_empty();
        EXPECT_EQ(window.size(), static_cast<size_t>(3 * kCoordsPerFrame));
    }
    EXPECT_EQ(window.frames_pushed(), 20u);
}

TEST(CoordinateWindowTest, RejectsWrongLength) {
    CoordinateWindow window(3);
    EXPECT_FALSE(window.push(std::vector<float>(10, 1.0f)));
    EXPECT_EQ(window.frames_pushed(), 0u);
    for (float v : window.data())
        EXPECT_FLOAT_EQ(v, 0.0f);
}

TEST(CoordinateWindowTest, ShiftsOldestOut) {
    CoordinateWindow window(3);
    for (int i = 1; i <= 4; ++i)
        ASSERT_TRUE(window.push(std::vector<float>(kCoordsPerFrame, static_cast<float>(i))));

    // Frames 2, 3, 4 remain, oldest first
    EXPECT_FLOAT_EQ(window.data()[0], 2.0f);
    EXPECT_FLOAT_EQ(window.data()[kCoordsPerFrame], 3.0f);
    EXPECT_FLOAT_EQ(window.data()[2 * kCoordsPerFrame], 4.0f);
    EXPECT_FLOAT_EQ(window.newest()[kCoordsPerFrame - 1], 4.0f);
}

TEST(CoordinateWindowTest, PushEmptyAppendsZeros) {
    CoordinateWindow window(2);
    ASSERT_TRUE(window.push(std::vector<float>(kCoordsPerFrame, 9.0f)));
    window.push_empty();
    EXPECT_FLOAT_EQ(window.data()[0], 9.0f);
    for (int i = 0; i < kCoordsPerFrame; ++i)
        EXPECT_FLOAT_EQ(window.newest()[i], 0.0f);
}

TEST(CoordinateWindowTest, Clear) {
    CoordinateWindow window(2);
    ASSERT_TRUE(window.push(std::vector<float>(kCoordsPerFrame, 9.0f)));
    window.clear();
    EXPECT_EQ(window.frames_pushed(), 0u);
    for (float v : window.data())
        EXPECT_FLOAT_EQ(v, 0.0f);
}
