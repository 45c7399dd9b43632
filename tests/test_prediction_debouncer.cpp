#include <gtest/gtest.h>
#include "bsl_translate/prediction_debouncer.hpp"
#include "test_fakes.hpp"

using namespace bsl::analysis;

class PredictionDebouncerTest : public ::testing::Test {
protected:
    void SetUp() override {
        vocab = test_fakes::small_vocab();
    }

    Vocabulary vocab;
};

TEST_F(PredictionDebouncerTest, NeedsFullAgreeingHistory) {
    PredictionDebouncer d(4);
    EXPECT_FALSE(d.update(3, vocab));
    EXPECT_FALSE(d.update(3, vocab));
    EXPECT_FALSE(d.update(3, vocab));
    EXPECT_EQ(d.output(), "");
    EXPECT_EQ(d.stable_prediction(), -1);

    EXPECT_TRUE(d.update(3, vocab));
    EXPECT_EQ(d.output(), "please");
    EXPECT_EQ(d.stable_prediction(), 3);
}

TEST_F(PredictionDebouncerTest, DisagreementBlocksEmission) {
    PredictionDebouncer d(3);
    d.update(1, vocab);
    d.update(2, vocab);
    d.update(1, vocab);
    EXPECT_EQ(d.output(), "");
    d.update(1, vocab);
    EXPECT_EQ(d.output(), "");
    EXPECT_TRUE(d.update(1, vocab));
    EXPECT_EQ(d.output(), "hello");
}

TEST_F(PredictionDebouncerTest, BackgroundClassNeverShown) {
    PredictionDebouncer d(2);
    for (int i = 0; i < 5; ++i)
        EXPECT_FALSE(d.update(kBackgroundClass, vocab));
    EXPECT_EQ(d.output(), "");
}

TEST_F(PredictionDebouncerTest, OutputIsSticky) {
    PredictionDebouncer d(2);
    d.update(4, vocab);
    d.update(4, vocab);
    ASSERT_EQ(d.output(), "sorry");

    // Background and disagreement leave the label in place
    d.update(0, vocab);
    d.update(0, vocab);
    d.update(2, vocab);
    EXPECT_EQ(d.output(), "sorry");
}

TEST_F(PredictionDebouncerTest, RepeatedAgreementDoesNotReEmit) {
    PredictionDebouncer d(2);
    d.update(2, vocab);
    EXPECT_TRUE(d.update(2, vocab));
    EXPECT_FALSE(d.update(2, vocab));
    EXPECT_FALSE(d.update(2, vocab));
    EXPECT_EQ(d.emitted().size(), 1u);
}

TEST_F(PredictionDebouncerTest, HistoryIsBoundedFifo) {
    PredictionDebouncer d(3);
    for (int c : {1, 2, 3, 4})
        d.update(c, vocab);
    ASSERT_EQ(d.history().size(), 3u);
    EXPECT_EQ(d.history()[0], 2);
    EXPECT_EQ(d.history()[2], 4);
}

TEST_F(PredictionDebouncerTest, MissingVocabularyEntryKeepsOutput) {
    PredictionDebouncer d(2);
    d.update(1, vocab);
    d.update(1, vocab);
    ASSERT_EQ(d.output(), "hello");

    EXPECT_FALSE(d.update(42, vocab));
    EXPECT_FALSE(d.update(42, vocab));
    EXPECT_EQ(d.output(), "hello");
}

TEST_F(PredictionDebouncerTest, TranscriptKeepsLastLabels) {
    PredictionDebouncer d(1, 2);
    d.update(1, vocab);
    d.update(2, vocab);
    d.update(3, vocab);
    EXPECT_EQ(d.transcript(), "thanks please");
    ASSERT_EQ(d.emitted().size(), 2u);
}

TEST_F(PredictionDebouncerTest, ZeroTranscriptLength) {
    PredictionDebouncer d(1, 0);
    d.update(1, vocab);
    EXPECT_EQ(d.output(), "hello");
    EXPECT_EQ(d.transcript(), "");
}

TEST_F(PredictionDebouncerTest, Reset) {
    PredictionDebouncer d(1);
    d.update(1, vocab);
    d.reset();
    EXPECT_EQ(d.output(), "");
    EXPECT_TRUE(d.history().empty());
    EXPECT_TRUE(d.emitted().empty());
}
