#include <gtest/gtest.h>
#include "bsl_translate/analyzer_config.hpp"
#include <cstdio>

using namespace bsl::analysis;

TEST(AnalyzerConfigTest, DefaultsAreValid) {
    AnalyzerConfig cfg;
    EXPECT_TRUE(cfg.validate());
    EXPECT_EQ(cfg.frames_per_sign, 7);
    EXPECT_EQ(cfg.concurrent_preds_required, 4);
    EXPECT_EQ(cfg.window_size(), 7u * 126u);
}

TEST(AnalyzerConfigTest, LoadOverridesOnlyGivenKeys) {
    AnalyzerConfig cfg;
    ASSERT_TRUE(cfg.load_from_string(R"({
        "frames_per_sign": 10,
        "classifier": { "model_path": "m.tflite", "num_threads": 1 },
        "extractor": { "max_hands": 1 }
    })"));
    EXPECT_EQ(cfg.frames_per_sign, 10);
    EXPECT_EQ(cfg.classifier.model_path, "m.tflite");
    EXPECT_EQ(cfg.classifier.num_threads, 1);
    EXPECT_EQ(cfg.extractor.max_hands, 1);
    EXPECT_EQ(cfg.concurrent_preds_required, 4);
    EXPECT_EQ(cfg.vocab_path, "assets/stream_cnn_3d_vocab.csv");
}

TEST(AnalyzerConfigTest, InvalidJsonLeavesConfigUntouched) {
    AnalyzerConfig cfg;
    EXPECT_FALSE(cfg.load_from_string("{ not json"));
    EXPECT_FALSE(cfg.load_from_string("[1, 2]"));
    EXPECT_FALSE(cfg.load_from_string(R"({"frames_per_sign": "seven"})"));
    EXPECT_EQ(cfg.frames_per_sign, 7);
}

TEST(AnalyzerConfigTest, InvalidValuesRejected) {
    AnalyzerConfig cfg;
    EXPECT_FALSE(cfg.load_from_string(R"({"frames_per_sign": 0})"));
    EXPECT_FALSE(cfg.load_from_string(R"({"concurrent_preds_required": 0})"));
    EXPECT_FALSE(cfg.load_from_string(R"({"frame_rate_window": 1})"));
    EXPECT_FALSE(cfg.load_from_string(R"({"extractor": {"max_hands": 3}})"));
    EXPECT_FALSE(cfg.load_from_string(R"({"extractor": {"min_detection_confidence": 1.5}})"));
    EXPECT_EQ(cfg.frames_per_sign, 7);
    EXPECT_EQ(cfg.extractor.max_hands, 2);
}

TEST(AnalyzerConfigTest, Validation) {
    AnalyzerConfig cfg;
    cfg.vocab_path.clear();
    EXPECT_FALSE(cfg.validate());

    cfg = AnalyzerConfig();
    cfg.classifier.num_threads = 0;
    EXPECT_FALSE(cfg.validate());

    cfg = AnalyzerConfig();
    cfg.transcript_length = 0;
    EXPECT_TRUE(cfg.validate());
}

TEST(AnalyzerConfigTest, SaveAndReload) {
    AnalyzerConfig cfg;
    cfg.frames_per_sign = 12;
    cfg.verbose = true;
    cfg.extractor.palm_model_path = "palm.tflite";

    const std::string path = ::testing::TempDir() + "bsl_translate_config.json";
    ASSERT_TRUE(cfg.save_to_file(path));

    AnalyzerConfig loaded;
    ASSERT_TRUE(loaded.load_from_file(path));
    EXPECT_EQ(loaded.frames_per_sign, 12);
    EXPECT_TRUE(loaded.verbose);
    EXPECT_EQ(loaded.extractor.palm_model_path, "palm.tflite");
    std::remove(path.c_str());
}

TEST(AnalyzerConfigTest, MissingFile) {
    AnalyzerConfig cfg;
    EXPECT_FALSE(cfg.load_from_file("/nonexistent/config.json"));
}
