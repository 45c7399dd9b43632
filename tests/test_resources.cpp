#include <gtest/gtest.h>
#include "bsl_translate/resources.hpp"
#include "bsl_translate/landmarks.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>

using namespace bsl::analysis;
using bsl::landmarks::constants::kCoordsPerFrame;

namespace {

std::string csv_row(size_t count, float value) {
    std::ostringstream out;
    for (size_t i = 0; i < count; ++i) {
        if (i)
            out << ",";
        out << value;
    }
    return out.str();
}

} // namespace

TEST(VocabularyTest, ParsesIndexLabelLines) {
    std::istringstream in("0,<none>\n1, hello \n\n3,good morning\n");
    Vocabulary vocab;
    ASSERT_TRUE(vocab.load_from_stream(in));
    EXPECT_EQ(vocab.size(), 3u);

    std::string label;
    ASSERT_TRUE(vocab.lookup(1, label));
    EXPECT_EQ(label, "hello");
    ASSERT_TRUE(vocab.lookup(3, label));
    EXPECT_EQ(label, "good morning");
    EXPECT_FALSE(vocab.lookup(2, label));
    EXPECT_FALSE(vocab.contains(2));
}

TEST(VocabularyTest, LabelMayContainCommas) {
    std::istringstream in("5,yes, please\n");
    Vocabulary vocab;
    ASSERT_TRUE(vocab.load_from_stream(in));
    std::string label;
    ASSERT_TRUE(vocab.lookup(5, label));
    EXPECT_EQ(label, "yes, please");
}

TEST(VocabularyTest, RejectsMalformedInput) {
    const char* cases[] = {
        "",                 // empty
        "hello\n",          // no comma
        "x,hello\n",        // non-numeric index
        "-1,hello\n",       // negative index
        "1,\n",             // empty label
        "1,a\n1,b\n",       // duplicate index
    };
    for (const char* text : cases) {
        std::istringstream in(text);
        Vocabulary vocab;
        EXPECT_FALSE(vocab.load_from_stream(in)) << "input: " << text;
        EXPECT_TRUE(vocab.empty());
    }
}

TEST(VocabularyTest, MissingFile) {
    Vocabulary vocab;
    EXPECT_FALSE(vocab.load_from_file("/nonexistent/vocab.csv"));
}

TEST(NormalizationTableTest, ParsesTwoRows) {
    std::istringstream in(csv_row(kCoordsPerFrame, 0.5f) + "\n" + csv_row(kCoordsPerFrame, 2.0f) + "\n");
    NormalizationTable norm;
    ASSERT_TRUE(norm.load_from_stream(in));
    EXPECT_EQ(norm.size(), static_cast<size_t>(kCoordsPerFrame));
    EXPECT_FLOAT_EQ(norm.normalize(10, 4.5f), 2.0f);
}

TEST(NormalizationTableTest, RejectsWrongRowCount) {
    std::istringstream one(csv_row(kCoordsPerFrame, 0.0f) + "\n");
    NormalizationTable norm;
    EXPECT_FALSE(norm.load_from_stream(one));

    std::istringstream three(csv_row(kCoordsPerFrame, 0.0f) + "\n" + csv_row(kCoordsPerFrame, 1.0f) +
                             "\n" + csv_row(kCoordsPerFrame, 1.0f) + "\n");
    EXPECT_FALSE(norm.load_from_stream(three));
    EXPECT_TRUE(norm.empty());
}

TEST(NormalizationTableTest, RejectsBadValues) {
    std::istringstream in(csv_row(kCoordsPerFrame, 0.0f) + "\n" + "1,abc,1\n");
    NormalizationTable norm;
    EXPECT_FALSE(norm.load_from_stream(in));
}

TEST(NormalizationTableTest, RejectsMismatchedLengths) {
    NormalizationTable norm;
    EXPECT_FALSE(norm.assign(std::vector<float>(126, 0.0f), std::vector<float>(125, 1.0f)));
}

TEST(NormalizationTableTest, RejectsTooShort) {
    NormalizationTable norm;
    EXPECT_FALSE(norm.assign(std::vector<float>(62, 0.0f), std::vector<float>(62, 1.0f)));
}

TEST(NormalizationTableTest, AcceptsSingleHandLength) {
    NormalizationTable norm;
    EXPECT_TRUE(norm.assign(std::vector<float>(63, 0.0f), std::vector<float>(63, 1.0f)));
}

TEST(NormalizationTableTest, RejectsZeroScale) {
    std::vector<float> scales(kCoordsPerFrame, 1.0f);
    scales[17] = 0.0f;
    NormalizationTable norm;
    EXPECT_FALSE(norm.assign(std::vector<float>(kCoordsPerFrame, 0.0f), scales));
}

TEST(NormalizationTableTest, LoadFromFile) {
    const std::string path = ::testing::TempDir() + "bsl_norm_stats.csv";
    {
        std::ofstream out(path);
        out << csv_row(kCoordsPerFrame, 1.0f) << "\n" << csv_row(kCoordsPerFrame, 4.0f) << "\n";
    }
    NormalizationTable norm;
    ASSERT_TRUE(norm.load_from_file(path));
    EXPECT_FLOAT_EQ(norm.normalize(0, 9.0f), 2.0f);
    std::remove(path.c_str());
}
