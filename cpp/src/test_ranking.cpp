#include "Ranking.hpp"
#include "InferenceError.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <stdexcept>

using Ranking::Prediction;

TEST(RankingTest, DefaultLabelsMatchModelOrder) {
    const auto& labels = Ranking::defaultEmotionLabels();

    ASSERT_EQ(labels.size(), 8u);
    EXPECT_EQ(labels[0], "neutral");
    EXPECT_EQ(labels[1], "happiness");
    EXPECT_EQ(labels[2], "surprise");
    EXPECT_EQ(labels[3], "sadness");
    EXPECT_EQ(labels[4], "anger");
    EXPECT_EQ(labels[5], "disgust");
    EXPECT_EQ(labels[6], "fear");
    EXPECT_EQ(labels[7], "contempt");
}

TEST(RankingTest, SortedDescendingAndPermutation) {
    const auto& labels = Ranking::defaultEmotionLabels();
    std::vector<float> probs{0.05f, 0.30f, 0.10f, 0.02f, 0.40f, 0.03f, 0.06f, 0.04f};

    auto ranking = Ranking::rank(labels, probs);

    ASSERT_EQ(ranking.size(), probs.size());
    for (std::size_t i = 1; i < ranking.size(); ++i) {
        EXPECT_GE(ranking[i - 1].weight, ranking[i].weight);
    }

    // Every (label, weight) pair survives unchanged
    for (std::size_t i = 0; i < labels.size(); ++i) {
        auto it = std::find_if(ranking.begin(), ranking.end(),
                               [&](const Prediction& p) { return p.label == labels[i]; });
        ASSERT_NE(it, ranking.end());
        EXPECT_EQ(it->weight, probs[i]);
    }

    EXPECT_EQ(ranking[0].label, "anger");
    EXPECT_EQ(ranking[1].label, "happiness");
}

TEST(RankingTest, TiesKeepLabelOrder) {
    Ranking::LabelTable labels{"a", "b", "c", "d"};
    std::vector<float> probs{0.25f, 0.25f, 0.25f, 0.25f};

    auto ranking = Ranking::rank(labels, probs);

    EXPECT_EQ(ranking[0].label, "a");
    EXPECT_EQ(ranking[1].label, "b");
    EXPECT_EQ(ranking[2].label, "c");
    EXPECT_EQ(ranking[3].label, "d");
}

TEST(RankingTest, SizeMismatchIsReported) {
    std::vector<float> probs(7, 1.0f / 7.0f);

    try {
        Ranking::rank(Ranking::defaultEmotionLabels(), probs);
        FAIL() << "expected LabelCountMismatch";
    } catch (const InferenceError& e) {
        EXPECT_EQ(e.code(), ErrorCode::LabelCountMismatch);
    }
}

TEST(RankingTest, TopPredictionsClampsToSize) {
    Ranking::LabelTable labels{"x", "y", "z"};
    auto ranking = Ranking::rank(labels, {0.2f, 0.5f, 0.3f});

    auto top2 = Ranking::topPredictions(ranking, 2);
    ASSERT_EQ(top2.size(), 2u);
    EXPECT_EQ(top2[0].label, "y");
    EXPECT_EQ(top2[1].label, "z");

    EXPECT_EQ(Ranking::topPredictions(ranking, 10).size(), 3u);
    EXPECT_TRUE(Ranking::topPredictions(ranking, 0).empty());
}

TEST(RankingTest, FormatPrediction) {
    EXPECT_EQ(Ranking::formatPrediction({"neutral", 0.51347f}), "neutral / 51.35%");
    EXPECT_EQ(Ranking::formatPrediction({"fear", 0.0f}), "fear / 0.00%");
    EXPECT_EQ(Ranking::formatPrediction({"happiness", 1.0f}), "happiness / 100.00%");
}

TEST(RankingTest, LoadLabelsSkipsBlankLines) {
    const std::string path = testing::TempDir() + "ranking_labels.txt";
    {
        std::ofstream out(path);
        out << "calm\r\n\nexcited\nbored\n\n";
    }

    auto labels = Ranking::loadLabels(path);
    std::remove(path.c_str());

    ASSERT_EQ(labels.size(), 3u);
    EXPECT_EQ(labels[0], "calm");
    EXPECT_EQ(labels[1], "excited");
    EXPECT_EQ(labels[2], "bored");
}

TEST(RankingTest, LoadLabelsMissingFile) {
    EXPECT_THROW(Ranking::loadLabels("does/not/exist/labels.txt"), std::runtime_error);
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
