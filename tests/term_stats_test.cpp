#include <gtest/gtest.h>

#include "core/TermStats.hpp"

#include <cmath>
#include <string>
#include <vector>

using namespace docsim;

TEST(ComputeTf, RelativeFrequencies) {
    const auto tf = compute_tf({"a", "b", "a", "c"});
    ASSERT_EQ(tf.size(), 3u);
    EXPECT_FLOAT_EQ(tf.at("a"), 0.5f);
    EXPECT_FLOAT_EQ(tf.at("b"), 0.25f);
    EXPECT_FLOAT_EQ(tf.at("c"), 0.25f);
}

TEST(ComputeTf, EmptyInputGivesEmptyMap) {
    EXPECT_TRUE(compute_tf({}).empty());
}

TEST(ComputeTf, SumsToOne) {
    const std::vector<std::vector<std::string>> inputs = {
        {"x"},
        {"one", "two", "three"},
        {"a", "a", "a", "b", "c", "c", "d", "e", "f", "g", "g"},
    };
    for (const auto& toks : inputs) {
        const auto tf = compute_tf(toks);
        double sum = 0.0;
        for (const auto& kv : tf) {
            EXPECT_GE(kv.second, 0.0f);
            EXPECT_TRUE(std::isfinite(kv.second));
            sum += kv.second;
        }
        EXPECT_NEAR(sum, 1.0, 1e-5);
    }
}

TEST(ComputeIdf, SmoothedFormula) {
    const std::vector<TermFrequency> tfs = {
        compute_tf({"a", "b"}),
        compute_tf({"a"}),
    };
    const auto idf = compute_idf(tfs);
    ASSERT_EQ(idf.size(), 2u);
    EXPECT_NEAR(idf.at("a"), 1.0f, 1e-6);                           // ln(3/3) + 1
    EXPECT_NEAR(idf.at("b"), std::log(3.0 / 2.0) + 1.0, 1e-6);     // ln(3/2) + 1
}

TEST(ComputeIdf, EmptyCorpus) {
    EXPECT_TRUE(compute_idf({}).empty());
}

TEST(ComputeIdf, CountsPresenceNotMagnitude) {
    const std::vector<TermFrequency> tfs = {
        compute_tf({"a", "a", "a", "a", "b"}),
        compute_tf({"a", "c", "c", "c"}),
        compute_tf({"d"}),
    };
    const auto idf = compute_idf(tfs);
    // df(a) = 2 in a corpus of 3
    EXPECT_NEAR(idf.at("a"), std::log(4.0 / 3.0) + 1.0, 1e-6);
    EXPECT_FLOAT_EQ(idf.at("b"), idf.at("c"));
    EXPECT_FLOAT_EQ(idf.at("c"), idf.at("d"));
}

TEST(ComputeIdf, PositiveAndMonotoneInRarity) {
    const std::vector<TermFrequency> tfs = {
        compute_tf({"common", "rare", "mid"}),
        compute_tf({"common", "mid"}),
        compute_tf({"common"}),
        compute_tf({"common", "other"}),
    };
    const auto idf = compute_idf(tfs);
    for (const auto& kv : idf) EXPECT_GT(kv.second, 0.0f) << kv.first;

    EXPECT_GE(idf.at("rare"), idf.at("mid"));
    EXPECT_GE(idf.at("mid"), idf.at("common"));
    EXPECT_FLOAT_EQ(idf.at("rare"), idf.at("other"));
}

TEST(BuildVocabulary, SortedAndDistinct) {
    const std::vector<TermFrequency> tfs = {
        compute_tf({"zeta", "alpha"}),
        compute_tf({"mid", "alpha"}),
    };
    const auto vocab = build_vocabulary(compute_idf(tfs));
    const Vocabulary expected = {"alpha", "mid", "zeta"};
    EXPECT_EQ(vocab, expected);
}
