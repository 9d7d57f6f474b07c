#include <gtest/gtest.h>

#include "core/SimilarityMatrix.hpp"

#include <vector>

using namespace docsim;

TEST(SimilarityMatrix, EmptyInput) {
    EXPECT_TRUE(compute_similarity_matrix({}).empty());
}

TEST(SimilarityMatrix, SingleVector) {
    const std::vector<DenseVector> v = {DenseVector{1.0f, 2.0f, 3.0f}};
    const auto m = compute_similarity_matrix(v);
    ASSERT_EQ(m.size(), 1u);
    ASSERT_EQ(m[0].size(), 1u);
    EXPECT_EQ(m[0][0], 1.0f);
}

TEST(SimilarityMatrix, DiagonalIsExactlyOne) {
    // includes a zero vector, whose measured self-similarity would be 0
    const std::vector<DenseVector> v = {{1, 2}, {3, 4}, {5, 6}, {0, 0}};
    const auto m = compute_similarity_matrix(v);
    ASSERT_EQ(m.size(), v.size());
    for (size_t i = 0; i < v.size(); ++i) {
        ASSERT_EQ(m[i].size(), v.size());
        EXPECT_EQ(m[i][i], 1.0f);
    }
    EXPECT_EQ(m[3][0], 0.0f);
}

TEST(SimilarityMatrix, Symmetric) {
    const std::vector<DenseVector> v = {{1, 0, 2}, {1, 1, 0}, {0, 1, 3}, {4, 0, 1}};
    const auto m = compute_similarity_matrix(v);
    for (size_t i = 0; i < v.size(); ++i) {
        for (size_t j = 0; j < v.size(); ++j) {
            EXPECT_NEAR(m[i][j], m[j][i], 1e-6);
        }
    }
}

TEST(SimilarityMatrix, IdenticalAndOrthogonal) {
    const std::vector<DenseVector> v = {{1, 2, 3}, {1, 2, 3}, {0, 0, 0}, {-3, 0, 1}};
    const auto m = compute_similarity_matrix(v);
    EXPECT_NEAR(m[0][1], 1.0f, 1e-6);
    EXPECT_NEAR(m[1][0], 1.0f, 1e-6);
    EXPECT_NEAR(m[0][3], 0.0f, 1e-6);
    EXPECT_EQ(m[0][2], 0.0f);
}
