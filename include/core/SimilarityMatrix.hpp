#pragma once
#include "core/Vectorize.hpp"

#include <string>
#include <vector>

namespace docsim {

struct SimilarityMatrix {
    std::vector<std::vector<float>> matrix;  // N x N, diagonal is 1.0
    std::vector<std::string> index;          // "doc0", "doc1", ... in input order
};

// rows are computed in parallel; cell [i][i] is set to 1.0 without measuring
std::vector<std::vector<float>> compute_similarity_matrix(const std::vector<DenseVector>& vectors);

}  // namespace docsim
