#include "core/SimilarityMatrix.hpp"
#include "core/Similarity.hpp"

#include <cstdint>

namespace docsim {

std::vector<std::vector<float>> compute_similarity_matrix(const std::vector<DenseVector>& vectors) {
    const int64_t n = (int64_t)vectors.size();
    std::vector<std::vector<float>> matrix((size_t)n);
    if (n == 0) return matrix;

    #pragma omp parallel for schedule(dynamic)
    for (int64_t i = 0; i < n; ++i) {
        std::vector<float> row((size_t)n, 0.0f);
        for (int64_t j = 0; j < n; ++j) {
            row[(size_t)j] = (i == j) ? 1.0f : cosine_similarity(vectors[(size_t)i], vectors[(size_t)j]);
        }
        matrix[(size_t)i] = std::move(row);
    }

    return matrix;
}

}  // namespace docsim
