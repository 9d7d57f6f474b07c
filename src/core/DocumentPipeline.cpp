#include "core/DocumentPipeline.hpp"
#include "core/TermStats.hpp"
#include "core/TextUtil.hpp"
#include "core/Vectorize.hpp"

#include <cstdint>

namespace docsim {

SimilarityMatrix analyze_documents(const std::vector<std::string>& documents) {
    SimilarityMatrix result;
    if (documents.empty()) return result;

    const int64_t n = (int64_t)documents.size();

    result.index.reserve(documents.size());
    for (int64_t i = 0; i < n; ++i) result.index.push_back("doc" + std::to_string(i));

    std::vector<TermFrequency> tfs((size_t)n);

    #pragma omp parallel for schedule(dynamic)
    for (int64_t i = 0; i < n; ++i) {
        const auto norm = textutil::normalize(documents[(size_t)i]);
        const auto toks = textutil::tokenize(norm);
        tfs[(size_t)i] = compute_tf(toks);
    }

    // every tf is visible past the region's implicit barrier
    const InverseDocFrequency idf = compute_idf(tfs);
    const Vocabulary vocab = build_vocabulary(idf);

    std::vector<DenseVector> vectors((size_t)n);

    #pragma omp parallel for schedule(dynamic)
    for (int64_t i = 0; i < n; ++i) {
        vectors[(size_t)i] = vectorize_dense(tfs[(size_t)i], idf, vocab);
    }

    result.matrix = compute_similarity_matrix(vectors);
    return result;
}

}  // namespace docsim
