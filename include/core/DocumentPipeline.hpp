#pragma once
#include "core/SimilarityMatrix.hpp"

#include <string>
#include <vector>

namespace docsim {

// normalize -> tokenize -> tf (per document, parallel) -> idf (once) ->
// vocabulary -> dense vectors (parallel) -> matrix (parallel by row)
SimilarityMatrix analyze_documents(const std::vector<std::string>& documents);

}  // namespace docsim
