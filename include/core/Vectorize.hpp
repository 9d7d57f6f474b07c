#pragma once
#include "core/TermStats.hpp"

#include <map>
#include <string>
#include <vector>

namespace docsim {

using DenseVector = std::vector<float>;
using SparseVector = std::map<std::string, float>;  // absent term == weight 0

// position i = tf(vocab[i]) * idf(vocab[i]); 0 when the term is missing from either map
DenseVector vectorize_dense(const TermFrequency& tf,
                            const InverseDocFrequency& idf,
                            const Vocabulary& vocab);

// only the tf map's own terms are present
SparseVector vectorize_sparse(const TermFrequency& tf, const InverseDocFrequency& idf);

}  // namespace docsim
