#pragma once
#include "core/Vectorize.hpp"

namespace docsim {

// dot(a, b) / (|a| * |b|). Returns 0 for length mismatch, empty input, or a zero magnitude.
float cosine_similarity(const DenseVector& a, const DenseVector& b);

// dot over shared terms only, magnitudes over each side's full weights
float cosine_similarity(const SparseVector& a, const SparseVector& b);

}  // namespace docsim
