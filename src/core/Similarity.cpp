#include "core/Similarity.hpp"

#include <cmath>

namespace docsim {

static double dot_sparse(const SparseVector& a, const SparseVector& b) {
    // both maps are key-ordered, so walk them together
    auto ia = a.begin();
    auto ib = b.begin();
    double s = 0.0;
    while (ia != a.end() && ib != b.end()) {
        if (ia->first == ib->first) {
            s += (double)ia->second * (double)ib->second;
            ++ia; ++ib;
        } else if (ia->first < ib->first) {
            ++ia;
        } else {
            ++ib;
        }
    }
    return s;
}

static double norm2_sparse(const SparseVector& v) {
    double s = 0.0;
    for (const auto& kv : v) s += (double)kv.second * (double)kv.second;
    return s;
}

float cosine_similarity(const DenseVector& a, const DenseVector& b) {
    if (a.size() != b.size() || a.empty()) return 0.0f;

    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double x = a[i], y = b[i];
        dot += x * y;
        na += x * x;
        nb += y * y;
    }
    if (na == 0.0 || nb == 0.0) return 0.0f;
    return (float)(dot / (std::sqrt(na) * std::sqrt(nb)));
}

float cosine_similarity(const SparseVector& a, const SparseVector& b) {
    const double na = norm2_sparse(a);
    const double nb = norm2_sparse(b);
    if (na == 0.0 || nb == 0.0) return 0.0f;
    return (float)(dot_sparse(a, b) / (std::sqrt(na) * std::sqrt(nb)));
}

}  // namespace docsim
