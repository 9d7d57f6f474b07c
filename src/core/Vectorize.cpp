#include "core/Vectorize.hpp"

namespace docsim {

static float lookup(const std::map<std::string, float>& m, const std::string& key) {
    auto it = m.find(key);
    return (it == m.end()) ? 0.0f : it->second;
}

DenseVector vectorize_dense(const TermFrequency& tf,
                            const InverseDocFrequency& idf,
                            const Vocabulary& vocab) {
    DenseVector v;
    v.reserve(vocab.size());
    for (const auto& term : vocab) {
        v.push_back(lookup(tf, term) * lookup(idf, term));
    }
    return v;
}

SparseVector vectorize_sparse(const TermFrequency& tf, const InverseDocFrequency& idf) {
    SparseVector v;
    for (const auto& kv : tf) {
        v.emplace_hint(v.end(), kv.first, kv.second * lookup(idf, kv.first));
    }
    return v;
}

}  // namespace docsim
