#include "core/TermStats.hpp"

#include <cmath>
#include <cstdint>

namespace docsim {

TermFrequency compute_tf(const std::vector<std::string>& tokens) {
    TermFrequency tf;
    if (tokens.empty()) return tf;

    std::map<std::string, uint32_t> counts;
    for (const auto& t : tokens) counts[t] += 1;

    const double total = static_cast<double>(tokens.size());
    for (const auto& kv : counts) {
        tf.emplace_hint(tf.end(), kv.first, static_cast<float>(kv.second / total));
    }
    return tf;
}

InverseDocFrequency compute_idf(const std::vector<TermFrequency>& tfs) {
    InverseDocFrequency idf;
    if (tfs.empty()) return idf;

    // presence only: each member contributes at most 1 per term
    std::map<std::string, uint32_t> df_map;
    for (const auto& tf : tfs) {
        for (const auto& kv : tf) df_map[kv.first] += 1;
    }

    const double n = static_cast<double>(tfs.size());
    for (const auto& kv : df_map) {
        const double df = static_cast<double>(kv.second);
        const double w = std::log((n + 1.0) / (df + 1.0)) + 1.0;
        idf.emplace_hint(idf.end(), kv.first, static_cast<float>(w));
    }
    return idf;
}

Vocabulary build_vocabulary(const InverseDocFrequency& idf) {
    Vocabulary vocab;
    vocab.reserve(idf.size());
    for (const auto& kv : idf) vocab.push_back(kv.first);
    return vocab;
}

}  // namespace docsim
