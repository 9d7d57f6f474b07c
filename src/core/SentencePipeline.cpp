#include "core/SentencePipeline.hpp"
#include "core/Similarity.hpp"
#include "core/TermStats.hpp"
#include "core/TextUtil.hpp"
#include "core/Vectorize.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>

namespace docsim {

struct SentenceRef {
    size_t doc_index = 0;
    size_t sentence_index = 0;
};

struct SentenceVector {
    SentenceRef ref;
    SparseVector vector;
};

static std::vector<SentenceRef> flatten(const std::vector<SentenceDocument>& documents) {
    std::vector<SentenceRef> refs;
    for (size_t d = 0; d < documents.size(); ++d) {
        for (size_t s = 0; s < documents[d].sentences.size(); ++s) {
            refs.push_back({d, s});
        }
    }
    return refs;
}

static const std::string& sentence_text(const std::vector<SentenceDocument>& documents, const SentenceRef& r) {
    return documents[r.doc_index].sentences[r.sentence_index];
}

static std::vector<SentenceVector> vectorize_sentences(const std::vector<SentenceDocument>& documents,
                                                       const std::vector<SentenceRef>& refs) {
    const int64_t n = (int64_t)refs.size();
    std::vector<TermFrequency> tfs((size_t)n);

    #pragma omp parallel for schedule(dynamic)
    for (int64_t i = 0; i < n; ++i) {
        const auto norm = textutil::normalize(sentence_text(documents, refs[(size_t)i]));
        tfs[(size_t)i] = compute_tf(textutil::tokenize(norm));
    }

    // shared across all documents' sentences, not per document
    const InverseDocFrequency idf = compute_idf(tfs);

    std::vector<SentenceVector> out((size_t)n);

    #pragma omp parallel for schedule(dynamic)
    for (int64_t i = 0; i < n; ++i) {
        out[(size_t)i].ref = refs[(size_t)i];
        out[(size_t)i].vector = vectorize_sparse(tfs[(size_t)i], idf);
    }
    return out;
}

static std::vector<SentenceMatch> compute_matches(const std::vector<SentenceVector>& vectors,
                                                  const std::vector<SentenceDocument>& documents,
                                                  float threshold) {
    const int64_t n = (int64_t)vectors.size();
    std::vector<std::vector<SentenceMatch>> buckets((size_t)n);

    #pragma omp parallel for schedule(dynamic)
    for (int64_t i = 0; i < n; ++i) {
        const SentenceVector& a = vectors[(size_t)i];
        auto& bucket = buckets[(size_t)i];

        for (int64_t j = i + 1; j < n; ++j) {
            const SentenceVector& b = vectors[(size_t)j];
            if (a.ref.doc_index == b.ref.doc_index) continue;

            const float sim = cosine_similarity(a.vector, b.vector);
            if (sim < threshold) continue;

            SentenceMatch m;
            m.source_doc = documents[a.ref.doc_index].filename;
            m.source_sentence_index = a.ref.sentence_index;
            m.source_sentence = sentence_text(documents, a.ref);
            m.target_doc = documents[b.ref.doc_index].filename;
            m.target_sentence_index = b.ref.sentence_index;
            m.target_sentence = sentence_text(documents, b.ref);
            m.similarity = sim;
            bucket.push_back(std::move(m));
        }
    }

    std::vector<SentenceMatch> matches;
    for (auto& bucket : buckets) {
        for (auto& m : bucket) matches.push_back(std::move(m));
    }

    std::stable_sort(matches.begin(), matches.end(), [](const SentenceMatch& x, const SentenceMatch& y) {
        return x.similarity > y.similarity;
    });
    return matches;
}

static std::vector<GlobalSimilarity> compute_global(const std::vector<SentenceVector>& vectors,
                                                    const std::vector<SentenceDocument>& documents) {
    // vectors are flattened in document order, so each document owns a contiguous range
    std::vector<std::pair<size_t, size_t>> ranges(documents.size(), {0, 0});
    size_t pos = 0;
    for (size_t d = 0; d < documents.size(); ++d) {
        ranges[d] = {pos, pos + documents[d].sentences.size()};
        pos += documents[d].sentences.size();
    }

    std::vector<std::pair<size_t, size_t>> pairs;
    for (size_t a = 0; a < documents.size(); ++a) {
        for (size_t b = a + 1; b < documents.size(); ++b) pairs.push_back({a, b});
    }

    const int64_t np = (int64_t)pairs.size();
    std::vector<GlobalSimilarity> slots((size_t)np);
    std::vector<char> present((size_t)np, 0);

    #pragma omp parallel for schedule(dynamic)
    for (int64_t p = 0; p < np; ++p) {
        const auto ra = ranges[pairs[(size_t)p].first];
        const auto rb = ranges[pairs[(size_t)p].second];
        if (ra.first == ra.second || rb.first == rb.second) continue;

        double sum = 0.0;
        for (size_t i = ra.first; i < ra.second; ++i) {
            for (size_t j = rb.first; j < rb.second; ++j) {
                sum += cosine_similarity(vectors[i].vector, vectors[j].vector);
            }
        }
        const double count = (double)(ra.second - ra.first) * (double)(rb.second - rb.first);

        GlobalSimilarity g;
        g.doc_a = documents[pairs[(size_t)p].first].filename;
        g.doc_b = documents[pairs[(size_t)p].second].filename;
        g.score = (float)(sum / count);
        slots[(size_t)p] = std::move(g);
        present[(size_t)p] = 1;
    }

    std::vector<GlobalSimilarity> out;
    out.reserve(slots.size());
    for (size_t p = 0; p < slots.size(); ++p) {
        if (present[p]) out.push_back(std::move(slots[p]));
    }

    std::stable_sort(out.begin(), out.end(), [](const GlobalSimilarity& x, const GlobalSimilarity& y) {
        return x.score > y.score;
    });
    return out;
}

SentenceAnalysis analyze_sentence_similarity(const std::vector<SentenceDocument>& documents,
                                             float threshold) {
    SentenceAnalysis result;

    const std::vector<SentenceRef> refs = flatten(documents);
    if (refs.empty()) return result;

    const std::vector<SentenceVector> vectors = vectorize_sentences(documents, refs);

    result.matches = compute_matches(vectors, documents, threshold);
    result.global_similarity = compute_global(vectors, documents);
    return result;
}

}  // namespace docsim
