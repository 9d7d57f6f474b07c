#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace docsim {

struct SentenceDocument {
    std::string filename;                 // label used in results
    std::vector<std::string> sentences;   // order is the reported sentence index
};

// cross-document sentence pair with similarity >= threshold
struct SentenceMatch {
    std::string source_doc;
    size_t source_sentence_index = 0;
    std::string source_sentence;

    std::string target_doc;
    size_t target_sentence_index = 0;
    std::string target_sentence;

    float similarity = 0.0f;
};

// mean cosine over every sentence of doc_a against every sentence of doc_b
struct GlobalSimilarity {
    std::string doc_a;
    std::string doc_b;
    float score = 0.0f;
};

struct SentenceAnalysis {
    std::vector<SentenceMatch> matches;              // score descending
    std::vector<GlobalSimilarity> global_similarity; // score descending
};

// One idf is computed over every sentence of every document. Same-document
// pairs never match. Equal scores keep generation order.
SentenceAnalysis analyze_sentence_similarity(const std::vector<SentenceDocument>& documents,
                                             float threshold);

}  // namespace docsim
