#pragma once
#include <map>
#include <string>
#include <vector>

namespace docsim {

// Ordered by term so every sum over a map runs in the same order on every run.
using TermFrequency = std::map<std::string, float>;   // term -> count / total
using InverseDocFrequency = std::map<std::string, float>;  // term -> smoothed idf
using Vocabulary = std::vector<std::string>;          // sorted, distinct

TermFrequency compute_tf(const std::vector<std::string>& tokens);

// idf = ln((N + 1) / (df + 1)) + 1, df counts members containing the term
InverseDocFrequency compute_idf(const std::vector<TermFrequency>& tfs);

Vocabulary build_vocabulary(const InverseDocFrequency& idf);

}  // namespace docsim
