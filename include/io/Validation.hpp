#pragma once

#include "core/SentencePipeline.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace docio {

constexpr size_t kMinDocuments = 2;
constexpr size_t kMaxDocuments = 100;
constexpr size_t kMaxDocumentLength = 50000;
constexpr float kDefaultThreshold = 0.70f;

struct ValidationError {
    std::string code;     // e.g. "EMPTY_DOCUMENT"
    std::string message;
    long index = -1;      // offending document, -1 when not about one document
};

struct ValidationReport {
    bool pass = true;
    std::vector<ValidationError> errors;
};

void add_error(ValidationReport& rep, const std::string& code, const std::string& msg, long index = -1);

// first failing rule wins
ValidationReport validate_documents(const std::vector<std::string>& documents);

ValidationReport validate_sentence_documents(const std::vector<docsim::SentenceDocument>& documents);

// raw is the trimmed decimal value of a given threshold; an empty value is
// INVALID_THRESHOLD. Callers apply kDefaultThreshold when no value was given.
ValidationReport parse_threshold(const std::string& raw, float& out);

}  // namespace docio
