#include "io/Validation.hpp"
#include "core/TextUtil.hpp"

#include <cmath>
#include <cstdlib>
#include <sstream>

namespace docio {

void add_error(ValidationReport& rep, const std::string& code, const std::string& msg, long index) {
    rep.pass = false;
    ValidationError e;
    e.code = code;
    e.message = msg;
    e.index = index;
    rep.errors.push_back(std::move(e));
}

ValidationReport validate_documents(const std::vector<std::string>& documents) {
    ValidationReport rep;

    if (documents.empty()) {
        add_error(rep, "NO_DOCUMENTS", "No documents provided");
        return rep;
    }

    if (documents.size() < kMinDocuments) {
        std::ostringstream oss;
        oss << "Not enough documents: minimum " << kMinDocuments
            << " required for comparison, got " << documents.size();
        add_error(rep, "NOT_ENOUGH_DOCUMENTS", oss.str());
        return rep;
    }

    if (documents.size() > kMaxDocuments) {
        std::ostringstream oss;
        oss << "Too many documents: " << documents.size()
            << ", maximum allowed is " << kMaxDocuments;
        add_error(rep, "TOO_MANY_DOCUMENTS", oss.str());
        return rep;
    }

    for (size_t i = 0; i < documents.size(); ++i) {
        if (textutil::trim(documents[i]).empty()) {
            add_error(rep, "EMPTY_DOCUMENT", "Empty document at index " + std::to_string(i), (long)i);
            return rep;
        }
        if (documents[i].size() > kMaxDocumentLength) {
            std::ostringstream oss;
            oss << "Document at index " << i << " exceeds maximum length of "
                << kMaxDocumentLength << " characters";
            add_error(rep, "DOCUMENT_TOO_LONG", oss.str(), (long)i);
            return rep;
        }
    }

    return rep;
}

ValidationReport validate_sentence_documents(const std::vector<docsim::SentenceDocument>& documents) {
    ValidationReport rep;
    for (size_t i = 0; i < documents.size(); ++i) {
        if (documents[i].sentences.empty()) {
            add_error(rep, "EMPTY_DOCUMENT",
                      "Document '" + documents[i].filename + "' contains no text or sentences", (long)i);
            return rep;
        }
    }
    return rep;
}

ValidationReport parse_threshold(const std::string& raw, float& out) {
    ValidationReport rep;

    const std::string s = textutil::trim(raw);

    // strtof also takes hex floats; only decimal notation is a valid threshold
    const size_t sign = (!s.empty() && (s[0] == '+' || s[0] == '-')) ? 1 : 0;
    const bool hex = s.size() > sign + 1 && s[sign] == '0' &&
                     (s[sign + 1] == 'x' || s[sign + 1] == 'X');

    char* end = nullptr;
    const float v = s.empty() ? 0.0f : std::strtof(s.c_str(), &end);
    if (s.empty() || hex || end == s.c_str() || *end != '\0' || std::isnan(v)) {
        add_error(rep, "INVALID_THRESHOLD",
                  "Invalid threshold value: '" + raw + "'. Must be a number between 0.0 and 1.0");
        return rep;
    }

    if (v < 0.0f || v > 1.0f) {
        std::ostringstream oss;
        oss << "Threshold " << v << " out of range. Must be between 0.0 and 1.0";
        add_error(rep, "INVALID_THRESHOLD_RANGE", oss.str());
        return rep;
    }

    out = v;
    return rep;
}

}  // namespace docio
