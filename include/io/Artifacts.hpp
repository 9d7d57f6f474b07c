#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "core/SentencePipeline.hpp"
#include "core/SimilarityMatrix.hpp"
#include "io/Validation.hpp"

namespace docio {

struct MatrixArtifact {
    docsim::SimilarityMatrix result;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

struct AnalysisMetadata {
    size_t documents_count = 0;
    size_t total_sentences = 0;
    uint64_t processing_time_ms = 0;
    float threshold = 0.0f;
};

struct SentenceAnalysisArtifact {
    AnalysisMetadata metadata;
    docsim::SentenceAnalysis analysis;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

// {"error": ..., "code": ...} for the first error in the report
nlohmann::json error_to_json(const ValidationReport& rep);
void write_error(const std::filesystem::path& out_path, const ValidationReport& rep);

}  // namespace docio
