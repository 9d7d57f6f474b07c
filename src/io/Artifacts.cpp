#include "io/Artifacts.hpp"

#include <fstream>
#include <stdexcept>

namespace docio {

static void write_json(const std::filesystem::path& out_path, const nlohmann::json& j) {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << j.dump(2) << "\n";
}

static nlohmann::json match_to_json(const docsim::SentenceMatch& m) {
    return {
        {"source_doc", m.source_doc},
        {"source_sentence_index", m.source_sentence_index},
        {"source_sentence", m.source_sentence},
        {"target_doc", m.target_doc},
        {"target_sentence_index", m.target_sentence_index},
        {"target_sentence", m.target_sentence},
        {"similarity", m.similarity}
    };
}

nlohmann::json MatrixArtifact::to_json() const {
    nlohmann::json j;
    j["similarity_matrix"] = result.matrix;
    j["index"] = result.index;
    return j;
}

void MatrixArtifact::write_to(const std::filesystem::path& out_path) const {
    write_json(out_path, to_json());
}

nlohmann::json SentenceAnalysisArtifact::to_json() const {
    nlohmann::json j;

    j["metadata"] = {
        {"documents_count", metadata.documents_count},
        {"total_sentences", metadata.total_sentences},
        {"processing_time_ms", metadata.processing_time_ms},
        {"threshold", metadata.threshold},
    };

    nlohmann::json matches = nlohmann::json::array();
    for (const auto& m : analysis.matches) {
        matches.push_back(match_to_json(m));
    }
    j["matches"] = matches;

    nlohmann::json global = nlohmann::json::array();
    for (const auto& g : analysis.global_similarity) {
        global.push_back({{"docA", g.doc_a}, {"docB", g.doc_b}, {"score", g.score}});
    }
    j["global_similarity"] = global;

    return j;
}

void SentenceAnalysisArtifact::write_to(const std::filesystem::path& out_path) const {
    write_json(out_path, to_json());
}

nlohmann::json error_to_json(const ValidationReport& rep) {
    if (rep.errors.empty()) {
        return {{"error", "Internal server error: empty validation report"}, {"code", "INTERNAL_ERROR"}};
    }
    const ValidationError& e = rep.errors.front();
    return {{"error", e.message}, {"code", e.code}};
}

void write_error(const std::filesystem::path& out_path, const ValidationReport& rep) {
    write_json(out_path, error_to_json(rep));
}

}  // namespace docio
