#include "commands/compare.hpp"

#include "core/SentencePipeline.hpp"
#include "core/TextUtil.hpp"
#include "io/Artifacts.hpp"
#include "io/DocumentLoader.hpp"
#include "io/Validation.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <unordered_set>
#include <vector>

namespace fs = std::filesystem;

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static bool has_arg(int argc, char** argv, const std::string& key) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static int get_arg_int(int argc, char** argv, const std::string& key, int def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try { return std::stoi(s); } catch (const std::exception&) { return def; }
}

static std::vector<std::string> positional_args(int argc, char** argv) {
    static const std::unordered_set<std::string> valued = {
        "--threshold", "--docs", "--out", "--top", "--report"
    };

    std::vector<std::string> out;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (valued.count(a)) { ++i; continue; }
        if (a.rfind("--", 0) == 0) continue;
        out.push_back(a);
    }
    return out;
}

struct Printer {
    std::ostream* a = nullptr;
    std::ostream* b = nullptr;
    template <typename T>
    Printer& operator<<(const T& v) {
        if (a) (*a) << v;
        if (b) (*b) << v;
        return *this;
    }
    Printer& operator<<(std::ostream& (*manip)(std::ostream&)) {
        if (a) manip(*a);
        if (b) manip(*b);
        return *this;
    }
};

static bool open_out(std::ofstream& out, const std::string& out_path) {
    if (out_path.empty()) return false;
    try {
        fs::path p(out_path);
        if (p.has_parent_path()) fs::create_directories(p.parent_path());
        out.open(p, std::ios::out | std::ios::trunc);
        return (bool)out;
    } catch (const fs::filesystem_error&) {
        return false;
    }
}

static void report_failure(const fs::path& out_path, const docio::ValidationReport& rep) {
    docio::write_error(out_path, rep);
    for (const auto& e : rep.errors) std::cerr << "error: " << e.code << ": " << e.message << "\n";
    std::cerr << "OUT_ERROR: " << out_path.string() << "\n";
}

static void print_results(Printer& pr, const docio::SentenceAnalysisArtifact& art, size_t top) {
    const auto& matches = art.analysis.matches;

    pr << "\nMATCHES (" << matches.size() << " >= " << art.metadata.threshold << ")\n";
    const size_t shown = std::min(top, matches.size());
    for (size_t i = 0; i < shown; ++i) {
        const auto& m = matches[i];
        pr << std::fixed << std::setprecision(4) << m.similarity << std::defaultfloat
           << "  " << m.source_doc << "#" << m.source_sentence_index
           << " <-> " << m.target_doc << "#" << m.target_sentence_index << "\n";
        pr << "    " << m.source_sentence << "\n";
        pr << "    " << m.target_sentence << "\n";
    }
    if (shown < matches.size()) pr << "  ... " << (matches.size() - shown) << " more\n";

    pr << "\nGLOBAL\n";
    for (const auto& g : art.analysis.global_similarity) {
        pr << std::fixed << std::setprecision(4) << g.score << std::defaultfloat
           << "  " << g.doc_a << " <-> " << g.doc_b << "\n";
    }
}

int cmd_compare(int argc, char** argv) {
    try {
        const auto start = std::chrono::steady_clock::now();

        const fs::path out_path = get_arg(argc, argv, "--out", "out/sentence_analysis.json");
        const std::string docs_dir = get_arg(argc, argv, "--docs", "");
        const std::string report_path = get_arg(argc, argv, "--report", "");
        const int top_i = get_arg_int(argc, argv, "--top", 10);
        const size_t top = (top_i <= 0) ? 0u : static_cast<size_t>(top_i);

        float threshold = docio::kDefaultThreshold;
        if (has_arg(argc, argv, "--threshold")) {
            const docio::ValidationReport trep =
                docio::parse_threshold(get_arg(argc, argv, "--threshold", ""), threshold);
            if (!trep.pass) {
                report_failure(out_path, trep);
                return 1;
            }
        }

        std::vector<std::string> paths = positional_args(argc, argv);
        if (!docs_dir.empty()) {
            for (auto& p : docio::list_text_files(docs_dir)) paths.push_back(std::move(p));
        }

        docio::LoadResult loaded = docio::load_documents(paths);
        if (!loaded.report.pass) {
            report_failure(out_path, loaded.report);
            return 1;
        }

        std::vector<docsim::SentenceDocument> documents;
        documents.reserve(loaded.documents.size());
        for (const auto& d : loaded.documents) {
            documents.push_back({d.name, textutil::split_sentences(d.text)});
        }

        const docio::ValidationReport srep = docio::validate_sentence_documents(documents);
        if (!srep.pass) {
            report_failure(out_path, srep);
            return 1;
        }

        docio::SentenceAnalysisArtifact art;
        art.analysis = docsim::analyze_sentence_similarity(documents, threshold);

        art.metadata.documents_count = documents.size();
        for (const auto& d : documents) art.metadata.total_sentences += d.sentences.size();
        art.metadata.threshold = threshold;
        art.metadata.processing_time_ms = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());

        art.write_to(out_path);

        std::ofstream report;
        Printer pr;
        pr.a = &std::cout;
        if (open_out(report, report_path)) pr.b = &report;
        else if (!report_path.empty()) std::cerr << "error: cannot open --report path: " << report_path << "\n";

        pr << "DOCUMENTS: " << art.metadata.documents_count << "\n";
        pr << "SENTENCES: " << art.metadata.total_sentences << "\n";
        pr << "THRESHOLD: " << art.metadata.threshold << "\n";
        pr << "ELAPSED_MS: " << art.metadata.processing_time_ms << "\n";
        print_results(pr, art, top);
        pr << "\nOUT_ANALYSIS: " << out_path.string() << "\n";

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "compare failed: " << e.what() << "\n";
        return 1;
    }
}
