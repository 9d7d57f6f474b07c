#include "commands/analyze.hpp"

#include "core/DocumentPipeline.hpp"
#include "io/Artifacts.hpp"
#include "io/DocumentLoader.hpp"
#include "io/JsonIO.hpp"
#include "io/Validation.hpp"

#include <cstddef>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
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

// everything that is neither a flag nor a flag's value; argv[0] is the command name
static std::vector<std::string> positional_args(int argc, char** argv) {
    static const std::unordered_set<std::string> valued = {"--input", "--docs", "--out"};

    std::vector<std::string> out;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (valued.count(a)) { ++i; continue; }
        if (a.rfind("--", 0) == 0) continue;
        out.push_back(a);
    }
    return out;
}

static void print_matrix(const docsim::SimilarityMatrix& m) {
    std::cout << std::setw(8) << "";
    for (const auto& label : m.index) std::cout << std::setw(8) << label;
    std::cout << "\n";

    std::cout << std::fixed << std::setprecision(4);
    for (size_t i = 0; i < m.matrix.size(); ++i) {
        std::cout << std::setw(8) << m.index[i];
        for (float v : m.matrix[i]) std::cout << std::setw(8) << v;
        std::cout << "\n";
    }
    std::cout << std::defaultfloat;
}

int cmd_analyze(int argc, char** argv) {
    try {
        const std::string input = get_arg(argc, argv, "--input", "");
        const std::string docs_dir = get_arg(argc, argv, "--docs", "");
        const fs::path out_path = get_arg(argc, argv, "--out", "out/similarity_matrix.json");

        std::vector<std::string> documents;
        std::vector<std::string> names;

        if (!input.empty()) {
            documents = docio::load_analyze_request(input);
        } else {
            std::vector<std::string> paths = positional_args(argc, argv);
            if (!docs_dir.empty()) {
                for (auto& p : docio::list_text_files(docs_dir)) paths.push_back(std::move(p));
            }

            // document count is checked by validate_documents, not the loader
            docio::LoadLimits limits;
            limits.min_files = 0;
            limits.max_files = std::numeric_limits<size_t>::max();

            docio::LoadResult loaded = docio::load_documents(paths, limits);
            if (!loaded.report.pass) {
                docio::write_error(out_path, loaded.report);
                for (const auto& e : loaded.report.errors) std::cerr << "error: " << e.code << ": " << e.message << "\n";
                std::cerr << "OUT_ERROR: " << out_path.string() << "\n";
                return 1;
            }
            for (auto& d : loaded.documents) {
                names.push_back(d.name);
                documents.push_back(std::move(d.text));
            }
        }

        const docio::ValidationReport rep = docio::validate_documents(documents);
        if (!rep.pass) {
            docio::write_error(out_path, rep);
            for (const auto& e : rep.errors) std::cerr << "error: " << e.code << ": " << e.message << "\n";
            std::cerr << "OUT_ERROR: " << out_path.string() << "\n";
            return 1;
        }

        docio::MatrixArtifact artifact;
        artifact.result = docsim::analyze_documents(documents);
        artifact.write_to(out_path);

        std::cout << "DOCUMENTS: " << documents.size() << "\n";
        for (size_t i = 0; i < names.size(); ++i) {
            std::cout << "INDEX: " << artifact.result.index[i] << " = " << names[i] << "\n";
        }
        std::cout << "\n";
        print_matrix(artifact.result);
        std::cout << "\n";
        std::cout << "OUT_MATRIX: " << out_path.string() << "\n";

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "analyze failed: " << e.what() << "\n";
        return 1;
    }
}
