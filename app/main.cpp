#include "commands/analyze.hpp"
#include "commands/compare.hpp"
#include "commands/sentences.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  docsim analyze [args]\n"
        << "  docsim compare [args]\n"
        << "  docsim sentences <file.txt>\n"
        << "  docsim help\n";
    return 1;
}

static int print_analyze_help() {
    std::cerr
        << "usage:\n"
        << "  docsim analyze [options] [file.txt ...]\n"
        << "\n"
        << "inputs (documents are labelled doc0, doc1, ... in this order):\n"
        << "  --input <path>               JSON request: {\"documents\": [\"...\", ...]}\n"
        << "  --docs <dir>                 every *.txt in dir, sorted by name (after listed files)\n"
        << "\n"
        << "limits:\n"
        << "  2..100 documents, each non-blank and at most 50000 bytes\n"
        << "\n"
        << "output:\n"
        << "  --out <path>                 default: out/similarity_matrix.json\n";
    return 0;
}

static int print_compare_help() {
    std::cerr
        << "usage:\n"
        << "  docsim compare [options] <file.txt> <file.txt> [...]\n"
        << "\n"
        << "inputs:\n"
        << "  --docs <dir>                 every *.txt in dir, sorted by name (after listed files)\n"
        << "  2..5 files, 10 MiB each, 50 MiB total\n"
        << "\n"
        << "matching:\n"
        << "  --threshold <f>              default: 0.70, range [0, 1]\n"
        << "\n"
        << "output:\n"
        << "  --out <path>                 default: out/sentence_analysis.json\n"
        << "  --top <n>                    matches printed to console, default: 10\n"
        << "  --report <path>              optional: mirror console output to a file\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    // subcommand help
    if (cmd == "analyze" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_analyze_help();
    if (cmd == "compare" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_compare_help();

    if (cmd == "sentences") {
        if (argc < 3) {
            std::cerr << "error: missing file\n";
            return print_usage();
        }
        return cmd_sentences(argv[2]);
    }

    if (cmd == "analyze") return cmd_analyze(argc - 1, argv + 1);
    if (cmd == "compare") return cmd_compare(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
