#include "commands/sentences.hpp"

#include "core/TextUtil.hpp"
#include "io/DocumentLoader.hpp"

#include <iostream>
#include <vector>

int cmd_sentences(const std::string& path) {
    docio::LoadLimits limits;
    limits.min_files = 1;
    limits.max_files = 1;

    docio::LoadResult loaded;
    try {
        loaded = docio::load_documents({path}, limits);
    } catch (const std::exception& e) {
        std::cerr << "[error] failed to load document: " << e.what() << "\n";
        return 1;
    }

    if (!loaded.report.pass) {
        for (const auto& e : loaded.report.errors) std::cerr << "[error] " << e.code << ": " << e.message << "\n";
        return 1;
    }

    const auto& doc = loaded.documents.front();
    const std::vector<std::string> sentences = textutil::split_sentences(doc.text);

    std::cout << "[Document] " << doc.name << " (" << sentences.size() << " sentences)\n";
    for (size_t i = 0; i < sentences.size(); ++i) {
        std::cout << "  [" << i << "] " << sentences[i] << "\n";
    }

    return 0;
}
