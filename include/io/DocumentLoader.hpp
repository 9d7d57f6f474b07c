#pragma once
#include "io/Validation.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace docio {

enum class FileType {
    Pdf,
    Docx,
    Txt
};

struct SourceDocument {
    std::string name;  // file name with extension, e.g. "essay.txt"
    std::string text;  // extracted, trimmed text
};

struct LoadLimits {
    size_t max_file_bytes = 10u * 1024u * 1024u;
    size_t max_total_bytes = 50u * 1024u * 1024u;
    size_t max_files = 5;
    size_t min_files = 2;
};

struct LoadResult {
    std::vector<SourceDocument> documents;
    ValidationReport report;
};

// case-insensitive extension match
std::optional<FileType> file_type_from_name(const std::string& filename);

bool is_valid_utf8(const std::string& bytes);

std::string read_all(const std::string& path);  // throws on open failure

// regular *.txt files in dir, sorted by file name
std::vector<std::string> list_text_files(const std::string& dir);

// Checks count/size limits and extracts text. Rule violations go into
// result.report (loading stops at the first one); I/O failures throw.
LoadResult load_documents(const std::vector<std::string>& paths, const LoadLimits& limits = {});

}  // namespace docio
