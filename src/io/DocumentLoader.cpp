#include "io/DocumentLoader.hpp"
#include "core/TextUtil.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace docio {

static std::string to_lower_copy(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::optional<FileType> file_type_from_name(const std::string& filename) {
    const fs::path p(filename);
    if (!p.has_extension()) return std::nullopt;

    const std::string ext = to_lower_copy(p.extension().string());
    if (ext == ".pdf") return FileType::Pdf;
    if (ext == ".docx") return FileType::Docx;
    if (ext == ".txt") return FileType::Txt;
    return std::nullopt;
}

bool is_valid_utf8(const std::string& bytes) {
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        const unsigned char c = static_cast<unsigned char>(bytes[i]);
        size_t len = 0;
        uint32_t cp = 0;

        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            const unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // overlong forms, surrogates, out of range
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        if (cp > 0x10FFFF) return false;

        i += len;
    }
    return true;
}

std::string read_all(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("failed to open: " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::vector<std::string> list_text_files(const std::string& dir) {
    fs::path root(dir);
    if (!fs::exists(root)) throw std::runtime_error("dir not found: " + dir);
    if (!fs::is_directory(root)) throw std::runtime_error("not a directory: " + dir);

    std::vector<std::string> out;
    for (auto& entry : fs::directory_iterator(root)) {
        if (!entry.is_regular_file()) continue;
        auto p = entry.path();
        if (to_lower_copy(p.extension().string()) != ".txt") continue;
        out.push_back(p.string());
    }

    // directory_iterator order is unspecified
    std::sort(out.begin(), out.end(), [](const std::string& a, const std::string& b) {
        return fs::path(a).filename().string() < fs::path(b).filename().string();
    });
    return out;
}

static bool extract_text(const std::string& name, const std::string& bytes, FileType type,
                         std::string& out, ValidationReport& rep, long index) {
    switch (type) {
        case FileType::Txt:
            if (!is_valid_utf8(bytes)) {
                add_error(rep, "EXTRACTION_ERROR",
                          "Failed to extract text from '" + name + "': file is not valid UTF-8", index);
                return false;
            }
            out = textutil::trim(bytes);
            return true;
        case FileType::Pdf:
        case FileType::Docx:
        default:
            add_error(rep, "UNSUPPORTED_FILE_TYPE",
                      "Unsupported file type: " + name + ". Allowed: TXT", index);
            return false;
    }
}

LoadResult load_documents(const std::vector<std::string>& paths, const LoadLimits& limits) {
    LoadResult res;
    ValidationReport& rep = res.report;

    if (paths.size() > limits.max_files) {
        add_error(rep, "TOO_MANY_FILES", "Too many files. Maximum allowed: " + std::to_string(limits.max_files));
        return res;
    }
    if (paths.size() < limits.min_files) {
        add_error(rep, "NOT_ENOUGH_FILES", "Not enough files. Minimum required: " + std::to_string(limits.min_files));
        return res;
    }

    size_t total = 0;
    for (size_t i = 0; i < paths.size(); ++i) {
        const std::string name = fs::path(paths[i]).filename().string();

        const auto type = file_type_from_name(name);
        if (!type) {
            add_error(rep, "UNSUPPORTED_FILE_TYPE",
                      "Unsupported file type: " + name + ". Allowed: TXT", (long)i);
            return res;
        }

        const std::string bytes = read_all(paths[i]);

        if (bytes.size() > limits.max_file_bytes) {
            add_error(rep, "FILE_TOO_LARGE",
                      "File '" + name + "' exceeds maximum size of " + std::to_string(limits.max_file_bytes) + " bytes",
                      (long)i);
            return res;
        }

        total += bytes.size();
        if (total > limits.max_total_bytes) {
            add_error(rep, "TOTAL_SIZE_TOO_LARGE",
                      "Total upload size exceeds maximum of " + std::to_string(limits.max_total_bytes) + " bytes");
            return res;
        }

        SourceDocument doc;
        doc.name = name;
        if (!extract_text(name, bytes, *type, doc.text, rep, (long)i)) return res;
        res.documents.push_back(std::move(doc));
    }

    return res;
}

}  // namespace docio
