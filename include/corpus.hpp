#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace bayestext {

namespace fs = std::filesystem;

struct LabeledDoc {
    std::string text;
    std::string label;
};

struct CorpusStats {
    uint32_t rows = 0;
    uint32_t loaded = 0;
    uint32_t skipped = 0; // short rows or empty label
};

// simple CSV parser with quotes support
std::vector<std::string> parse_csv_line(const std::string& line);

// Reads a headed CSV file; column names are matched case-insensitively.
// Returns false if the file is unreadable or a column is missing.
bool load_corpus_csv(const fs::path& path,
                     std::vector<LabeledDoc>& docs,
                     CorpusStats& stats,
                     const std::string& label_column = "label",
                     const std::string& text_column = "text");

} // namespace bayestext
