#include "corpus.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>

#include "textutil.hpp"

namespace bayestext {

std::vector<std::string> parse_csv_line(const std::string& line) {
    std::vector<std::string> cols;
    std::string cur;
    bool inq = false;
    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];
        if (c == '"') {
            if (inq && i + 1 < line.size() && line[i + 1] == '"') {
                cur.push_back('"');
                i++;
            } else inq = !inq;
        } else if (c == ',' && !inq) {
            cols.push_back(cur);
            cur.clear();
        } else cur.push_back(c);
    }
    cols.push_back(cur);
    return cols;
}

static void strip_cr(std::string& line) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
}

bool load_corpus_csv(const fs::path& path,
                     std::vector<LabeledDoc>& docs,
                     CorpusStats& stats,
                     const std::string& label_column,
                     const std::string& text_column) {
    std::ifstream fin(path);
    if (!fin.is_open()) {
        std::cerr << "[corpus] cannot open: " << path << "\n";
        return false;
    }

    std::string header;
    if (!std::getline(fin, header)) {
        std::cerr << "[corpus] empty file: " << path << "\n";
        return false;
    }
    strip_cr(header);

    // UTF-8 byte order mark
    if (header.rfind("\xEF\xBB\xBF", 0) == 0) header.erase(0, 3);

    auto head = parse_csv_line(header);
    const std::string want_label = to_lower_ascii(label_column);
    const std::string want_text = to_lower_ascii(text_column);
    int label_col = -1;
    int text_col = -1;

    for (size_t i = 0; i < head.size(); i++) {
        std::string h = to_lower_ascii(head[i]);
        if (h == want_label) label_col = (int)i;
        if (h == want_text)  text_col  = (int)i;
    }

    if (label_col == -1 || text_col == -1) {
        std::cerr << "[corpus] " << path << ": missing '" << label_column << "' or '"
                  << text_column << "' column\n";
        return false;
    }

    const int max_needed = std::max(label_col, text_col);

    std::string line;
    while (std::getline(fin, line)) {
        strip_cr(line);
        if (line.empty()) continue;
        stats.rows++;

        auto cols = parse_csv_line(line);
        if ((int)cols.size() <= max_needed || cols[label_col].empty()) {
            stats.skipped++;
            continue;
        }

        docs.push_back({cols[text_col], cols[label_col]});
        stats.loaded++;
    }

    if (stats.skipped > 0) {
        std::cerr << "[corpus] " << path << ": skipped " << stats.skipped << " of "
                  << stats.rows << " rows\n";
    }
    return true;
}

} // namespace bayestext
