#include "model_io.hpp"

#include <fstream>
#include <iostream>
#include <limits>
#include <system_error>

namespace bayestext {

namespace {

// Counts must be non-negative integers that fit the in-memory field
bool read_count(const json& v, uint64_t limit, uint64_t& out) {
    if (!v.is_number_integer()) return false;
    if (!v.is_number_unsigned() && v.get<int64_t>() < 0) return false;
    out = v.get<uint64_t>();
    return out <= limit;
}

} // namespace

json model_to_json(const NaiveBayesModel& model) {
    json out;
    out["format"] = MODEL_FORMAT;
    out["version"] = MODEL_FORMAT_VERSION;
    out["smoothing"] = model.smoothing();
    out["trained"] = model.trained();
    out["classes"] = json::object();

    for (const auto& [label, c] : model.classes()) {
        json jc;
        jc["documents"] = c.num_documents;
        jc["tokens"] = c.num_tokens;
        jc["words"] = json::object();
        for (const auto& kv : c.words) jc["words"][kv.first] = kv.second;
        out["classes"][label] = std::move(jc);
    }
    return out;
}

bool model_from_json(const json& j, NaiveBayesModel& model) {
    try {
        if (!j.is_object() || j.value("format", "") != MODEL_FORMAT) {
            std::cerr << "[model] not a " << MODEL_FORMAT << " document\n";
            return false;
        }
        if (j.value("version", 0) != MODEL_FORMAT_VERSION) {
            std::cerr << "[model] unsupported version: " << j.value("version", 0) << "\n";
            return false;
        }
        if (!j.contains("classes") || !j["classes"].is_object()) {
            std::cerr << "[model] missing classes object\n";
            return false;
        }

        double smoothing = j.value("smoothing", DEFAULT_SMOOTHING);
        NaiveBayesModel loaded(smoothing);

        const uint64_t max_count = std::numeric_limits<uint32_t>::max();
        uint64_t total_documents = 0;

        for (const auto& [label, jc] : j["classes"].items()) {
            ClassStats c;
            uint64_t documents = 0;
            if (!jc.is_object() || !jc.contains("documents") ||
                !read_count(jc["documents"], max_count, documents)) {
                std::cerr << "[model] documents must be a non-negative integer for label: " << label << "\n";
                return false;
            }
            total_documents += documents;
            if (total_documents > max_count) {
                std::cerr << "[model] document count overflow at label: " << label << "\n";
                return false;
            }
            c.num_documents = (uint32_t)documents;

            uint64_t tokens = 0;
            for (const auto& [word, count] : jc.at("words").items()) {
                uint64_t n = 0;
                if (!read_count(count, max_count, n)) {
                    std::cerr << "[model] bad count for word '" << word << "' in label: " << label << "\n";
                    return false;
                }
                c.words[word] = (uint32_t)n;
                tokens += n;
            }

            // tokens is redundant with words; a mismatch means a damaged file
            if (jc.contains("tokens")) {
                uint64_t stored = 0;
                if (!read_count(jc["tokens"], std::numeric_limits<uint64_t>::max(), stored) || stored != tokens) {
                    std::cerr << "[model] token count mismatch for label: " << label << "\n";
                    return false;
                }
            }
            c.num_tokens = tokens;

            loaded.restore_class(label, c);
        }

        if (j.value("trained", false)) loaded.train();

        model = std::move(loaded);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[model] invalid model document: " << e.what() << "\n";
        return false;
    }
}

bool save_model(const fs::path& path, const NaiveBayesModel& model) {
    try {
        if (!path.parent_path().empty()) fs::create_directories(path.parent_path());

        std::ofstream ofs(path);
        if (!ofs.is_open()) {
            std::cerr << "[model] failed to open for writing: " << path << "\n";
            return false;
        }
        ofs << model_to_json(model).dump(2);
        ofs.flush();
        if (!ofs) {
            std::cerr << "[model] write failed: " << path << "\n";
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[model] error saving " << path << ": " << e.what() << "\n";
        return false;
    }
}

bool load_model(const fs::path& path, NaiveBayesModel& model) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        std::cerr << "[model] no model file at: " << path;
        if (ec) std::cerr << " (" << ec.message() << ")";
        std::cerr << "\n";
        return false;
    }

    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        std::cerr << "[model] failed to open: " << path << "\n";
        return false;
    }

    json j;
    try {
        ifs >> j;
    } catch (const json::parse_error& e) {
        std::cerr << "[model] parse error in " << path << ": " << e.what() << "\n";
        return false;
    }
    return model_from_json(j, model);
}

} // namespace bayestext
