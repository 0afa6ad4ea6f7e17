#include <filesystem>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "model_io.hpp"
#include "nb_model.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

static json probabilities_json(const bayestext::NaiveBayesModel& model, const std::string& text) {
    json out;
    out["text"] = text;
    out["label"] = model.classify(text);
    out["probabilities"] = json::array();
    for (const auto& p : model.document_probabilities(text)) {
        json r;
        r["label"] = p.label;
        r["probability"] = p.score;
        out["probabilities"].push_back(r);
    }
    return out;
}

static void classify_one(const bayestext::NaiveBayesModel& model, const std::string& text, bool scores) {
    if (scores) std::cout << probabilities_json(model, text).dump() << "\n";
    else std::cout << model.classify(text) << "\t" << text << "\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: nb_classify <MODEL_JSON> [--scores] [text...]\n"
                  << "Without text, each non-empty stdin line is classified.\n";
        return 1;
    }

    bayestext::NaiveBayesModel model;
    if (!bayestext::load_model(fs::path(argv[1]), model)) return 1;
    if (!model.trained()) {
        std::cerr << "Model is not trained: " << argv[1] << "\n";
        return 1;
    }

    int first = 2;
    bool scores = false;
    if (argc > first && std::string(argv[first]) == "--scores") {
        scores = true;
        first++;
    }

    if (argc > first) {
        std::string text;
        for (int i = first; i < argc; i++) {
            if (i > first) text.push_back(' ');
            text += argv[i];
        }
        classify_one(model, text, scores);
        return 0;
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        classify_one(model, line, scores);
    }
    return 0;
}
