#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "corpus.hpp"
#include "model_io.hpp"
#include "nb_model.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {

    // Read corpus and output paths from CLI
    if (argc < 3) {
        std::cerr << "Usage: nb_train <CORPUS_CSV> <MODEL_JSON> [smoothing]\n"
                  << "The corpus needs a header row with 'label' and 'text' columns.\n";
        return 1;
    }

    fs::path corpus_path = argv[1];
    fs::path model_path = argv[2];

    double smoothing = bayestext::DEFAULT_SMOOTHING;
    if (argc >= 4) {
        try {
            smoothing = std::stod(argv[3]);
        } catch (const std::exception&) {
            std::cerr << "Invalid smoothing value: " << argv[3] << "\n";
            return 1;
        }
    }

    using clock = std::chrono::steady_clock;
    auto t0 = clock::now();

    // Load labeled documents
    std::vector<bayestext::LabeledDoc> docs;
    bayestext::CorpusStats cstats;
    if (!bayestext::load_corpus_csv(corpus_path, docs, cstats)) return 1;

    if (docs.empty()) {
        std::cerr << "No labeled documents in: " << corpus_path << "\n";
        return 1;
    }

    // Accumulate and train
    try {
        bayestext::NaiveBayesModel model(smoothing);
        for (const auto& d : docs) model.add_document(d.text, d.label);
        model.train();

        if (!bayestext::save_model(model_path, model)) return 1;

        double ms = std::chrono::duration<double, std::milli>(clock::now() - t0).count();
        std::cout << "[train] documents=" << model.total_documents()
                  << " labels=" << model.labels().size()
                  << " vocabulary=" << model.vocabulary_size()
                  << " smoothing=" << model.smoothing()
                  << " time=" << ms << "ms\n";
        for (const auto& l : model.labels()) {
            const auto* c = model.class_stats(l);
            std::cout << "  " << l << ": " << c->num_documents << " docs, "
                      << c->num_tokens << " tokens\n";
        }
        std::cout << "[train] model written to " << model_path.string() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Training failed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
