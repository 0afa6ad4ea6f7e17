#pragma once

#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "nb_types.hpp"

namespace bayestext {

// Multinomial naive Bayes over bag-of-words documents.
//
// Notes:
// - Documents are accumulated while Untrained; train() freezes the counts
//   into per-label probability tables and moves the model to Trained.
// - Queries (classify, document_scores, ...) require Trained and are const,
//   so a trained model can be read from several threads at once.
// - Labels are kept in lexicographic order. On equal scores the smallest
//   label wins.
class NaiveBayesModel {
public:
    explicit NaiveBayesModel(double smoothing = DEFAULT_SMOOTHING);

    // Accumulation (Untrained only, throws StateError otherwise)
    void add_document(const std::string& text, const std::string& label);
    void add_document_tokens(const std::vector<std::string>& tokens, const std::string& label);
    void add_documents(const std::vector<std::pair<std::string, std::string>>& docs);
    void restore_class(const std::string& label, const ClassStats& stats);
    void set_smoothing(double smoothing);

    // Builds the probability tables. Throws StateError if no label is known.
    void train();

    // Scoring (Trained only, throws StateError otherwise)
    std::string classify(const std::string& text) const;
    std::string classify_tokens(const std::vector<std::string>& tokens) const;

    // Per-label log scores, best first
    std::vector<LabelScore> document_scores(const std::string& text) const;
    std::vector<LabelScore> document_scores_tokens(const std::vector<std::string>& tokens) const;

    // Posteriors normalized to sum to 1, best first
    std::vector<LabelScore> document_probabilities(const std::string& text) const;
    std::vector<LabelScore> document_probabilities_tokens(const std::vector<std::string>& tokens) const;

    std::vector<std::string> labels() const;

    Phase phase() const { return phase_; }
    bool trained() const { return phase_ == Phase::Trained; }
    double smoothing() const { return smoothing_; }
    size_t vocabulary_size() const { return vocab_.size(); }
    uint32_t total_documents() const { return num_documents_; }
    bool in_vocabulary(const std::string& token) const;

    const std::map<std::string, ClassStats>& classes() const { return classes_; }
    const ClassStats* class_stats(const std::string& label) const;
    const ProbabilityTable* probability_table(const std::string& label) const;

private:
    double smoothing_;
    Phase phase_ = Phase::Untrained;
    uint32_t num_documents_ = 0;

    // token -> occurrences across all labels
    std::unordered_map<std::string, uint32_t> vocab_;
    std::map<std::string, ClassStats> classes_;
    std::map<std::string, ProbabilityTable> tables_;

    void require_untrained(const char* op) const;
    void require_trained(const char* op) const;
    double score_tokens(const ProbabilityTable& table, const std::vector<std::string>& tokens) const;
};

} // namespace bayestext
