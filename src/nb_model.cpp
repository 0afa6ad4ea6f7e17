#include "nb_model.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "textutil.hpp"

namespace bayestext {

NaiveBayesModel::NaiveBayesModel(double smoothing) : smoothing_(DEFAULT_SMOOTHING) {
    set_smoothing(smoothing);
}

void NaiveBayesModel::require_untrained(const char* op) const {
    if (phase_ != Phase::Untrained)
        throw StateError(std::string(op) + ": model is already trained");
}

void NaiveBayesModel::require_trained(const char* op) const {
    if (phase_ != Phase::Trained)
        throw StateError(std::string(op) + ": model is not trained");
    if (tables_.empty())
        throw StateError(std::string(op) + ": model has no labels");
}

void NaiveBayesModel::set_smoothing(double smoothing) {
    require_untrained("set_smoothing");
    if (!std::isfinite(smoothing) || smoothing <= 0.0)
        throw std::invalid_argument("smoothing must be a positive number");
    smoothing_ = smoothing;
}

void NaiveBayesModel::add_document(const std::string& text, const std::string& label) {
    require_untrained("add_document");
    add_document_tokens(tokenize(text), label);
}

void NaiveBayesModel::add_document_tokens(const std::vector<std::string>& tokens, const std::string& label) {
    require_untrained("add_document");

    // Create the label on first sight, even if the document has no tokens
    ClassStats& c = classes_[label];

    for (const auto& t : tokens) {
        if (t.empty()) continue;
        c.words[t]++;
        c.num_tokens++;
        vocab_[t]++;
    }

    c.num_documents++;
    num_documents_++;
}

void NaiveBayesModel::add_documents(const std::vector<std::pair<std::string, std::string>>& docs) {
    require_untrained("add_documents");
    for (const auto& [text, label] : docs) add_document(text, label);
}

void NaiveBayesModel::restore_class(const std::string& label, const ClassStats& stats) {
    require_untrained("restore_class");
    if (stats.num_documents == 0)
        throw std::invalid_argument("restore_class: label '" + label + "' has no documents");

    ClassStats& c = classes_[label];
    for (const auto& kv : stats.words) {
        if (kv.first.empty() || kv.second == 0) continue;
        c.words[kv.first] += kv.second;
        c.num_tokens += kv.second;
        vocab_[kv.first] += kv.second;
    }
    c.num_documents += stats.num_documents;
    num_documents_ += stats.num_documents;
}

void NaiveBayesModel::train() {
    if (classes_.empty() || num_documents_ == 0)
        throw StateError("train: no documents were added");

    const double D = (double)num_documents_;
    const double V = (double)vocab_.size();

    std::map<std::string, ProbabilityTable> tables;

    for (const auto& [label, c] : classes_) {
        ProbabilityTable pt;
        pt.log_prior = std::log((double)c.num_documents / D);

        // log P(t|c) = ln((n + a) / (T_c + a * V))
        const double denom = (double)c.num_tokens + smoothing_ * V;

        pt.log_likelihood.reserve(vocab_.size());
        for (const auto& kv : vocab_) {
            auto it = c.words.find(kv.first);
            double n = (it == c.words.end()) ? 0.0 : (double)it->second;
            pt.log_likelihood.emplace(kv.first, std::log((n + smoothing_) / denom));
        }

        tables.emplace(label, std::move(pt));
    }

    tables_ = std::move(tables);
    phase_ = Phase::Trained;
}

bool NaiveBayesModel::in_vocabulary(const std::string& token) const {
    return vocab_.find(token) != vocab_.end();
}

double NaiveBayesModel::score_tokens(const ProbabilityTable& table, const std::vector<std::string>& tokens) const {
    double total = table.log_prior;
    for (const auto& t : tokens) {
        // Tokens never seen in training carry no information
        auto it = table.log_likelihood.find(t);
        if (it == table.log_likelihood.end()) continue;
        total += it->second;
    }
    return total;
}

std::string NaiveBayesModel::classify(const std::string& text) const {
    require_trained("classify");
    return classify_tokens(tokenize(text));
}

std::string NaiveBayesModel::classify_tokens(const std::vector<std::string>& tokens) const {
    require_trained("classify");

    double max_score = -std::numeric_limits<double>::infinity();
    const std::string* best = nullptr;

    // tables_ iterates in label order; strict > keeps the first maximum
    for (const auto& [label, table] : tables_) {
        double s = score_tokens(table, tokens);
        if (best == nullptr || s > max_score) {
            max_score = s;
            best = &label;
        }
    }

    return *best;
}

std::vector<LabelScore> NaiveBayesModel::document_scores(const std::string& text) const {
    require_trained("document_scores");
    return document_scores_tokens(tokenize(text));
}

std::vector<LabelScore> NaiveBayesModel::document_scores_tokens(const std::vector<std::string>& tokens) const {
    require_trained("document_scores");

    std::vector<LabelScore> out;
    out.reserve(tables_.size());
    for (const auto& [label, table] : tables_) out.push_back({label, score_tokens(table, tokens)});

    std::stable_sort(out.begin(), out.end(), [](const LabelScore& a, const LabelScore& b) {
        return a.score > b.score;
    });
    return out;
}

std::vector<LabelScore> NaiveBayesModel::document_probabilities(const std::string& text) const {
    require_trained("document_probabilities");
    return document_probabilities_tokens(tokenize(text));
}

std::vector<LabelScore> NaiveBayesModel::document_probabilities_tokens(const std::vector<std::string>& tokens) const {
    auto scores = document_scores_tokens(tokens);

    // log-sum-exp around the best score
    const double top = scores.front().score;
    double sum = 0.0;
    for (const auto& s : scores) sum += std::exp(s.score - top);
    const double log_norm = top + std::log(sum);

    for (auto& s : scores) s.score = std::exp(s.score - log_norm);
    return scores;
}

std::vector<std::string> NaiveBayesModel::labels() const {
    std::vector<std::string> out;
    out.reserve(classes_.size());
    for (const auto& kv : classes_) out.push_back(kv.first);
    return out;
}

const ClassStats* NaiveBayesModel::class_stats(const std::string& label) const {
    auto it = classes_.find(label);
    return it == classes_.end() ? nullptr : &it->second;
}

const ProbabilityTable* NaiveBayesModel::probability_table(const std::string& label) const {
    auto it = tables_.find(label);
    return it == tables_.end() ? nullptr : &it->second;
}

} // namespace bayestext
