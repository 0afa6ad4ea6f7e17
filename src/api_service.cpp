#include "api_service.hpp"

#include <iostream>

#include "api_http.hpp"
#include "model_io.hpp"
#include "textutil.hpp"

namespace bayestext {

bool ClassifierService::reload() {
    std::lock_guard<std::mutex> lock(mtx);

    NaiveBayesModel loaded(smoothing);
    if (!load_model(model_path, loaded)) return false;

    model = std::move(loaded);
    std::cerr << "[reload] " << phase_name(model.phase()) << " model: "
              << model.labels().size() << " labels, " << model.vocabulary_size()
              << " terms, " << model.total_documents() << " documents from "
              << model_path.string() << "\n";
    return true;
}

void ClassifierService::reset() {
    std::lock_guard<std::mutex> lock(mtx);
    model = NaiveBayesModel(smoothing);
    std::cerr << "[reset] started an untrained model (smoothing=" << smoothing << ")\n";
}

json ClassifierService::health() {
    std::lock_guard<std::mutex> lock(mtx);

    json out;
    out["ok"] = true;
    out["phase"] = phase_name(model.phase());
    out["labels"] = model.labels().size();
    out["vocabulary"] = model.vocabulary_size();
    out["documents"] = model.total_documents();
    out["smoothing"] = model.smoothing();
    return out;
}

json ClassifierService::labels() {
    std::lock_guard<std::mutex> lock(mtx);

    json out;
    out["labels"] = json::array();
    for (const auto& l : model.labels()) {
        const ClassStats* c = model.class_stats(l);
        json jl;
        jl["label"] = l;
        jl["documents"] = c->num_documents;
        jl["tokens"] = c->num_tokens;
        out["labels"].push_back(jl);
    }
    return out;
}

json ClassifierService::classify(const std::string& text) {
    std::lock_guard<std::mutex> lock(mtx);

    auto tokens = tokenize(text);
    auto scores = model.document_scores_tokens(tokens);
    auto probs = model.document_probabilities_tokens(tokens);

    size_t known = 0;
    for (const auto& t : tokens) {
        if (model.in_vocabulary(t)) known++;
    }

    json out;
    out["text"] = text;
    out["label"] = model.classify_tokens(tokens);
    out["tokens"] = tokens.size();
    out["known_tokens"] = known;
    out["scores"] = json::array();

    // Both lists share the same order: best first, ties by label
    for (size_t i = 0; i < scores.size(); i++) {
        json r;
        r["label"] = scores[i].label;
        r["score"] = scores[i].score;
        r["probability"] = probs[i].score;
        out["scores"].push_back(r);
    }
    return out;
}

json ClassifierService::add_documents(const std::vector<std::pair<std::string, std::string>>& docs) {
    std::lock_guard<std::mutex> lock(mtx);

    model.add_documents(docs);

    json out;
    out["added"] = docs.size();
    out["documents"] = model.total_documents();
    out["labels"] = model.labels().size();
    out["vocabulary"] = model.vocabulary_size();
    return out;
}

json ClassifierService::train() {
    std::lock_guard<std::mutex> lock(mtx);

    model.train();
    bool saved = save_model(model_path, model);

    std::cerr << "[train] " << model.labels().size() << " labels, " << model.vocabulary_size()
              << " terms, " << model.total_documents() << " documents"
              << (saved ? ", saved to " + model_path.string() : ", not saved") << "\n";

    json out;
    out["trained"] = true;
    out["saved"] = saved;
    out["labels"] = model.labels();
    out["vocabulary"] = model.vocabulary_size();
    out["documents"] = model.total_documents();
    return out;
}

bool parse_documents(const json& body,
                     std::vector<std::pair<std::string, std::string>>& docs,
                     std::string& error) {
    auto take = [&](const json& d) {
        if (!d.is_object() || !d.contains("text") || !d["text"].is_string() ||
            !d.contains("label") || !d["label"].is_string()) {
            error = "each document needs string fields: text, label";
            return false;
        }
        docs.emplace_back(d["text"].get<std::string>(), d["label"].get<std::string>());
        return true;
    };

    if (body.is_object() && body.contains("documents")) {
        if (!body["documents"].is_array()) {
            error = "documents must be an array";
            return false;
        }
        for (const auto& d : body["documents"]) {
            if (!take(d)) return false;
        }
        return true;
    }
    return take(body);
}

void send_exception(const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
    enable_cors(res);
    try {
        if (ep) std::rethrow_exception(ep);
    } catch (const StateError& e) {
        std::cerr << "[state] " << req.method << " " << req.path << " : " << e.what() << "\n";
        send_error(res, 409, e.what());
        return;
    } catch (const json::exception& e) {
        std::cerr << "[exception] " << req.method << " " << req.path << " : " << e.what() << "\n";
        send_error(res, 400, "invalid json body");
        return;
    } catch (const std::exception& e) {
        std::cerr << "[exception] " << req.method << " " << req.path << " : " << e.what() << "\n";
    }
    send_error(res, 500, "internal server error");
}

} // namespace bayestext
