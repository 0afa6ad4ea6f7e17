#pragma once

#include <exception>
#include <filesystem>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "nb_model.hpp"

namespace bayestext {

namespace fs = std::filesystem;
using json = nlohmann::json;

// Classifier shared by the HTTP handlers. Every member function locks mtx.
// Lifecycle violations from the model surface as StateError.
struct ClassifierService {
    fs::path model_path;
    double smoothing = DEFAULT_SMOOTHING;
    NaiveBayesModel model;

    std::mutex mtx;

    // Replace the model with the one stored at model_path
    bool reload();

    // Start over with an empty Untrained model
    void reset();

    json health();
    json labels();
    json classify(const std::string& text);

    json add_documents(const std::vector<std::pair<std::string, std::string>>& docs);

    // Trains and persists to model_path
    json train();
};

// Request body for /api/documents: {"text","label"} or {"documents":[{"text","label"}, ...]}.
// On a bad shape, sets error and returns false; docs may hold a partial batch.
bool parse_documents(const json& body,
                     std::vector<std::pair<std::string, std::string>>& docs,
                     std::string& error);

// Maps an exception thrown by a handler to a JSON error response:
// StateError -> 409, json::exception -> 400, anything else -> 500
void send_exception(const httplib::Request& req, httplib::Response& res, std::exception_ptr ep);

} // namespace bayestext
