#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "nb_model.hpp"

namespace bayestext {

namespace fs = std::filesystem;
using json = nlohmann::json;

constexpr const char* MODEL_FORMAT = "bayestext-model";
constexpr int MODEL_FORMAT_VERSION = 1;

// Persists counts only; probabilities are rebuilt by train() on load.
json model_to_json(const NaiveBayesModel& model);

// Replaces `model` with the one described by `j` (returns false if malformed)
bool model_from_json(const json& j, NaiveBayesModel& model);

bool save_model(const fs::path& path, const NaiveBayesModel& model);
bool load_model(const fs::path& path, NaiveBayesModel& model);

} // namespace bayestext
