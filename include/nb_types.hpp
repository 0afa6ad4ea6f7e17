#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace bayestext {

// Additive smoothing constant; 1.0 is Laplace (add-one) smoothing
constexpr double DEFAULT_SMOOTHING = 1.0;

enum class Phase {
    Untrained, // accepting documents
    Trained    // accepting classification queries
};

inline const char* phase_name(Phase p) {
    return p == Phase::Trained ? "trained" : "untrained";
}

// Operation invoked in the wrong lifecycle phase
class StateError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Raw counts gathered for one label during accumulation
struct ClassStats {
    std::unordered_map<std::string, uint32_t> words; // token -> occurrences
    uint64_t num_tokens = 0;
    uint32_t num_documents = 0;
};

// Derived at train time from ClassStats and the vocabulary
struct ProbabilityTable {
    double log_prior = 0.0;
    std::unordered_map<std::string, double> log_likelihood; // every vocabulary token
};

struct LabelScore {
    std::string label;
    double score = 0.0;
};

} // namespace bayestext
