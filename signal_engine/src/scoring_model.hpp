#pragma once

#include <functional>
#include <string>
#include <vector>

struct ModelScore {
    double probability = 0.0;
    double target_return = 0.0;
};

using ScoringFunction = std::function<ModelScore(const std::vector<double>&)>;

// Opaque, versioned scoring dependency for model detectors. The engine only
// knows the ordered feature names it expects and the function itself.
struct ScoringModel {
    std::string name;
    std::string version;
    std::vector<std::string> feature_names;
    ScoringFunction score;
};

// Loads a logistic/linear artifact:
// {"name": "...", "version": "...", "features": [...],
//  "probability": {"bias": b, "weights": [...]},
//  "target_return": {"bias": b, "weights": [...]}}
ScoringModel load_linear_model(const std::string& path);
