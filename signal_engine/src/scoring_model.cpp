#include "scoring_model.hpp"
#include "errors.hpp"
#include <cmath>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {

struct LinearHead {
    double bias = 0.0;
    std::vector<double> weights;

    double apply(const std::vector<double>& x) const {
        double z = bias;
        for (size_t i = 0; i < weights.size() && i < x.size(); ++i) {
            z += weights[i] * x[i];
        }
        return z;
    }
};

LinearHead parse_head(const nlohmann::json& j, size_t feature_count, const std::string& name) {
    LinearHead head;
    head.bias = j.value("bias", 0.0);
    head.weights = j.at("weights").get<std::vector<double>>();
    if (head.weights.size() != feature_count) {
        throw ConfigValidationError("Model head '" + name + "' has " +
                                    std::to_string(head.weights.size()) + " weights for " +
                                    std::to_string(feature_count) + " features");
    }
    return head;
}

} // namespace

ScoringModel load_linear_model(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigValidationError("Cannot open model artifact: " + path);
    }

    nlohmann::json artifact;
    try {
        in >> artifact;
    } catch (const std::exception& e) {
        throw ConfigValidationError("Invalid model artifact " + path + ": " + e.what());
    }

    ScoringModel model;
    try {
        model.name = artifact.at("name").get<std::string>();
        model.version = artifact.at("version").get<std::string>();
        model.feature_names = artifact.at("features").get<std::vector<std::string>>();
        if (model.feature_names.empty()) {
            throw ConfigValidationError("Model artifact declares no features");
        }

        LinearHead prob = parse_head(artifact.at("probability"), model.feature_names.size(),
                                     "probability");
        LinearHead target;
        if (artifact.contains("target_return")) {
            target = parse_head(artifact.at("target_return"), model.feature_names.size(),
                                "target_return");
        }

        model.score = [prob, target](const std::vector<double>& x) {
            ModelScore s;
            s.probability = 1.0 / (1.0 + std::exp(-prob.apply(x)));
            s.target_return = target.apply(x);
            return s;
        };
    } catch (const nlohmann::json::exception& e) {
        throw ConfigValidationError("Invalid model artifact " + path + ": " + e.what());
    }

    spdlog::info("Loaded scoring model {}@{} ({} features)",
                 model.name, model.version, model.feature_names.size());
    return model;
}
