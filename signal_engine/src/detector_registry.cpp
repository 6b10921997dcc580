#include "detector_registry.hpp"
#include "config.hpp"
#include "errors.hpp"
#include <algorithm>
#include <set>
#include <spdlog/spdlog.h>

void DetectorRegistry::add(std::shared_ptr<Detector> detector) {
    if (!detector) {
        throw ConfigValidationError("Cannot register a null detector");
    }
    const DetectorInfo& info = detector->info();
    if (info.id.empty() || info.version.empty()) {
        throw ConfigValidationError("Detector id and version are required");
    }
    if (find(info.id, info.version)) {
        throw ConfigValidationError("Duplicate detector " + info.key());
    }

    if (info.kind == DetectorKind::Model) {
        auto known = IndicatorSnapshot::feature_names(settings_);
        for (const auto& f : info.params.value("features", std::vector<std::string>{})) {
            if (std::find(known.begin(), known.end(), f) == known.end()) {
                throw ConfigValidationError("Detector " + info.key() +
                                            " needs unknown feature '" + f + "'");
            }
        }
    }

    spdlog::info("Registered detector {} ({})", info.key(), kind_name(info.kind));
    detectors_.push_back(std::move(detector));
}

void DetectorRegistry::persist(SignalStore& store) const {
    for (const auto& d : detectors_) {
        store.register_detector(d->info());
    }
}

std::shared_ptr<Detector> DetectorRegistry::find(const std::string& id,
                                                 const std::string& version) const {
    for (const auto& d : detectors_) {
        if (d->info().id == id && d->info().version == version) {
            return d;
        }
    }
    return nullptr;
}

std::vector<int> DetectorRegistry::required_lookbacks() const {
    std::set<int> lookbacks;
    for (const auto& d : detectors_) {
        for (int n : d->required_lookbacks()) {
            lookbacks.insert(n);
        }
    }
    return std::vector<int>(lookbacks.begin(), lookbacks.end());
}

std::vector<std::string> DetectorRegistry::context_timeframes() const {
    std::set<std::string> timeframes;
    for (const auto& d : detectors_) {
        for (const auto& tf : d->context_timeframes()) {
            timeframes.insert(tf);
        }
    }
    return std::vector<std::string>(timeframes.begin(), timeframes.end());
}

DetectorRegistry DetectorRegistry::from_config(const Config& config,
                                               const IndicatorSettings& settings) {
    DetectorRegistry registry;
    registry.set_indicator_settings(settings);

    BreakoutParams breakout;
    breakout.lookback = config.breakout_lookback;
    breakout.volume_multiplier = config.breakout_volume_mult;
    breakout.momentum_filter = config.breakout_momentum_filter;
    breakout.confirm_timeframes = config.breakout_confirm_timeframes;
    breakout.extended_score = config.breakout_extended_score;
    registry.add(std::make_shared<BreakoutDetector>(config.breakout_id,
                                                    config.breakout_version, breakout));

    if (!config.model_weights_file.empty()) {
        ModelParams params;
        params.min_probability = config.model_min_probability;
        registry.add(std::make_shared<ModelDetector>(config.model_detector_id,
                                                     config.model_detector_version,
                                                     load_linear_model(config.model_weights_file),
                                                     params));
    } else {
        spdlog::info("MODEL_WEIGHTS_FILE not set, model detector disabled");
    }

    return registry;
}
