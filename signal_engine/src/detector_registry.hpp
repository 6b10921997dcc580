#pragma once

#include "detectors.hpp"
#include "store.hpp"
#include <memory>
#include <string>
#include <vector>

struct Config;

// Closed set of detectors active in this process, registered at startup.
class DetectorRegistry {
public:
    DetectorRegistry() = default;

    // Throws ConfigValidationError on duplicate (id, version) or on model
    // features the indicator engine cannot produce.
    void add(std::shared_ptr<Detector> detector);

    // Persists every definition; fails fast on an immutable-version mismatch.
    void persist(SignalStore& store) const;

    const std::vector<std::shared_ptr<Detector>>& detectors() const { return detectors_; }
    std::shared_ptr<Detector> find(const std::string& id, const std::string& version) const;
    size_t size() const { return detectors_.size(); }

    // Union of every detector's prior-bar lookbacks.
    std::vector<int> required_lookbacks() const;
    // Union of every detector's context timeframes.
    std::vector<std::string> context_timeframes() const;

    void set_indicator_settings(const IndicatorSettings& settings) { settings_ = settings; }

    static DetectorRegistry from_config(const Config& config, const IndicatorSettings& settings);

private:
    std::vector<std::shared_ptr<Detector>> detectors_;
    IndicatorSettings settings_;
};
