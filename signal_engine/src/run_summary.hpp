#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class RunStatus {
    Success,
    Partial,
    Fatal
};

// 0 success, 2 partial failure, 1 fatal
int exit_code(RunStatus status);
std::string status_name(RunStatus status);

struct SkippedItem {
    std::string item;
    std::string reason;
};

struct CycleSummary {
    int64_t started_at_ms = 0;
    int64_t finished_at_ms = 0;

    int symbols_processed = 0;
    int symbols_failed = 0;
    int bars_ingested = 0;
    int bars_aggregated = 0;
    int bars_evaluated = 0;
    int signals_emitted = 0;
    int signals_duplicate = 0;
    int baselines_written = 0;
    int detector_failures = 0;
    std::vector<SkippedItem> skipped;

    void merge(const CycleSummary& other);
    RunStatus status() const;
    nlohmann::json to_json() const;
};

struct LabelSweepSummary {
    int64_t started_at_ms = 0;
    int64_t finished_at_ms = 0;

    int signals_scanned = 0;
    int outcomes_computed = 0;
    int already_labeled = 0;
    int pending = 0;
    int data_gaps = 0;
    int failed = 0;
    bool cancelled = false;
    std::vector<SkippedItem> skipped;

    RunStatus status() const;
    nlohmann::json to_json() const;
};
