#include "run_summary.hpp"
#include "util.hpp"

namespace {

nlohmann::json skipped_json(const std::vector<SkippedItem>& items) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& s : items) {
        arr.push_back({{"item", s.item}, {"reason", s.reason}});
    }
    return arr;
}

} // namespace

int exit_code(RunStatus status) {
    switch (status) {
        case RunStatus::Success: return 0;
        case RunStatus::Partial: return 2;
        case RunStatus::Fatal: return 1;
    }
    return 1;
}

std::string status_name(RunStatus status) {
    switch (status) {
        case RunStatus::Success: return "success";
        case RunStatus::Partial: return "partial";
        case RunStatus::Fatal: return "fatal";
    }
    return "fatal";
}

void CycleSummary::merge(const CycleSummary& other) {
    symbols_processed += other.symbols_processed;
    symbols_failed += other.symbols_failed;
    bars_ingested += other.bars_ingested;
    bars_aggregated += other.bars_aggregated;
    bars_evaluated += other.bars_evaluated;
    signals_emitted += other.signals_emitted;
    signals_duplicate += other.signals_duplicate;
    baselines_written += other.baselines_written;
    detector_failures += other.detector_failures;
    skipped.insert(skipped.end(), other.skipped.begin(), other.skipped.end());
}

RunStatus CycleSummary::status() const {
    if (symbols_failed > 0 || detector_failures > 0) {
        return RunStatus::Partial;
    }
    return RunStatus::Success;
}

nlohmann::json CycleSummary::to_json() const {
    return {
        {"type", "cycle"},
        {"started_at", util::to_iso8601(started_at_ms)},
        {"finished_at", util::to_iso8601(finished_at_ms)},
        {"status", status_name(status())},
        {"symbols_processed", symbols_processed},
        {"symbols_failed", symbols_failed},
        {"bars_ingested", bars_ingested},
        {"bars_aggregated", bars_aggregated},
        {"bars_evaluated", bars_evaluated},
        {"signals_emitted", signals_emitted},
        {"signals_duplicate", signals_duplicate},
        {"baselines_written", baselines_written},
        {"detector_failures", detector_failures},
        {"skipped", skipped_json(skipped)}
    };
}

RunStatus LabelSweepSummary::status() const {
    return failed > 0 ? RunStatus::Partial : RunStatus::Success;
}

nlohmann::json LabelSweepSummary::to_json() const {
    return {
        {"type", "label_sweep"},
        {"started_at", util::to_iso8601(started_at_ms)},
        {"finished_at", util::to_iso8601(finished_at_ms)},
        {"status", status_name(status())},
        {"signals_scanned", signals_scanned},
        {"outcomes_computed", outcomes_computed},
        {"already_labeled", already_labeled},
        {"pending", pending},
        {"data_gaps", data_gaps},
        {"failed", failed},
        {"cancelled", cancelled},
        {"skipped", skipped_json(skipped)}
    };
}
