#pragma once

#include "detector_registry.hpp"
#include "store.hpp"
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

struct DetectorFailure {
    std::string detector;   // id@version
    std::string symbol;
    std::string timeframe;
    int64_t timestamp_ms = 0;
    std::string reason;
};

struct EvaluationResult {
    std::vector<Signal> created;
    int duplicates = 0;
    std::vector<DetectorFailure> failures;
};

// Evaluates every registered detector against one closed bar. Each detector
// call is isolated: a throw or a timeout fails that detector for that bar only.
// Timed calls run on a fixed pool owned by the runner. A detector whose
// previous call overran its timeout is failed without being called again until
// that call returns, so a hung detector holds at most one worker.
class DetectorRunner {
public:
    DetectorRunner(const DetectorRegistry& registry, SignalStore& store,
                   int timeout_ms, std::string source_system, int pool_size = 4);
    ~DetectorRunner();

    DetectorRunner(const DetectorRunner&) = delete;
    DetectorRunner& operator=(const DetectorRunner&) = delete;

    EvaluationResult run(const DetectorInput& input, const std::optional<Quote>& quote,
                         int64_t now_ms);

    // Seeds per-stream detector state from the latest stored signals. `history`
    // is the warm-up series already fed to the indicators, ascending.
    void prime(const std::string& symbol, const std::string& timeframe,
               const std::vector<Candle>& history);

    // "pre" before 13:30 UTC, "regular" until 20:00 UTC, "post" after.
    static std::string session_flag(int64_t timestamp_ms);

    Signal build_signal(const Detector& detector, const DetectorInput& input,
                        const SignalCandidate& candidate,
                        const std::optional<Quote>& quote, int64_t now_ms) const;

    std::vector<std::string> context_timeframes() const { return registry_.context_timeframes(); }

    // Detectors with a timed-out call that has not returned yet.
    size_t stuck_detectors() const;
    size_t pool_size() const { return workers_.size(); }

private:
    const DetectorRegistry& registry_;
    SignalStore& store_;
    int timeout_ms_;
    std::string source_system_;

    std::mutex pool_mutex_;
    std::condition_variable pool_cv_;
    std::deque<std::function<void()>> tasks_;
    std::vector<std::thread> workers_;
    bool stopping_ = false;

    mutable std::mutex stuck_mutex_;
    std::set<std::string> stuck_;  // detector keys

    void worker_loop();
    void submit(std::function<void()> task);

    std::optional<SignalCandidate> evaluate_bounded(const std::shared_ptr<Detector>& detector,
                                                    const DetectorInput& input);
};
