#include "detector_runner.hpp"
#include "errors.hpp"
#include "indicators.hpp"
#include "timeframe.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <thread>
#include <spdlog/spdlog.h>

namespace {

// Shared between a caller and the pooled call it may abandon.
struct PendingCall {
    std::promise<std::optional<SignalCandidate>> promise;
    std::mutex mutex;
    bool finished = false;
    bool abandoned = false;
};

} // namespace

DetectorRunner::DetectorRunner(const DetectorRegistry& registry, SignalStore& store,
                               int timeout_ms, std::string source_system, int pool_size)
    : registry_(registry)
    , store_(store)
    , timeout_ms_(timeout_ms)
    , source_system_(std::move(source_system))
{
    if (timeout_ms_ > 0) {
        for (int i = 0; i < std::max(pool_size, 1); ++i) {
            workers_.emplace_back(&DetectorRunner::worker_loop, this);
        }
    }
}

DetectorRunner::~DetectorRunner() {
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        stopping_ = true;
    }
    pool_cv_.notify_all();
    for (auto& worker : workers_) {
        worker.join();
    }
}

void DetectorRunner::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(pool_mutex_);
            pool_cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        task();
    }
}

void DetectorRunner::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        tasks_.push_back(std::move(task));
    }
    pool_cv_.notify_one();
}

size_t DetectorRunner::stuck_detectors() const {
    std::lock_guard<std::mutex> lock(stuck_mutex_);
    return stuck_.size();
}

std::string DetectorRunner::session_flag(int64_t timestamp_ms) {
    constexpr int64_t kDayMs = 86400000;
    int64_t ms_of_day = ((timestamp_ms % kDayMs) + kDayMs) % kDayMs;
    int64_t minute = ms_of_day / 60000;

    if (minute < 13 * 60 + 30) return "pre";
    if (minute < 20 * 60) return "regular";
    return "post";
}

std::optional<SignalCandidate> DetectorRunner::evaluate_bounded(
    const std::shared_ptr<Detector>& detector, const DetectorInput& input) {
    if (timeout_ms_ <= 0) {
        return detector->evaluate(input);
    }

    const std::string key = detector->info().key();
    {
        std::lock_guard<std::mutex> lock(stuck_mutex_);
        if (stuck_.count(key)) {
            throw DetectorError("previous call still running past its timeout");
        }
    }

    auto call = std::make_shared<PendingCall>();
    auto result = call->promise.get_future();
    submit([this, call, detector, input, key]() {
        try {
            call->promise.set_value(detector->evaluate(input));
        } catch (...) {
            call->promise.set_exception(std::current_exception());
        }
        std::lock_guard<std::mutex> lock(call->mutex);
        call->finished = true;
        if (call->abandoned) {
            std::lock_guard<std::mutex> stuck_lock(stuck_mutex_);
            stuck_.erase(key);
            spdlog::info("Detector {} returned after its timeout; re-enabled", key);
        }
    });

    if (result.wait_for(std::chrono::milliseconds(timeout_ms_)) == std::future_status::timeout) {
        std::lock_guard<std::mutex> lock(call->mutex);
        if (!call->finished) {
            call->abandoned = true;
            std::lock_guard<std::mutex> stuck_lock(stuck_mutex_);
            stuck_.insert(key);
            throw DetectorError("timed out after " + std::to_string(timeout_ms_) + "ms");
        }
    }
    return result.get();
}

Signal DetectorRunner::build_signal(const Detector& detector, const DetectorInput& input,
                                    const SignalCandidate& candidate,
                                    const std::optional<Quote>& quote, int64_t now_ms) const {
    Signal s;
    s.symbol = input.symbol;
    s.timeframe = input.timeframe;
    s.fired_at_ms = input.bar.timestamp_ms;
    s.detector_id = detector.info().id;
    s.detector_version = detector.info().version;
    s.side = candidate.side;
    s.source_system = source_system_;
    s.price_at_signal = input.bar.close;
    if (quote) {
        s.bid = quote->bid;
        s.ask = quote->ask;
        s.spread_bps = quote->spread_bps();
    }
    s.rel_volume = input.indicators.rel_volume;
    s.session = session_flag(input.bar.timestamp_ms);
    int64_t bar_end = timeframe::bar_end_ms(input.bar.timestamp_ms, input.timeframe);
    s.data_freshness_ms = std::max<int64_t>(0, now_ms - bar_end);
    s.score = candidate.score;

    s.features = input.indicators.to_features();
    for (const auto& [name, value] : candidate.extra_features) {
        s.features[name] = value;
    }
    s.features["score"] = candidate.score;
    s.features_version = kFeaturesVersion;
    return s;
}

EvaluationResult DetectorRunner::run(const DetectorInput& input,
                                     const std::optional<Quote>& quote, int64_t now_ms) {
    EvaluationResult result;

    for (const auto& detector : registry_.detectors()) {
        const std::string key = detector->info().key();
        std::optional<SignalCandidate> candidate;
        try {
            candidate = evaluate_bounded(detector, input);
        } catch (const std::exception& e) {
            spdlog::error("Detector {} failed on {}:{} at {}: {}", key, input.symbol,
                          input.timeframe, input.bar.timestamp_ms, e.what());
            result.failures.push_back({key, input.symbol, input.timeframe,
                                       input.bar.timestamp_ms, e.what()});
            continue;
        }
        if (!candidate) continue;

        Signal signal = build_signal(*detector, input, *candidate, quote, now_ms);
        RecordResult recorded = store_.record(signal);
        detector->on_recorded(input.symbol, input.timeframe, recorded.signal.fired_at_ms);

        if (recorded.created) {
            spdlog::info("Signal #{} {} {}:{} at {} score={:.2f} price={:.4f}",
                         recorded.signal.id, key, input.symbol, input.timeframe,
                         input.bar.timestamp_ms, recorded.signal.score,
                         recorded.signal.price_at_signal);
            result.created.push_back(recorded.signal);
        } else {
            spdlog::debug("Signal {} already recorded", signal.natural_key());
            result.duplicates++;
        }
    }

    return result;
}

void DetectorRunner::prime(const std::string& symbol, const std::string& timeframe,
                           const std::vector<Candle>& history) {
    for (const auto& detector : registry_.detectors()) {
        const auto& info = detector->info();
        auto latest = store_.latest_signal(symbol, timeframe, info.id, info.version);
        if (!latest) continue;

        int64_t fired_at = latest->fired_at_ms;
        auto after = std::upper_bound(history.begin(), history.end(), fired_at,
                                      [](int64_t ts, const Candle& c) {
                                          return ts < c.timestamp_ms;
                                      });
        int bars_since = static_cast<int>(std::distance(after, history.end()));

        detector->on_recorded(symbol, timeframe, fired_at, bars_since);
        spdlog::debug("Primed {} on {}:{} with signal at {} ({} bars since)", info.key(),
                      symbol, timeframe, fired_at, bars_since);
    }
}
