#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(std::shared_ptr<RedisBus> redis, std::shared_ptr<PostgresStore> pg)
    : redis_(redis), pg_(pg) {}

void HealthCheck::set_loop_status(const std::string& loop, const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    loop_status_[loop] = status;
}

void HealthCheck::record_cycle(const nlohmann::json& summary) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_cycle_ = summary;
}

void HealthCheck::record_sweep(const nlohmann::json& summary) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_sweep_ = summary;
}

nlohmann::json HealthCheck::last_summaries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {
        {"cycle", last_cycle_},
        {"label_sweep", last_sweep_}
    };
}

nlohmann::json HealthCheck::get_status() {
    bool redis_ok = redis_->ping();
    bool pg_ok = pg_->ping();

    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json loops = nlohmann::json::object();
    for (const auto& [loop, status] : loop_status_) {
        loops[loop] = status;
    }

    return {
        {"ok", redis_ok && pg_ok},
        {"redis", redis_ok},
        {"postgres", pg_ok},
        {"loops", loops},
        {"last_cycle_at", last_cycle_.is_object() ? last_cycle_.value("finished_at", "") : ""},
        {"ts", util::current_iso8601()}
    };
}

bool HealthCheck::is_healthy() {
    return redis_->ping() && pg_->ping();
}
