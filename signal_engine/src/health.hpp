#pragma once

#include "redis_bus.hpp"
#include "pg_store.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>

class HealthCheck {
public:
    HealthCheck(std::shared_ptr<RedisBus> redis, std::shared_ptr<PostgresStore> pg);

    nlohmann::json get_status();
    bool is_healthy();

    void set_loop_status(const std::string& loop, const std::string& status);
    void record_cycle(const nlohmann::json& summary);
    void record_sweep(const nlohmann::json& summary);

    // Last detection cycle and label sweep
    nlohmann::json last_summaries() const;

private:
    std::shared_ptr<RedisBus> redis_;
    std::shared_ptr<PostgresStore> pg_;

    mutable std::mutex mutex_;
    std::map<std::string, std::string> loop_status_;
    nlohmann::json last_cycle_;
    nlohmann::json last_sweep_;
};
