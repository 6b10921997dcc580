#include "config.hpp"
#include "errors.hpp"
#include "pg_store.hpp"
#include "redis_bus.hpp"
#include "health.hpp"
#include "api_signals.hpp"
#include "payloads.hpp"
#include "market_data_client.hpp"
#include "detector_registry.hpp"
#include "detector_runner.hpp"
#include "indicators.hpp"
#include "pipeline.hpp"
#include "outcome_labeler.hpp"
#include "baseline_sampler.hpp"
#include "util.hpp"
#include <curl/curl.h>
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("oracore", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
}

// Sleeps in short steps so shutdown is noticed promptly.
void sleep_until_next(int64_t started_ms, int interval_seconds) {
    int64_t deadline = started_ms + interval_seconds * 1000LL;
    while (!shutdown_requested && util::current_timestamp_ms() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

void detection_loop(SignalPipeline& pipeline, RedisBus& redis, HealthCheck& health,
                    const Config& config) {
    spdlog::info("Starting detection loop (every {}s)", config.cycle_seconds);
    health.set_loop_status("detection", "running");

    while (!shutdown_requested) {
        auto started = util::current_timestamp_ms();
        try {
            auto summary = pipeline.run_cycle(started);
            auto payload = summary.to_json();
            health.record_cycle(payload);
            redis.publish(config.stream_summary, payload);
        } catch (const std::exception& e) {
            spdlog::error("Detection cycle error: {}", e.what());
            health.set_loop_status("detection", "error");
        }
        sleep_until_next(started, config.cycle_seconds);
    }

    health.set_loop_status("detection", "stopped");
    spdlog::info("Detection loop stopped");
}

void labeling_loop(OutcomeLabeler& labeler, RedisBus& redis, HealthCheck& health,
                   const Config& config) {
    spdlog::info("Starting labeling loop (every {}s)", config.label_interval_seconds);
    health.set_loop_status("labeling", "running");

    while (!shutdown_requested) {
        auto started = util::current_timestamp_ms();
        try {
            auto summary = labeler.run_sweep(started, &shutdown_requested);
            auto payload = summary.to_json();
            health.record_sweep(payload);
            redis.publish(config.stream_summary, payload);
        } catch (const std::exception& e) {
            spdlog::error("Label sweep error: {}", e.what());
            health.set_loop_status("labeling", "error");
        }
        sleep_until_next(started, config.label_interval_seconds);
    }

    health.set_loop_status("labeling", "stopped");
    spdlog::info("Labeling loop stopped");
}

int main(int argc, char* argv[]) {
    bool run_once = false;
    std::optional<std::string> baselines_since;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--once") == 0) {
            run_once = true;
        } else if (std::strcmp(argv[i], "--sample-baselines") == 0 && i + 1 < argc) {
            baselines_since = argv[++i];
        } else {
            std::fprintf(stderr, "usage: %s [--once] [--sample-baselines <since>]\n", argv[0]);
            return 1;
        }
    }

    try {
        Config config = Config::from_env();
        setup_logging(config.log_level);

        spdlog::info("==============================================");
        spdlog::info("OraCore Signal Engine v1.0");
        spdlog::info("==============================================");

        config.validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);
        curl_global_init(CURL_GLOBAL_DEFAULT);

        auto pg = std::make_shared<PostgresStore>(config.pg_dsn);
        pg->init_schema();
        auto redis = std::make_shared<RedisBus>(config.redis_url);

        IndicatorSettings indicator_settings;
        if (std::find(indicator_settings.lookbacks.begin(), indicator_settings.lookbacks.end(),
                      config.breakout_lookback) == indicator_settings.lookbacks.end()) {
            indicator_settings.lookbacks.push_back(config.breakout_lookback);
        }

        auto registry = DetectorRegistry::from_config(config, indicator_settings);
        registry.persist(*pg);

        IndicatorEngine indicators(indicator_settings);
        // One worker per concurrent symbol plus room for one stuck call per detector
        int detector_pool = config.max_concurrency +
                            static_cast<int>(registry.detectors().size());
        DetectorRunner runner(registry, *pg, config.detector_timeout_ms, config.service_name,
                              detector_pool);
        PolygonClient provider(config.provider_base_url, config.provider_api_key,
                               config.request_timeout_ms);

        BaselineSettings baseline_settings;
        baseline_settings.rate = config.baseline_rate;
        baseline_settings.min_spacing_bars = config.baseline_min_spacing_bars;
        baseline_settings.seed = config.baseline_seed;
        baseline_settings.label_version = config.label_version;
        BaselineSampler sampler(*pg, *pg, baseline_settings);

        PipelineSettings pipeline_settings;
        pipeline_settings.symbols = config.symbols;
        pipeline_settings.base_timeframe = config.base_timeframe;
        pipeline_settings.derived_timeframes = config.derived_timeframes;
        pipeline_settings.backfill_minutes = config.backfill_minutes;
        pipeline_settings.history_limit = config.history_limit;
        pipeline_settings.max_concurrency = config.max_concurrency;
        pipeline_settings.max_retries = config.provider_max_retries;
        pipeline_settings.backoff_ms_min = config.retry_backoff_ms_min;
        pipeline_settings.backoff_ms_max = config.retry_backoff_ms_max;

        SignalPipeline pipeline(pipeline_settings, provider, *pg, indicators, runner, &sampler);
        pipeline.set_signal_callback([&redis, &config](const Signal& s) {
            redis->publish(config.stream_signals, signal_to_json(s));
        });

        LabelerSettings labeler_settings;
        labeler_settings.horizons = config.horizons;
        labeler_settings.targets = config.targets;
        labeler_settings.stop_pct = config.stop_pct;
        labeler_settings.tie_policy = config.tie_policy;
        labeler_settings.label_version = config.label_version;
        labeler_settings.lookback_ms = config.label_lookback_days * 86400000LL;
        OutcomeLabeler labeler(*pg, *pg, *pg, labeler_settings);

        if (baselines_since) {
            int64_t since = util::parse_timestamp_ms(*baselines_since);
            int64_t now = util::current_timestamp_ms();
            int written = 0;
            std::vector<std::string> streams = {config.base_timeframe};
            streams.insert(streams.end(), config.derived_timeframes.begin(),
                           config.derived_timeframes.end());
            for (const auto& symbol : config.symbols) {
                for (const auto& tf : streams) {
                    written += sampler.sample_history(*pg, symbol, tf, since, now,
                                                      indicator_settings);
                }
            }
            spdlog::info("Baseline backfill complete: {} samples", written);
            curl_global_cleanup();
            return 0;
        }

        if (run_once) {
            int64_t now = util::current_timestamp_ms();
            auto cycle = pipeline.run_cycle(now);
            redis->publish(config.stream_summary, cycle.to_json());
            auto sweep = labeler.run_sweep(util::current_timestamp_ms());
            redis->publish(config.stream_summary, sweep.to_json());

            bool partial = cycle.status() != RunStatus::Success ||
                           sweep.status() != RunStatus::Success;
            RunStatus status = partial ? RunStatus::Partial : RunStatus::Success;
            spdlog::info("Run finished: {}", status_name(status));
            curl_global_cleanup();
            return exit_code(status);
        }

        HealthCheck health(redis, pg);

        httplib::Server http_server;
        register_routes(http_server, *pg, *pg, health);

        std::thread http_thread([&]() {
            spdlog::info("HTTP server listening on {}:{}",
                         config.listen_addr, config.listen_port);
            http_server.listen(config.listen_addr.c_str(), config.listen_port);
        });

        std::thread detection_thread([&]() {
            detection_loop(pipeline, *redis, health, config);
        });
        std::thread labeling_thread([&]() {
            labeling_loop(labeler, *redis, health, config);
        });

        detection_thread.join();
        labeling_thread.join();

        spdlog::info("Shutting down gracefully");
        http_server.stop();
        if (http_thread.joinable()) {
            http_thread.join();
        }
        curl_global_cleanup();

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const ConfigValidationError& e) {
        spdlog::critical("Invalid configuration: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
