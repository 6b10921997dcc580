#include "api_signals.hpp"
#include "payloads.hpp"
#include <spdlog/spdlog.h>

namespace {

void send_error(httplib::Response& res, int status, const std::string& message) {
    nlohmann::json body = {{"error", message}};
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

} // namespace

void register_routes(httplib::Server& server, SignalStore& signals, OutcomeStore& outcomes,
                     HealthCheck& health) {
    server.Get("/health", [&health](const httplib::Request&, httplib::Response& res) {
        auto status = health.get_status();
        res.set_content(status.dump(), "application/json");
        res.status = status.value("ok", false) ? 200 : 503;
    });

    server.Get("/summary", [&health](const httplib::Request&, httplib::Response& res) {
        res.set_content(health.last_summaries().dump(), "application/json");
    });

    server.Get("/signals", [&signals](const httplib::Request& req, httplib::Response& res) {
        std::map<std::string, std::string> params;
        for (const auto& [key, value] : req.params) {
            params[key] = value;
        }

        SignalQuery query;
        try {
            query = parse_signal_query(params);
        } catch (const std::exception& e) {
            send_error(res, 400, e.what());
            return;
        }

        try {
            nlohmann::json body = nlohmann::json::array();
            for (const auto& s : signals.query_signals(query)) {
                body.push_back(signal_to_json(s));
            }
            res.set_content(body.dump(), "application/json");
        } catch (const std::exception& e) {
            spdlog::error("GET /signals failed: {}", e.what());
            send_error(res, 500, "query failed");
        }
    });

    server.Get(R"(/signals/(\d+)/outcomes)",
               [&signals, &outcomes](const httplib::Request& req, httplib::Response& res) {
        int64_t id = 0;
        try {
            id = std::stoll(req.matches[1].str());
        } catch (const std::exception&) {
            send_error(res, 400, "invalid signal id");
            return;
        }

        try {
            auto signal = signals.get_signal(id);
            if (!signal) {
                send_error(res, 404, "signal not found");
                return;
            }
            nlohmann::json rows = nlohmann::json::array();
            for (const auto& o : outcomes.query_outcomes(id)) {
                rows.push_back(outcome_to_json(o));
            }
            nlohmann::json body = {
                {"signal", signal_to_json(*signal)},
                {"outcomes", rows}
            };
            res.set_content(body.dump(), "application/json");
        } catch (const std::exception& e) {
            spdlog::error("GET /signals/{}/outcomes failed: {}", id, e.what());
            send_error(res, 500, "query failed");
        }
    });
}
