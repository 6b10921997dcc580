#pragma once

#include "store.hpp"
#include <map>
#include <string>
#include <nlohmann/json.hpp>

// JSON shapes shared by the HTTP API and the Redis streams.
nlohmann::json signal_to_json(const Signal& signal);
nlohmann::json outcome_to_json(const Outcome& outcome);

// symbol, timeframe, since (epoch ms or ISO-8601), limit. Throws std::invalid_argument.
SignalQuery parse_signal_query(const std::map<std::string, std::string>& params);
