#pragma once

#include "health.hpp"
#include "store.hpp"
#include <httplib.h>

// Read-only HTTP surface: /health, /signals, /signals/{id}/outcomes, /summary.
void register_routes(httplib::Server& server, SignalStore& signals, OutcomeStore& outcomes,
                     HealthCheck& health);
