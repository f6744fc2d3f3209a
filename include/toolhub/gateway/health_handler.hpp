#pragma once

#include <chrono>
#include <string>

#include "toolhub/dispatch/dispatcher.hpp"
#include "toolhub/gateway/protocol.hpp"
#include "toolhub/health/monitor.hpp"

namespace toolhub::gateway {

/// Static facts reported by gateway.status.
struct GatewayInfo {
    std::string version;
    std::chrono::steady_clock::time_point started_at = std::chrono::steady_clock::now();
};

/// Registers health.check, gateway.status, gateway.methods, backends.list
/// and backends.restart.
void register_health_handlers(Protocol& protocol,
                              dispatch::Dispatcher& dispatcher,
                              health::HealthMonitor& monitor,
                              GatewayInfo info);

/// Body of gateway.status.
auto gateway_status(dispatch::Dispatcher& dispatcher, const GatewayInfo& info) -> json;

} // namespace toolhub::gateway
