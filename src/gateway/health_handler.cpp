#include "toolhub/gateway/health_handler.hpp"

#include "toolhub/core/logger.hpp"

namespace toolhub::gateway {

auto gateway_status(dispatch::Dispatcher& dispatcher, const GatewayInfo& info) -> json {
    auto snapshot = dispatcher.store().current();
    auto uptime = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - info.started_at);

    json by_status = {
        {"unstarted", 0}, {"starting", 0}, {"ready", 0}, {"degraded", 0}, {"failed", 0},
    };
    for (const auto& c : dispatcher.connectors()) {
        auto key = std::string(backend::backend_status_to_string(c->status()));
        by_status[key] = by_status[key].get<int>() + 1;
    }

    return json{
        {"version", info.version},
        {"uptime_ms", uptime.count()},
        {"registry", {
            {"schema_version", snapshot->schema_version()},
            {"total_tools", snapshot->total_tools()},
            {"live_tools", dispatcher.list_tools().size()},
            {"generated_at", to_epoch_ms(snapshot->generated_at())},
            {"digest", snapshot->digest()},
            {"path", dispatcher.store().path().string()},
        }},
        {"backends", {
            {"total", dispatcher.connectors().size()},
            {"by_status", std::move(by_status)},
        }},
    };
}

void register_health_handlers(Protocol& protocol,
                              dispatch::Dispatcher& dispatcher,
                              health::HealthMonitor& monitor,
                              GatewayInfo info) {
    // health.check
    protocol.register_method("health.check",
        [&monitor]([[maybe_unused]] json params) -> awaitable<Result<json>> {
            auto report = co_await monitor.full_health_check();
            co_return json(report);
        },
        "Probe every backend and check registry consistency", "health");

    // gateway.status
    protocol.register_method("gateway.status",
        [&dispatcher, info]([[maybe_unused]] json params) -> awaitable<Result<json>> {
            co_return gateway_status(dispatcher, info);
        },
        "Version, uptime, registry and backend summary", "gateway");

    // gateway.methods
    protocol.register_method("gateway.methods",
        [&protocol]([[maybe_unused]] json params) -> awaitable<Result<json>> {
            auto methods = json::array();
            for (const auto& m : protocol.methods()) {
                methods.push_back(json{
                    {"name", m.name},
                    {"description", m.description},
                    {"group", m.group},
                });
            }
            co_return json{{"methods", std::move(methods)}};
        },
        "List the methods this gateway serves", "gateway");

    // backends.list
    protocol.register_method("backends.list",
        [&dispatcher]([[maybe_unused]] json params) -> awaitable<Result<json>> {
            auto backends = json::array();
            for (const auto& c : dispatcher.connectors()) {
                json entry = c->descriptor();
                entry["max_in_flight"] = c->max_in_flight();
                backends.push_back(std::move(entry));
            }
            co_return json{{"backends", std::move(backends)}};
        },
        "Describe every configured backend", "backends");

    // backends.restart
    protocol.register_method("backends.restart",
        [&dispatcher](json params) -> awaitable<Result<json>> {
            if (!params.is_object() || !params.contains("id") || !params["id"].is_string()) {
                co_return make_fail(make_error(ErrorCode::InvalidArgument,
                    "'id' is required"));
            }
            auto id = params["id"].get<std::string>();
            LOG_INFO("Operator restart requested for backend {}", id);

            auto reloaded = co_await dispatcher.restart_backend(id);
            if (!reloaded) co_return make_fail(reloaded.error());

            auto target = dispatcher.connector(id);
            co_return json{
                {"id", id},
                {"status", target->status()},
                {"previous_tools", reloaded->previous_tools},
                {"total_tools", reloaded->total_tools},
            };
        },
        "Restart a backend and reload the registry", "backends");
}

} // namespace toolhub::gateway
