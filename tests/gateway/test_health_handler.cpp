#include <catch2/catch_test_macros.hpp>

#include "../fixtures/harness.hpp"
#include "toolhub/gateway/health_handler.hpp"
#include "toolhub/gateway/tool_handler.hpp"

using namespace toolhub;
using namespace toolhub::gateway;
using namespace toolhub::testing;

namespace {

struct HealthSurface : Harness {
    explicit HealthSurface(const std::string& name) : Harness(name) {
        register_tool_handlers(protocol, dispatcher);
        register_health_handlers(protocol, dispatcher, monitor, GatewayInfo{.version = "9.9.9"});
    }

    auto rpc(const std::string& method, json params = json::object()) -> Result<json> {
        return run_sync(ioc, protocol.dispatch(RequestFrame{
            .id = "h", .method = method, .params = std::move(params)}));
    }

    Protocol protocol;
};

} // anonymous namespace

TEST_CASE("gateway.status summarizes registry and backends", "[gateway][health]") {
    HealthSurface s("toolhub_health_handler_status");
    s.start_and_reload();
    s.degrade(*s.flows, "flows.run");

    auto status = s.rpc("gateway.status");
    REQUIRE(status.has_value());
    const auto& j = *status;
    CHECK(j["version"] == "9.9.9");
    CHECK(j["uptime_ms"].get<std::int64_t>() >= 0);
    CHECK(j["registry"]["total_tools"] == 3);
    CHECK(j["registry"]["live_tools"] == 2);
    CHECK(j["registry"]["schema_version"] == 1);
    CHECK(j["registry"]["digest"] == s.store.current()->digest());
    CHECK(j["backends"]["total"] == 2);
    CHECK(j["backends"]["by_status"]["ready"] == 1);
    CHECK(j["backends"]["by_status"]["degraded"] == 1);
    CHECK(j["backends"]["by_status"]["failed"] == 0);
}

TEST_CASE("gateway.methods lists every method with its group", "[gateway][health]") {
    HealthSurface s("toolhub_health_handler_methods");

    auto result = s.rpc("gateway.methods");
    REQUIRE(result.has_value());
    const auto& methods = (*result)["methods"];
    CHECK(methods.size() == s.protocol.methods().size());

    bool found = false;
    for (const auto& m : methods) {
        if (m["name"] == "backends.restart") {
            found = true;
            CHECK(m["group"] == "backends");
            CHECK_FALSE(m["description"].get<std::string>().empty());
        }
    }
    CHECK(found);
}

TEST_CASE("health.check returns the full report", "[gateway][health]") {
    HealthSurface s("toolhub_health_handler_check");
    s.start_and_reload();

    auto result = s.rpc("health.check");
    REQUIRE(result.has_value());
    CHECK((*result)["healthy"] == true);
    CHECK((*result)["backends"].size() == 2);
    CHECK((*result)["registry"]["consistent"] == true);
    CHECK(s.monitor.last_report().has_value());
}

TEST_CASE("backends.list and backends.restart", "[gateway][health]") {
    HealthSurface s("toolhub_health_handler_backends");
    s.start_and_reload();

    auto listed = s.rpc("backends.list");
    REQUIRE(listed.has_value());
    const auto& backends = (*listed)["backends"];
    REQUIRE(backends.size() == 2);
    CHECK(backends[0]["id"] == "docs");
    CHECK(backends[0]["status"] == "ready");
    CHECK(backends[0]["max_in_flight"] == 1);
    CHECK(backends[0].contains("launch_spec"));

    SECTION("restart reloads the registry") {
        s.flows->set_tools({"flows.run", "flows.pause"});
        auto restarted = s.rpc("backends.restart", json{{"id", "flows"}});
        REQUIRE(restarted.has_value());
        CHECK((*restarted)["id"] == "flows");
        CHECK((*restarted)["status"] == "ready");
        CHECK((*restarted)["previous_tools"] == 3);
        CHECK((*restarted)["total_tools"] == 4);
    }

    SECTION("restart needs a known id") {
        auto missing = s.rpc("backends.restart");
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code() == ErrorCode::InvalidArgument);

        auto unknown = s.rpc("backends.restart", json{{"id", "ghost"}});
        REQUIRE_FALSE(unknown.has_value());
        CHECK(unknown.error().code() == ErrorCode::NotFound);
    }
}
