#include <catch2/catch_test_macros.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include "../fixtures/run_sync.hpp"
#include "../fixtures/scripted_connector.hpp"

using namespace toolhub;
using namespace toolhub::testing;
using backend::BackendStatus;
using namespace std::chrono_literals;

namespace {

auto started(boost::asio::io_context& ioc, std::vector<std::string> tools = {"x", "y"},
             HealthConfig health = test_health_config())
    -> std::shared_ptr<ScriptedConnector> {
    auto c = ScriptedConnector::create(ioc, "alpha", std::move(tools), health);
    auto result = run_sync(ioc, c->start());
    REQUIRE(result.has_value());
    REQUIRE(c->status() == BackendStatus::Ready);
    return c;
}

auto timeout_call(boost::asio::io_context& ioc, ScriptedConnector& c) -> Result<json> {
    return run_sync(ioc, c.call("slow", json::object(), 20ms));
}

} // anonymous namespace

TEST_CASE("Connector start performs the handshake", "[backend][connector]") {
    boost::asio::io_context ioc;
    auto c = ScriptedConnector::create(ioc, "alpha");
    c->set_max_in_flight(4);

    CHECK(c->status() == BackendStatus::Unstarted);
    auto result = run_sync(ioc, c->start());
    REQUIRE(result.has_value());
    CHECK(c->status() == BackendStatus::Ready);
    CHECK(c->calls("session.hello") == 1);
    CHECK(c->max_in_flight() == 4);
    CHECK(c->descriptor().last_seen_at.has_value());

    SECTION("starting an already ready backend is a no-op") {
        REQUIRE(run_sync(ioc, c->start()).has_value());
        CHECK(c->open_count() == 1);
    }
}

TEST_CASE("Connector start failure marks the backend failed", "[backend][connector]") {
    boost::asio::io_context ioc;

    SECTION("transport cannot open") {
        auto c = ScriptedConnector::create(ioc, "alpha");
        c->set_open_fails(true);
        auto result = run_sync(ioc, c->start());
        REQUIRE_FALSE(result.has_value());
        CHECK(c->status() == BackendStatus::Failed);
    }

    SECTION("handshake rejected") {
        auto c = ScriptedConnector::create(ioc, "alpha");
        c->on("session.hello", [](const json&) { return Reply::error("unsupported protocol"); });
        auto result = run_sync(ioc, c->start());
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::BackendUnavailable);
        CHECK(c->status() == BackendStatus::Failed);
        CHECK(c->close_count() >= 1);
    }
}

TEST_CASE("Connector retries a failed start with backoff, then gives up", "[backend][connector]") {
    boost::asio::io_context ioc;
    auto health = test_health_config();
    health.max_start_retries = 2;
    auto c = ScriptedConnector::create(ioc, "alpha", {"x"}, health);
    c->set_open_fails(true);

    REQUIRE_FALSE(run_sync(ioc, c->start()).has_value());
    CHECK(c->open_count() == 1);

    // Backoff is 10ms then 20ms; nothing further once the budget is spent.
    run_for(ioc, 300ms);
    CHECK(c->open_count() == 3);
    CHECK(c->start_attempts() == 3);
    CHECK(c->status() == BackendStatus::Failed);

    SECTION("a retry that succeeds brings the backend up") {
        c->set_open_fails(false);
        auto restarted = run_sync(ioc, c->restart());
        REQUIRE(restarted.has_value());
        CHECK(c->status() == BackendStatus::Ready);
        CHECK(c->start_attempts() == 1);
    }
}

TEST_CASE("Connector call returns the backend payload", "[backend][connector]") {
    boost::asio::io_context ioc;
    auto c = started(ioc);
    c->on_call("x", [](const json& params) {
        return Reply::ok(json{{"sum", params["args"]["a"].get<int>() + 1}});
    });

    auto result = run_sync(ioc, c->call("x", json{{"a", 41}}));
    REQUIRE(result.has_value());
    CHECK((*result)["sum"] == 42);
    CHECK(c->status() == BackendStatus::Ready);
}

TEST_CASE("Connector forwards tool errors verbatim", "[backend][connector]") {
    boost::asio::io_context ioc;
    auto c = started(ioc);
    c->on_call("x", [](const json&) {
        return Reply::error("input file is empty", "validation_error");
    });

    auto result = run_sync(ioc, c->call("x", json::object()));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::ToolError);
    CHECK(result.error().message() == "input file is empty");
    CHECK(result.error().detail() == "validation_error");

    // A domain failure still proves the backend is alive.
    CHECK(c->status() == BackendStatus::Ready);
    CHECK(c->descriptor().consecutive_failures == 0);
}

TEST_CASE("Connector times out and discards the late reply", "[backend][connector]") {
    boost::asio::io_context ioc;
    auto c = started(ioc);

    int call_number = 0;
    c->on_call("x", [&call_number](const json&) {
        ++call_number;
        if (call_number == 1) {
            return Reply::ok(json{{"reply", "late"}}, 80ms);
        }
        return Reply::ok(json{{"reply", "fresh"}});
    });

    auto first = run_sync(ioc, c->call("x", json::object(), 20ms));
    REQUIRE_FALSE(first.has_value());
    CHECK(first.error().code() == ErrorCode::Timeout);
    CHECK(c->descriptor().consecutive_failures == 1);

    // Let the late reply arrive; it matches nothing.
    run_for(ioc, 120ms);

    auto second = run_sync(ioc, c->call("x", json::object()));
    REQUIRE(second.has_value());
    CHECK((*second)["reply"] == "fresh");
    CHECK(c->status() == BackendStatus::Ready);
}

TEST_CASE("Connector reports malformed responses as protocol errors", "[backend][connector]") {
    boost::asio::io_context ioc;
    auto c = started(ioc);
    c->on_call("x", [](const json&) { return Reply::missing_ok(); });

    auto result = run_sync(ioc, c->call("x", json::object()));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::ProtocolError);
    CHECK(c->descriptor().consecutive_failures == 1);
}

TEST_CASE("Connector ignores unparsable and unsolicited frames", "[backend][connector]") {
    boost::asio::io_context ioc;
    auto c = started(ioc);

    int n = 0;
    c->on_call("slow", [&n](const json&) {
        ++n;
        if (n == 1) return Reply::raw_frame("not json at all");
        return Reply::raw_frame(R"({"type":"res","id":"999999","ok":true,"payload":{}})");
    });

    CHECK(timeout_call(ioc, *c).error().code() == ErrorCode::Timeout);
    CHECK(timeout_call(ioc, *c).error().code() == ErrorCode::Timeout);
}

TEST_CASE("Connector degrades after three failures and recovers on success",
          "[backend][connector][health]") {
    boost::asio::io_context ioc;
    auto c = started(ioc);

    bool answer = false;
    c->on_call("slow", [&answer](const json&) {
        return answer ? Reply::ok(json::object()) : Reply::silent();
    });

    timeout_call(ioc, *c);
    timeout_call(ioc, *c);
    CHECK(c->status() == BackendStatus::Ready);
    timeout_call(ioc, *c);
    CHECK(c->status() == BackendStatus::Degraded);

    SECTION("degraded backends still take calls, and one success restores ready") {
        answer = true;
        auto result = run_sync(ioc, c->call("slow", json::object(), 200ms));
        REQUIRE(result.has_value());
        CHECK(c->status() == BackendStatus::Ready);
        CHECK(c->descriptor().consecutive_failures == 0);
    }

    SECTION("further failures fail the backend and later calls skip I/O") {
        timeout_call(ioc, *c);
        timeout_call(ioc, *c);
        timeout_call(ioc, *c);
        CHECK(c->status() == BackendStatus::Failed);

        auto sent_before = c->total_requests();
        auto t0 = std::chrono::steady_clock::now();
        auto result = run_sync(ioc, c->call("x", json::object(), 5000ms));
        auto elapsed = std::chrono::steady_clock::now() - t0;

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::BackendUnavailable);
        CHECK(c->total_requests() == sent_before);
        CHECK(elapsed < 1000ms);
    }
}

TEST_CASE("Connector rejects calls while starting without waiting", "[backend][connector]") {
    boost::asio::io_context ioc;
    auto c = ScriptedConnector::create(ioc, "alpha", {"x"});
    c->on("session.hello", [](const json&) { return Reply::silent(); });

    boost::asio::co_spawn(ioc, c->start(), boost::asio::detached);
    ioc.restart();
    ioc.poll();
    REQUIRE(c->status() == BackendStatus::Starting);

    auto t0 = std::chrono::steady_clock::now();
    auto result = run_sync(ioc, c->call("x", json::object(), 5000ms));
    auto elapsed = std::chrono::steady_clock::now() - t0;

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::BackendUnavailable);
    CHECK(elapsed < 100ms);
    CHECK(c->calls("tools.call") == 0);
}

TEST_CASE("Connector rejects calls before start", "[backend][connector]") {
    boost::asio::io_context ioc;
    auto c = ScriptedConnector::create(ioc, "alpha", {"x"});

    auto result = run_sync(ioc, c->call("x", json::object()));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::BackendUnavailable);
    CHECK(c->total_requests() == 0);
}

TEST_CASE("Connector serializes requests unless the backend advertises concurrency",
          "[backend][connector][ordering]") {
    boost::asio::io_context ioc;

    SECTION("one in flight, in submission order") {
        auto c = started(ioc);
        for (const auto* name : {"a", "b", "c"}) {
            c->on_call(name, [](const json&) { return Reply::ok(json::object(), 15ms); });
        }

        std::vector<boost::asio::awaitable<Result<json>>> ops;
        ops.push_back(c->call("a", json::object()));
        ops.push_back(c->call("b", json::object()));
        ops.push_back(c->call("c", json::object()));
        auto results = run_all(ioc, std::move(ops));

        for (const auto& r : results) CHECK(r.has_value());
        CHECK(c->max_observed_in_flight() == 1);
        CHECK(c->call_order() == std::vector<std::string>{"a", "b", "c"});
    }

    SECTION("advertised concurrency is honored") {
        auto c = ScriptedConnector::create(ioc, "alpha", {"a"});
        c->set_max_in_flight(2);
        REQUIRE(run_sync(ioc, c->start()).has_value());
        c->on_call("a", [](const json&) { return Reply::ok(json::object(), 20ms); });

        std::vector<boost::asio::awaitable<Result<json>>> ops;
        for (int i = 0; i < 4; ++i) ops.push_back(c->call("a", json::object()));
        auto results = run_all(ioc, std::move(ops));

        for (const auto& r : results) CHECK(r.has_value());
        CHECK(c->max_observed_in_flight() == 2);
    }
}

TEST_CASE("Connectors for different backends do not block each other",
          "[backend][connector][ordering]") {
    boost::asio::io_context ioc;
    auto slow = ScriptedConnector::create(ioc, "slow", {"s"});
    auto fast = ScriptedConnector::create(ioc, "fast", {"f"});
    REQUIRE(run_sync(ioc, slow->start()).has_value());
    REQUIRE(run_sync(ioc, fast->start()).has_value());
    slow->on_call("s", [](const json&) { return Reply::ok(json::object(), 200ms); });

    std::optional<std::chrono::steady_clock::duration> fast_elapsed;
    auto t0 = std::chrono::steady_clock::now();
    boost::asio::co_spawn(ioc, slow->call("s", json::object()), boost::asio::detached);
    boost::asio::co_spawn(ioc,
        [&]() -> boost::asio::awaitable<void> {
            auto r = co_await fast->call("f", json::object());
            if (r) fast_elapsed = std::chrono::steady_clock::now() - t0;
        },
        boost::asio::detached);
    run_for(ioc, 300ms);

    REQUIRE(fast_elapsed.has_value());
    CHECK(*fast_elapsed < 150ms);
}

TEST_CASE("Connector disconnect fails in-flight requests", "[backend][connector]") {
    boost::asio::io_context ioc;
    auto c = started(ioc);
    c->on_call("x", [](const json&) { return Reply::silent(); });

    std::optional<Result<json>> outcome;
    boost::asio::co_spawn(ioc,
        [&]() -> boost::asio::awaitable<void> {
            outcome = co_await c->call("x", json::object(), 5000ms);
        },
        boost::asio::detached);
    ioc.restart();
    ioc.poll();
    REQUIRE(c->in_flight() == 1);

    c->drop("process exited");
    run_for(ioc, 50ms);

    REQUIRE(outcome.has_value());
    REQUIRE_FALSE(outcome->has_value());
    CHECK((*outcome)->error().code() == ErrorCode::BackendUnavailable);
    CHECK(c->status() == BackendStatus::Failed);
}

TEST_CASE("Connector restart revives a failed backend", "[backend][connector]") {
    boost::asio::io_context ioc;
    auto c = started(ioc);
    c->drop();
    run_for(ioc, 50ms);
    REQUIRE(c->status() == BackendStatus::Failed);

    auto result = run_sync(ioc, c->restart());
    REQUIRE(result.has_value());
    CHECK(c->status() == BackendStatus::Ready);
    CHECK(c->calls("session.hello") == 2);
}

TEST_CASE("Connector list_tools assigns ownership", "[backend][connector]") {
    boost::asio::io_context ioc;
    auto c = started(ioc, {"x", "y"});

    auto tools = run_sync(ioc, c->list_tools());
    REQUIRE(tools.has_value());
    REQUIRE(tools->size() == 2);
    CHECK((*tools)[0].name == "x");
    CHECK((*tools)[0].owner_id == "alpha");
    CHECK((*tools)[1].owner_id == "alpha");

    SECTION("malformed catalog is a protocol error") {
        c->on("tools.list", [](const json&) { return Reply::ok(json{{"tools", "none"}}); });
        auto bad = run_sync(ioc, c->list_tools());
        REQUIRE_FALSE(bad.has_value());
        CHECK(bad.error().code() == ErrorCode::ProtocolError);
    }
}

TEST_CASE("Connector ping", "[backend][connector]") {
    boost::asio::io_context ioc;
    auto c = started(ioc);
    CHECK(run_sync(ioc, c->ping(200ms)).has_value());

    c->on("health.ping", [](const json&) { return Reply::silent(); });
    auto result = run_sync(ioc, c->ping(20ms));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::Timeout);
}

TEST_CASE("Connector stop fails pending work and returns to unstarted", "[backend][connector]") {
    boost::asio::io_context ioc;
    auto c = started(ioc);
    run_sync(ioc, c->stop());
    CHECK(c->status() == BackendStatus::Unstarted);

    auto result = run_sync(ioc, c->call("x", json::object()));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::BackendUnavailable);
}
