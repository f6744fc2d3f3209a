#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "toolhub/dispatch/instrumentation.hpp"

using namespace toolhub;
using namespace toolhub::dispatch;
using namespace std::chrono_literals;

namespace {

auto record_of(std::string tool, std::chrono::milliseconds duration,
               CallOutcome outcome = CallOutcome::Success) -> CallRecord {
    return CallRecord{
        .tool_name = std::move(tool),
        .started_at = Clock::now(),
        .duration = duration,
        .outcome = outcome,
    };
}

auto small_config() -> InstrumentationConfig {
    InstrumentationConfig config;
    config.interactive_threshold_ms = 100;
    config.batch_threshold_ms = 1000;
    config.window_size = 4;
    config.error_rate_alert = 0.5;
    return config;
}

} // anonymous namespace

TEST_CASE("Instrumentation judges calls by class", "[dispatch][instrumentation]") {
    Instrumentation instrumentation(small_config());

    CHECK(instrumentation.threshold(CallClass::Interactive) == 100ms);
    CHECK(instrumentation.threshold(CallClass::Batch) == 1000ms);

    SECTION("interactive threshold") {
        CHECK_FALSE(instrumentation.record(record_of("t", 100ms), CallClass::Interactive));
        CHECK(instrumentation.record(record_of("t", 101ms), CallClass::Interactive));
    }

    SECTION("the same duration passes as a batch item") {
        CHECK_FALSE(instrumentation.record(record_of("t", 400ms), CallClass::Batch));
        CHECK(instrumentation.record(record_of("t", 1001ms), CallClass::Batch));
    }

    SECTION("whole batches use the batch threshold") {
        CHECK_FALSE(instrumentation.record_batch(3, 900ms));
        CHECK(instrumentation.record_batch(3, 1500ms));
    }
}

TEST_CASE("Instrumentation counters", "[dispatch][instrumentation]") {
    Instrumentation instrumentation(small_config());
    CHECK_FALSE(instrumentation.stats("t").has_value());

    instrumentation.record(record_of("t", 5ms), CallClass::Interactive);
    instrumentation.record(record_of("t", 20ms, CallOutcome::Error), CallClass::Interactive);
    instrumentation.record(record_of("t", 300ms, CallOutcome::Timeout), CallClass::Interactive);
    instrumentation.record(record_of("other", 1ms), CallClass::Interactive);

    auto stats = instrumentation.stats("t");
    REQUIRE(stats.has_value());
    CHECK(stats->total_calls == 3);
    CHECK(stats->error_count == 1);
    CHECK(stats->timeout_count == 1);
    CHECK(stats->slow_calls == 1);
    CHECK(stats->total_duration_ms == 325);
    CHECK(stats->max_duration_ms == 300);
    CHECK(stats->last_called_at.has_value());

    // 5ms lands in le_10, 20ms in le_25, 300ms in le_500
    CHECK(stats->buckets[0] == 1);
    CHECK(stats->buckets[1] == 1);
    CHECK(stats->buckets[5] == 1);
    CHECK(stats->p50_ms == 25);
    CHECK(stats->p95_ms == 500);

    auto all = instrumentation.all_stats();
    REQUIRE(all.size() == 2);
    CHECK(all[0].tool_name == "other");
    CHECK(all[1].tool_name == "t");

    json j = *stats;
    CHECK(j["tool"] == "t");
    CHECK(j["avg_duration_ms"] == 108);
    CHECK(j["latency_buckets"]["le_10"] == 1);
    CHECK(j["latency_buckets"]["le_inf"] == 0);
    CHECK(j.contains("last_called_at"));

    instrumentation.reset();
    CHECK(instrumentation.all_stats().empty());
}

TEST_CASE("Instrumentation flags from the recent window", "[dispatch][instrumentation]") {
    Instrumentation instrumentation(small_config());

    SECTION("slow tool") {
        for (int i = 0; i < 4; ++i) {
            instrumentation.record(record_of("t", 250ms), CallClass::Batch);
        }
        auto stats = instrumentation.stats("t");
        CHECK(stats->slow);
        CHECK(stats->recent_p95_ms == 250);
        CHECK_FALSE(stats->erroring);

        // The window only holds the last four calls.
        for (int i = 0; i < 4; ++i) {
            instrumentation.record(record_of("t", 10ms), CallClass::Interactive);
        }
        stats = instrumentation.stats("t");
        CHECK_FALSE(stats->slow);
        CHECK(stats->max_duration_ms == 250);
    }

    SECTION("erroring tool") {
        instrumentation.record(record_of("t", 1ms), CallClass::Interactive);
        instrumentation.record(record_of("t", 1ms, CallOutcome::Error), CallClass::Interactive);
        auto stats = instrumentation.stats("t");
        CHECK_THAT(stats->recent_error_rate, Catch::Matchers::WithinAbs(0.5, 1e-9));
        CHECK(stats->erroring);

        instrumentation.record(record_of("t", 1ms), CallClass::Interactive);
        instrumentation.record(record_of("t", 1ms), CallClass::Interactive);
        instrumentation.record(record_of("t", 1ms), CallClass::Interactive);
        stats = instrumentation.stats("t");
        CHECK_FALSE(stats->erroring);
    }
}
