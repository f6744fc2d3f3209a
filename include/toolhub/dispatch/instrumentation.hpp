#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "toolhub/core/config.hpp"
#include "toolhub/core/types.hpp"

namespace toolhub::dispatch {

enum class CallOutcome {
    Success,
    Error,
    Timeout,
};

NLOHMANN_JSON_SERIALIZE_ENUM(CallOutcome, {
    {CallOutcome::Success, "success"},
    {CallOutcome::Error, "error"},
    {CallOutcome::Timeout, "timeout"},
})

/// Which latency threshold a call is judged against.
enum class CallClass {
    Interactive,
    Batch,
};

NLOHMANN_JSON_SERIALIZE_ENUM(CallClass, {
    {CallClass::Interactive, "interactive"},
    {CallClass::Batch, "batch"},
})

/// One dispatched call, folded into the counters and then dropped.
struct CallRecord {
    std::string tool_name;
    Timestamp started_at;
    std::chrono::milliseconds duration{0};
    CallOutcome outcome = CallOutcome::Success;
};

/// Upper bounds of the latency histogram buckets; the last bucket is open.
inline constexpr std::array<std::int64_t, 10> kLatencyBucketsMs = {
    10, 25, 50, 100, 250, 500, 1000, 2500, 5000, 10000};

struct ToolStats {
    std::string tool_name;
    std::uint64_t total_calls = 0;
    std::uint64_t error_count = 0;
    std::uint64_t timeout_count = 0;
    std::uint64_t slow_calls = 0;
    std::int64_t total_duration_ms = 0;
    std::int64_t max_duration_ms = 0;
    std::array<std::uint64_t, kLatencyBucketsMs.size() + 1> buckets{};
    std::optional<Timestamp> last_called_at;

    // Derived when the snapshot is taken.
    std::int64_t p50_ms = 0;
    std::int64_t p95_ms = 0;
    double recent_error_rate = 0.0;
    std::int64_t recent_p95_ms = 0;
    bool slow = false;
    bool erroring = false;
};

void to_json(json& j, const ToolStats& s);

/// Wraps dispatched calls with timing, threshold warnings and per-tool
/// counters. Thread-safe.
class Instrumentation {
public:
    explicit Instrumentation(InstrumentationConfig config);

    [[nodiscard]] auto threshold(CallClass cls) const -> std::chrono::milliseconds;

    /// Folds a finished call into the counters. Returns true and logs a
    /// warning when the call exceeded the threshold for its class.
    auto record(const CallRecord& record, CallClass cls) -> bool;

    /// Judges a whole batch against the batch threshold.
    auto record_batch(std::size_t calls, std::chrono::milliseconds duration) -> bool;

    [[nodiscard]] auto stats(std::string_view tool_name) const -> std::optional<ToolStats>;
    [[nodiscard]] auto all_stats() const -> std::vector<ToolStats>;

    void reset();

private:
    struct Sample {
        std::int64_t duration_ms;
        CallOutcome outcome;
    };

    struct Counters {
        ToolStats stats;
        std::deque<Sample> recent;
    };

    auto snapshot(const Counters& counters) const -> ToolStats;

    InstrumentationConfig config_;
    mutable std::mutex mutex_;
    std::map<std::string, Counters, std::less<>> counters_;
};

} // namespace toolhub::dispatch
