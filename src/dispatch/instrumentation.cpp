#include "toolhub/dispatch/instrumentation.hpp"
#include "toolhub/core/logger.hpp"

#include <algorithm>
#include <cmath>

namespace toolhub::dispatch {

namespace {

auto bucket_index(std::int64_t duration_ms) -> std::size_t {
    for (std::size_t i = 0; i < kLatencyBucketsMs.size(); ++i) {
        if (duration_ms <= kLatencyBucketsMs[i]) return i;
    }
    return kLatencyBucketsMs.size();
}

/// Upper bound of the bucket holding the given quantile. The open bucket
/// reports the largest observed duration.
auto bucket_quantile(const ToolStats& s, double q) -> std::int64_t {
    if (s.total_calls == 0) return 0;
    auto rank = static_cast<std::uint64_t>(std::ceil(q * static_cast<double>(s.total_calls)));
    if (rank == 0) rank = 1;
    std::uint64_t seen = 0;
    for (std::size_t i = 0; i < s.buckets.size(); ++i) {
        seen += s.buckets[i];
        if (seen >= rank) {
            return i < kLatencyBucketsMs.size() ? kLatencyBucketsMs[i] : s.max_duration_ms;
        }
    }
    return s.max_duration_ms;
}

} // anonymous namespace

void to_json(json& j, const ToolStats& s) {
    j = json{
        {"tool", s.tool_name},
        {"total_calls", s.total_calls},
        {"error_count", s.error_count},
        {"timeout_count", s.timeout_count},
        {"slow_calls", s.slow_calls},
        {"avg_duration_ms", s.total_calls == 0
            ? 0 : s.total_duration_ms / static_cast<std::int64_t>(s.total_calls)},
        {"max_duration_ms", s.max_duration_ms},
        {"p50_ms", s.p50_ms},
        {"p95_ms", s.p95_ms},
        {"recent_error_rate", s.recent_error_rate},
        {"recent_p95_ms", s.recent_p95_ms},
        {"slow", s.slow},
        {"erroring", s.erroring},
    };
    auto buckets = json::object();
    for (std::size_t i = 0; i < s.buckets.size(); ++i) {
        auto label = i < kLatencyBucketsMs.size()
            ? "le_" + std::to_string(kLatencyBucketsMs[i]) : std::string("le_inf");
        buckets[label] = s.buckets[i];
    }
    j["latency_buckets"] = std::move(buckets);
    if (s.last_called_at) {
        j["last_called_at"] = to_epoch_ms(*s.last_called_at);
    }
}

Instrumentation::Instrumentation(InstrumentationConfig config)
    : config_(config) {
    if (config_.window_size == 0) {
        config_.window_size = 1;
    }
}

auto Instrumentation::threshold(CallClass cls) const -> std::chrono::milliseconds {
    return std::chrono::milliseconds{cls == CallClass::Batch
        ? config_.batch_threshold_ms : config_.interactive_threshold_ms};
}

auto Instrumentation::record(const CallRecord& record, CallClass cls) -> bool {
    auto duration_ms = record.duration.count();
    auto limit = threshold(cls);
    bool breached = record.duration > limit;

    {
        std::lock_guard lock(mutex_);
        auto& counters = counters_[record.tool_name];
        auto& s = counters.stats;
        s.tool_name = record.tool_name;
        ++s.total_calls;
        if (record.outcome == CallOutcome::Error) ++s.error_count;
        if (record.outcome == CallOutcome::Timeout) ++s.timeout_count;
        if (breached) ++s.slow_calls;
        s.total_duration_ms += duration_ms;
        s.max_duration_ms = std::max(s.max_duration_ms, duration_ms);
        ++s.buckets[bucket_index(duration_ms)];
        s.last_called_at = record.started_at;

        counters.recent.push_back(Sample{duration_ms, record.outcome});
        while (counters.recent.size() > config_.window_size) {
            counters.recent.pop_front();
        }
    }

    if (breached) {
        LOG_WARN("Slow tool call: tool={} duration_ms={} threshold_ms={} class={}",
                 record.tool_name, duration_ms, limit.count(),
                 cls == CallClass::Batch ? "batch" : "interactive");
    }
    return breached;
}

auto Instrumentation::record_batch(std::size_t calls, std::chrono::milliseconds duration)
    -> bool {
    auto limit = threshold(CallClass::Batch);
    if (duration <= limit) {
        return false;
    }
    LOG_WARN("Slow batch: calls={} duration_ms={} threshold_ms={} class=batch",
             calls, duration.count(), limit.count());
    return true;
}

auto Instrumentation::snapshot(const Counters& counters) const -> ToolStats {
    auto s = counters.stats;
    s.p50_ms = bucket_quantile(s, 0.50);
    s.p95_ms = bucket_quantile(s, 0.95);

    if (!counters.recent.empty()) {
        std::vector<std::int64_t> durations;
        std::size_t failures = 0;
        for (const auto& sample : counters.recent) {
            durations.push_back(sample.duration_ms);
            if (sample.outcome != CallOutcome::Success) ++failures;
        }
        std::sort(durations.begin(), durations.end());
        auto idx = static_cast<std::size_t>(0.95 * static_cast<double>(durations.size() - 1));
        s.recent_p95_ms = durations[idx];
        s.recent_error_rate = static_cast<double>(failures) /
                              static_cast<double>(counters.recent.size());
    }

    s.slow = s.recent_p95_ms > config_.interactive_threshold_ms;
    s.erroring = s.recent_error_rate >= config_.error_rate_alert && s.recent_error_rate > 0.0;
    return s;
}

auto Instrumentation::stats(std::string_view tool_name) const -> std::optional<ToolStats> {
    std::lock_guard lock(mutex_);
    auto it = counters_.find(tool_name);
    if (it == counters_.end()) {
        return std::nullopt;
    }
    return snapshot(it->second);
}

auto Instrumentation::all_stats() const -> std::vector<ToolStats> {
    std::lock_guard lock(mutex_);
    std::vector<ToolStats> result;
    result.reserve(counters_.size());
    for (const auto& [name, counters] : counters_) {
        result.push_back(snapshot(counters));
    }
    return result;
}

void Instrumentation::reset() {
    std::lock_guard lock(mutex_);
    counters_.clear();
}

} // namespace toolhub::dispatch
