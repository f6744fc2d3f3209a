#include "toolhub/health/monitor.hpp"
#include "toolhub/core/logger.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace toolhub::health {

using boost::asio::use_awaitable;

auto HealthReport::healthy() const -> bool {
    if (!registry_consistent) return false;
    for (const auto& b : backends) {
        if (b.status != backend::BackendStatus::Ready) return false;
    }
    return true;
}

void to_json(json& j, const BackendReport& r) {
    j = json{
        {"id", r.id},
        {"status", r.status},
        {"reachable", r.reachable},
        {"latency_ms", r.latency.count()},
        {"consecutive_failures", r.consecutive_failures},
        {"last_seen_at", r.last_seen_at ? json(to_epoch_ms(*r.last_seen_at)) : json(nullptr)},
    };
    if (r.error) {
        j["error"] = error_to_json(*r.error);
    }
}

void to_json(json& j, const HealthReport& r) {
    j = json{
        {"checked_at", to_epoch_ms(r.checked_at)},
        {"healthy", r.healthy()},
        {"backends", r.backends},
        {"registry", {
            {"consistent", r.registry_consistent},
            {"in_sync", r.registry_in_sync},
            {"total_tools", r.total_tools},
            {"digest", r.registry_digest},
        }},
        {"flagged_tools", r.flagged_tools},
    };
    if (r.registry_error) {
        j["registry"]["error"] = error_to_json(*r.registry_error);
    }
}

HealthMonitor::HealthMonitor(boost::asio::io_context& ioc, dispatch::Dispatcher& dispatcher,
                             HealthConfig config)
    : ioc_(ioc), dispatcher_(dispatcher), config_(config), timer_(ioc) {}

auto HealthMonitor::serving_backends() const -> std::set<std::string> {
    std::set<std::string> ids;
    for (const auto& c : dispatcher_.connectors()) {
        if (backend::accepts_calls(c->status())) {
            ids.insert(c->id());
        }
    }
    return ids;
}

auto HealthMonitor::check_registry(HealthReport& report) const -> void {
    auto& store = dispatcher_.store();
    auto live = store.current();
    report.total_tools = live->total_tools();
    report.registry_digest = live->digest();

    if (auto owners = live->check_owners(store.known_backends()); !owners) {
        report.registry_consistent = false;
        report.registry_error = owners.error();
        return;
    }

    auto persisted = registry::RegistryStore::read_file(store.path(), store.known_backends());
    if (!persisted) {
        if (persisted.error().code() == ErrorCode::NotFound && live->empty()) {
            report.registry_consistent = true;
            report.registry_in_sync = true;
            return;
        }
        report.registry_consistent = false;
        report.registry_error = persisted.error();
        return;
    }

    report.registry_consistent = true;
    report.registry_in_sync = persisted->digest() == report.registry_digest;
}

auto HealthMonitor::full_health_check() -> awaitable<HealthReport> {
    HealthReport report;
    report.checked_at = Clock::now();

    auto timeout = std::chrono::milliseconds{config_.ping_timeout_ms};
    for (const auto& connector : dispatcher_.connectors()) {
        BackendReport entry;
        entry.id = connector->id();

        if (backend::accepts_calls(connector->status())) {
            auto start = std::chrono::steady_clock::now();
            auto pinged = co_await connector->ping(timeout);
            entry.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            entry.reachable = pinged.has_value();
            if (!pinged) {
                entry.error = pinged.error();
            }
        } else {
            entry.error = make_error(ErrorCode::BackendUnavailable,
                "Backend is " + std::string(backend::backend_status_to_string(connector->status())));
        }

        auto descriptor = connector->descriptor();
        entry.status = descriptor.status;
        entry.consecutive_failures = descriptor.consecutive_failures;
        entry.last_seen_at = descriptor.last_seen_at;
        report.backends.push_back(std::move(entry));
    }

    check_registry(report);

    for (auto& stats : dispatcher_.instrumentation().all_stats()) {
        if (stats.slow || stats.erroring) {
            report.flagged_tools.push_back(std::move(stats));
        }
    }

    {
        std::lock_guard lock(report_mutex_);
        last_report_ = report;
    }
    co_return report;
}

auto HealthMonitor::tick() -> awaitable<bool> {
    auto report = co_await full_health_check();

    for (const auto& tool : report.flagged_tools) {
        LOG_WARN("Tool {} flagged: slow={} erroring={} recent_p95_ms={} recent_error_rate={:.2f}",
                 tool.tool_name, tool.slow, tool.erroring,
                 tool.recent_p95_ms, tool.recent_error_rate);
    }

    auto serving = serving_backends();
    bool changed = !last_serving_ || *last_serving_ != serving;
    last_serving_ = serving;

    bool relist = false;
    for (const auto& id : dispatcher_.store().unlisted_backends()) {
        if (serving.contains(id)) {
            relist = true;
            break;
        }
    }

    if (!changed && !relist && report.registry_consistent) {
        co_return false;
    }

    if (!report.registry_consistent && report.registry_error) {
        LOG_WARN("Registry inconsistent ({}); reloading", report.registry_error->what());
    } else if (relist) {
        LOG_INFO("Relisting backends whose catalog was unavailable");
    } else {
        LOG_INFO("Serving backends changed ({} now); reloading registry", serving.size());
    }

    auto reloaded = co_await dispatcher_.reload();
    if (!reloaded) {
        LOG_WARN("Health-triggered reload failed: {}", reloaded.error().what());
    }
    co_return true;
}

void HealthMonitor::start() {
    if (running_.exchange(true)) {
        return;
    }
    LOG_INFO("Health monitor started (interval {}s)", config_.interval_seconds);
    boost::asio::co_spawn(ioc_, run_loop(), boost::asio::detached);
}

void HealthMonitor::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    timer_.cancel();
    LOG_INFO("Health monitor stopped");
}

auto HealthMonitor::last_report() const -> std::optional<HealthReport> {
    std::lock_guard lock(report_mutex_);
    return last_report_;
}

auto HealthMonitor::run_loop() -> awaitable<void> {
    while (running_.load(std::memory_order_acquire)) {
        timer_.expires_after(std::chrono::seconds(config_.interval_seconds));
        auto [ec] = co_await timer_.async_wait(boost::asio::as_tuple(use_awaitable));
        if (ec) {
            if (ec == boost::asio::error::operation_aborted) {
                break;
            }
            LOG_WARN("Health timer error: {}", ec.message());
            continue;
        }
        if (!running_.load(std::memory_order_acquire)) {
            break;
        }

        try {
            co_await tick();
        } catch (const std::exception& e) {
            LOG_ERROR("Health tick failed: {}", e.what());
        }
    }
}

} // namespace toolhub::health
