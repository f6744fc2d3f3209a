#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "toolhub/backend/descriptor.hpp"
#include "toolhub/core/config.hpp"
#include "toolhub/core/error.hpp"
#include "toolhub/dispatch/dispatcher.hpp"

namespace toolhub::health {

using boost::asio::awaitable;

struct BackendReport {
    std::string id;
    backend::BackendStatus status = backend::BackendStatus::Unstarted;
    bool reachable = false;
    std::chrono::milliseconds latency{0};
    int consecutive_failures = 0;
    std::optional<Timestamp> last_seen_at;
    std::optional<Error> error;
};

struct HealthReport {
    Timestamp checked_at{};
    std::vector<BackendReport> backends;

    /// The persisted registry parses, validates and names only known owners.
    bool registry_consistent = false;
    /// The persisted registry matches the live snapshot.
    bool registry_in_sync = false;
    std::optional<Error> registry_error;
    std::size_t total_tools = 0;
    std::string registry_digest;

    std::vector<dispatch::ToolStats> flagged_tools;

    /// Every backend ready and the registry consistent.
    [[nodiscard]] auto healthy() const -> bool;
};

void to_json(json& j, const BackendReport& r);
void to_json(json& j, const HealthReport& r);

/// Probes backends and the registry, on demand and periodically. The
/// periodic loop triggers a registry reload when the set of backends that
/// can serve a catalog changes or the persisted registry is inconsistent.
class HealthMonitor {
public:
    HealthMonitor(boost::asio::io_context& ioc, dispatch::Dispatcher& dispatcher,
                  HealthConfig config);

    /// One `health.ping` per callable backend plus a registry check.
    auto full_health_check() -> awaitable<HealthReport>;

    /// One periodic tick: check, then reload if needed. Returns true when a
    /// reload was attempted.
    auto tick() -> awaitable<bool>;

    void start();
    void stop();

    [[nodiscard]] auto last_report() const -> std::optional<HealthReport>;

private:
    auto run_loop() -> awaitable<void>;
    auto check_registry(HealthReport& report) const -> void;
    [[nodiscard]] auto serving_backends() const -> std::set<std::string>;

    boost::asio::io_context& ioc_;
    dispatch::Dispatcher& dispatcher_;
    HealthConfig config_;
    boost::asio::steady_timer timer_;
    std::atomic<bool> running_{false};
    std::optional<std::set<std::string>> last_serving_;

    mutable std::mutex report_mutex_;
    std::optional<HealthReport> last_report_;
};

} // namespace toolhub::health
