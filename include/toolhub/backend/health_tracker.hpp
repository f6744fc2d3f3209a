#pragma once

#include <optional>

#include "toolhub/backend/descriptor.hpp"
#include "toolhub/core/types.hpp"

namespace toolhub::backend {

/// Per-backend liveness state machine:
///
///   unstarted -> starting -> ready <-> degraded -> failed
///                   ^                                 |
///                   +------------ restart ------------+
///
/// Not thread-safe; the owning connector serializes access.
class HealthTracker {
public:
    HealthTracker(int degrade_after, int fail_after_degraded);

    [[nodiscard]] auto status() const -> BackendStatus { return status_; }
    [[nodiscard]] auto consecutive_failures() const -> int { return consecutive_failures_; }
    [[nodiscard]] auto last_seen_at() const -> std::optional<Timestamp> { return last_seen_at_; }

    // Each transition returns true when the status changed.

    /// unstarted/failed -> starting. Ignored in any other state.
    auto begin_start() -> bool;

    /// starting -> ready.
    auto handshake_succeeded() -> bool;

    /// starting -> failed.
    auto handshake_failed() -> bool;

    /// A call that reached the backend and got an answer, including
    /// domain-level tool errors. Resets the failure counter.
    auto record_success() -> bool;

    /// A timeout or malformed reply.
    auto record_failure() -> bool;

    /// Session lost (process exit, socket closed).
    auto record_disconnect() -> bool;

    /// Deliberate shutdown.
    auto stopped() -> bool;

private:
    auto transition(BackendStatus next) -> bool;

    int degrade_after_;
    int fail_after_degraded_;
    BackendStatus status_ = BackendStatus::Unstarted;
    int consecutive_failures_ = 0;
    std::optional<Timestamp> last_seen_at_;
};

} // namespace toolhub::backend
