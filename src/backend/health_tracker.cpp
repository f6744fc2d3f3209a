#include "toolhub/backend/health_tracker.hpp"

#include <algorithm>

namespace toolhub::backend {

HealthTracker::HealthTracker(int degrade_after, int fail_after_degraded)
    : degrade_after_(std::max(degrade_after, 1)),
      fail_after_degraded_(std::max(fail_after_degraded, 1)) {}

auto HealthTracker::transition(BackendStatus next) -> bool {
    if (status_ == next) return false;
    status_ = next;
    return true;
}

auto HealthTracker::begin_start() -> bool {
    if (status_ != BackendStatus::Unstarted && status_ != BackendStatus::Failed) {
        return false;
    }
    consecutive_failures_ = 0;
    return transition(BackendStatus::Starting);
}

auto HealthTracker::handshake_succeeded() -> bool {
    if (status_ != BackendStatus::Starting) return false;
    consecutive_failures_ = 0;
    last_seen_at_ = Clock::now();
    return transition(BackendStatus::Ready);
}

auto HealthTracker::handshake_failed() -> bool {
    if (status_ != BackendStatus::Starting) return false;
    ++consecutive_failures_;
    return transition(BackendStatus::Failed);
}

auto HealthTracker::record_success() -> bool {
    if (!accepts_calls(status_)) return false;
    consecutive_failures_ = 0;
    last_seen_at_ = Clock::now();
    return transition(BackendStatus::Ready);
}

auto HealthTracker::record_failure() -> bool {
    if (!accepts_calls(status_)) return false;
    ++consecutive_failures_;
    if (status_ == BackendStatus::Ready &&
        consecutive_failures_ >= degrade_after_) {
        return transition(BackendStatus::Degraded);
    }
    if (status_ == BackendStatus::Degraded &&
        consecutive_failures_ >= degrade_after_ + fail_after_degraded_) {
        return transition(BackendStatus::Failed);
    }
    return false;
}

auto HealthTracker::record_disconnect() -> bool {
    if (status_ == BackendStatus::Unstarted) return false;
    ++consecutive_failures_;
    return transition(BackendStatus::Failed);
}

auto HealthTracker::stopped() -> bool {
    consecutive_failures_ = 0;
    return transition(BackendStatus::Unstarted);
}

} // namespace toolhub::backend
