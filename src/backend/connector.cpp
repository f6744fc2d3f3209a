#include "toolhub/backend/connector.hpp"
#include "toolhub/backend/health_tracker.hpp"
#include "toolhub/backend/send_gate.hpp"
#include "toolhub/core/logger.hpp"

#include <algorithm>
#include <atomic>
#include <functional>
#include <mutex>
#include <unordered_map>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace toolhub::backend {

namespace net = boost::asio;
using SteadyClock = std::chrono::steady_clock;

namespace {

struct PendingRequest {
    std::string method;
    std::function<void(Result<json>)> callback;
    std::shared_ptr<net::steady_timer> timer;
};

/// Releases a gate slot when the owning coroutine frame unwinds.
class GateLease {
public:
    explicit GateLease(std::shared_ptr<SendGate> gate) : gate_(std::move(gate)) {}
    ~GateLease() { gate_->release(); }

    GateLease(const GateLease&) = delete;
    GateLease& operator=(const GateLease&) = delete;

private:
    std::shared_ptr<SendGate> gate_;
};

auto remaining(SteadyClock::time_point deadline) -> std::chrono::milliseconds {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - SteadyClock::now());
    return std::max(left, std::chrono::milliseconds{0});
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Connector::Impl
// ---------------------------------------------------------------------------

struct Connector::Impl {
    net::io_context& ioc;
    net::strand<net::io_context::executor_type> strand;
    BackendConfig config;
    HealthConfig health;
    LaunchSpec launch_spec;

    mutable std::mutex mutex;
    HealthTracker tracker;
    std::unordered_map<std::string, PendingRequest> pending;
    std::uint64_t session = 0;
    std::size_t max_in_flight = 1;
    std::shared_ptr<SendGate> gate;
    std::shared_ptr<SendGate> write_gate;
    int start_attempts = 0;
    bool retry_scheduled = false;
    bool stopping = false;

    std::atomic<std::uint64_t> next_id{1};
    net::steady_timer retry_timer;

    Impl(net::io_context& ctx, BackendConfig cfg, HealthConfig h)
        : ioc(ctx),
          strand(net::make_strand(ctx)),
          config(std::move(cfg)),
          health(h),
          launch_spec(launch_spec_from_config(config)),
          tracker(health.degrade_after_failures, health.fail_after_degraded_failures),
          gate(std::make_shared<SendGate>(ctx, 1)),
          write_gate(std::make_shared<SendGate>(ctx, 1)),
          retry_timer(strand) {}

    auto allocate_id() -> std::string {
        return std::to_string(next_id.fetch_add(1, std::memory_order_relaxed));
    }

    /// Resolves a pending request exactly once; later completions for the
    /// same id find nothing and are dropped.
    auto complete(const std::string& id, Result<json> result) -> bool {
        PendingRequest entry;
        {
            std::lock_guard lock(mutex);
            auto it = pending.find(id);
            if (it == pending.end()) {
                return false;
            }
            entry = std::move(it->second);
            pending.erase(it);
        }
        if (entry.timer) {
            entry.timer->cancel();
        }
        entry.callback(std::move(result));
        return true;
    }

    void fail_pending(const Error& error) {
        std::unordered_map<std::string, PendingRequest> drained;
        {
            std::lock_guard lock(mutex);
            drained.swap(pending);
        }
        for (auto& [id, entry] : drained) {
            if (entry.timer) {
                entry.timer->cancel();
            }
            entry.callback(std::unexpected(error));
        }
    }

    void log_transition(BackendStatus before, BackendStatus after) const {
        if (before == after) return;
        if (after == BackendStatus::Degraded || after == BackendStatus::Failed) {
            LOG_WARN("Backend {}: {} -> {}", config.id,
                     backend_status_to_string(before),
                     backend_status_to_string(after));
        } else {
            LOG_INFO("Backend {}: {} -> {}", config.id,
                     backend_status_to_string(before),
                     backend_status_to_string(after));
        }
    }

    auto backoff_for(int attempt) const -> std::chrono::milliseconds {
        std::int64_t delay = health.backoff_initial_ms;
        for (int i = 1; i < attempt && delay < health.backoff_max_ms; ++i) {
            delay *= 2;
        }
        return std::chrono::milliseconds{
            std::min<std::int64_t>(delay, health.backoff_max_ms)};
    }
};

// ---------------------------------------------------------------------------
// Connector
// ---------------------------------------------------------------------------

Connector::Connector(net::io_context& ioc, BackendConfig config, HealthConfig health)
    : impl_(std::make_unique<Impl>(ioc, std::move(config), health)) {}

Connector::~Connector() = default;

auto Connector::id() const -> const std::string& {
    return impl_->config.id;
}

auto Connector::config() const -> const BackendConfig& {
    return impl_->config;
}

auto Connector::status() const -> BackendStatus {
    std::lock_guard lock(impl_->mutex);
    return impl_->tracker.status();
}

auto Connector::descriptor() const -> BackendDescriptor {
    std::lock_guard lock(impl_->mutex);
    return BackendDescriptor{
        .id = impl_->config.id,
        .launch_spec = impl_->launch_spec,
        .status = impl_->tracker.status(),
        .last_seen_at = impl_->tracker.last_seen_at(),
        .consecutive_failures = impl_->tracker.consecutive_failures(),
    };
}

auto Connector::max_in_flight() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->max_in_flight;
}

auto Connector::start_attempts() const -> int {
    std::lock_guard lock(impl_->mutex);
    return impl_->start_attempts;
}

auto Connector::io_context() -> net::io_context& {
    return impl_->ioc;
}

auto Connector::start() -> awaitable<VoidResult> {
    {
        std::lock_guard lock(impl_->mutex);
        auto status = impl_->tracker.status();
        if (accepts_calls(status)) {
            co_return ok_result();
        }
        if (status == BackendStatus::Starting) {
            co_return make_fail(make_error(ErrorCode::BackendUnavailable,
                "Backend is already starting", impl_->config.id));
        }
        impl_->stopping = false;
        impl_->start_attempts = 0;
    }

    auto result = co_await attempt_start();
    if (!result) {
        schedule_retry();
    }
    co_return result;
}

auto Connector::restart() -> awaitable<VoidResult> {
    LOG_INFO("Restarting backend {}", impl_->config.id);
    {
        std::lock_guard lock(impl_->mutex);
        impl_->stopping = true;
        ++impl_->session;
    }

    auto self = shared_from_this();
    net::post(impl_->strand, [self]() { self->impl_->retry_timer.cancel(); });
    co_await net::co_spawn(impl_->strand, close(), net::use_awaitable);
    impl_->fail_pending(make_error(ErrorCode::BackendUnavailable,
        "Backend is restarting", impl_->config.id));

    BackendStatus before;
    {
        std::lock_guard lock(impl_->mutex);
        before = impl_->tracker.status();
        impl_->tracker.stopped();
        impl_->stopping = false;
        impl_->start_attempts = 0;
    }
    impl_->log_transition(before, BackendStatus::Unstarted);

    auto result = co_await attempt_start();
    if (!result) {
        schedule_retry();
    }
    co_return result;
}

auto Connector::stop() -> awaitable<void> {
    {
        std::lock_guard lock(impl_->mutex);
        impl_->stopping = true;
        ++impl_->session;
    }

    auto self = shared_from_this();
    net::post(impl_->strand, [self]() { self->impl_->retry_timer.cancel(); });
    co_await net::co_spawn(impl_->strand, close(), net::use_awaitable);
    impl_->fail_pending(make_error(ErrorCode::BackendUnavailable,
        "Backend stopped", impl_->config.id));

    BackendStatus before;
    {
        std::lock_guard lock(impl_->mutex);
        before = impl_->tracker.status();
        impl_->tracker.stopped();
    }
    impl_->log_transition(before, BackendStatus::Unstarted);
}

auto Connector::attempt_start() -> awaitable<VoidResult> {
    std::uint64_t session = 0;
    int attempt = 0;
    BackendStatus before;
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->stopping) {
            co_return make_fail(make_error(ErrorCode::BackendUnavailable,
                "Backend stopped", impl_->config.id));
        }
        before = impl_->tracker.status();
        impl_->tracker.begin_start();
        session = ++impl_->session;
        attempt = ++impl_->start_attempts;
        // Every session starts with empty gates.
        impl_->gate = std::make_shared<SendGate>(impl_->ioc, 1);
        impl_->write_gate = std::make_shared<SendGate>(impl_->ioc, 1);
    }
    impl_->log_transition(before, BackendStatus::Starting);
    LOG_INFO("Starting backend {} via {} (attempt {})", impl_->config.id,
             impl_->config.transport, attempt);

    auto opened = co_await net::co_spawn(impl_->strand, open(session), net::use_awaitable);
    if (!opened) {
        {
            std::lock_guard lock(impl_->mutex);
            impl_->tracker.handshake_failed();
        }
        impl_->log_transition(BackendStatus::Starting, BackendStatus::Failed);
        LOG_WARN("Backend {} failed to start: {}", impl_->config.id, opened.error().what());
        co_return make_fail(opened.error());
    }

    auto hello = co_await request("session.hello",
        json{{"client", "toolhub"}, {"protocol", 1}},
        std::chrono::milliseconds{impl_->config.handshake_timeout_ms}, true);
    if (!hello) {
        {
            std::lock_guard lock(impl_->mutex);
            ++impl_->session;
        }
        co_await net::co_spawn(impl_->strand, close(), net::use_awaitable);
        BackendStatus current;
        {
            std::lock_guard lock(impl_->mutex);
            impl_->tracker.handshake_failed();
            current = impl_->tracker.status();
        }
        impl_->log_transition(BackendStatus::Starting, current);
        LOG_WARN("Backend {} handshake failed: {}", impl_->config.id, hello.error().what());
        co_return make_fail(make_error(ErrorCode::BackendUnavailable,
            "Handshake with backend '" + impl_->config.id + "' failed",
            hello.error().what()));
    }

    std::size_t max_in_flight = 1;
    if (hello->is_object() && hello->contains("max_in_flight") &&
        (*hello)["max_in_flight"].is_number_integer()) {
        max_in_flight = static_cast<std::size_t>(
            std::max<std::int64_t>((*hello)["max_in_flight"].get<std::int64_t>(), 1));
    }

    {
        std::lock_guard lock(impl_->mutex);
        if (session != impl_->session || impl_->tracker.status() != BackendStatus::Starting) {
            co_return make_fail(make_error(ErrorCode::BackendUnavailable,
                "Backend disconnected during handshake", impl_->config.id));
        }
        impl_->max_in_flight = max_in_flight;
        impl_->gate = std::make_shared<SendGate>(impl_->ioc, max_in_flight);
        impl_->tracker.handshake_succeeded();
    }
    impl_->log_transition(BackendStatus::Starting, BackendStatus::Ready);
    LOG_INFO("Backend {} ready (max_in_flight={})", impl_->config.id, max_in_flight);
    co_return ok_result();
}

void Connector::schedule_retry() {
    std::chrono::milliseconds delay{0};
    int attempt = 0;
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->stopping || impl_->retry_scheduled) {
            return;
        }
        if (impl_->start_attempts > impl_->health.max_start_retries) {
            LOG_ERROR("Backend {} exhausted {} start retries; restart required",
                      impl_->config.id, impl_->health.max_start_retries);
            return;
        }
        impl_->retry_scheduled = true;
        attempt = impl_->start_attempts;
        delay = impl_->backoff_for(attempt);
    }

    LOG_WARN("Backend {} retry {}/{} in {}ms", impl_->config.id, attempt,
             impl_->health.max_start_retries, delay.count());

    auto self = shared_from_this();
    net::co_spawn(impl_->strand, [self, delay]() -> awaitable<void> {
        boost::system::error_code ec;
        self->impl_->retry_timer.expires_after(delay);
        co_await self->impl_->retry_timer.async_wait(
            net::redirect_error(net::use_awaitable, ec));
        {
            std::lock_guard lock(self->impl_->mutex);
            self->impl_->retry_scheduled = false;
            if (ec || self->impl_->stopping) {
                co_return;
            }
        }
        auto result = co_await self->attempt_start();
        if (!result) {
            self->schedule_retry();
        }
    }, net::detached);
}

void Connector::enter_failed_state() {
    {
        std::lock_guard lock(impl_->mutex);
        ++impl_->session;
    }
    impl_->fail_pending(make_error(ErrorCode::BackendUnavailable,
        "Backend '" + impl_->config.id + "' failed"));

    auto self = shared_from_this();
    net::co_spawn(impl_->strand, [self]() -> awaitable<void> {
        co_await self->close();
        self->schedule_retry();
    }, net::detached);
}

void Connector::connection_lost(std::uint64_t session, std::string_view reason) {
    bool was_starting = false;
    BackendStatus before;
    BackendStatus after;
    {
        std::lock_guard lock(impl_->mutex);
        if (session != impl_->session || impl_->stopping) {
            return;
        }
        ++impl_->session;
        before = impl_->tracker.status();
        was_starting = before == BackendStatus::Starting;
        impl_->tracker.record_disconnect();
        after = impl_->tracker.status();
    }

    LOG_WARN("Backend {} disconnected: {}", impl_->config.id, reason);
    impl_->log_transition(before, after);
    impl_->fail_pending(make_error(ErrorCode::BackendUnavailable,
        "Backend '" + impl_->config.id + "' disconnected", std::string(reason)));

    // A failed handshake is retried by the start path itself.
    if (was_starting) {
        return;
    }

    auto self = shared_from_this();
    net::co_spawn(impl_->strand, [self]() -> awaitable<void> {
        co_await self->close();
        self->schedule_retry();
    }, net::detached);
}

void Connector::deliver(std::string_view frame) {
    json j;
    try {
        j = json::parse(frame);
    } catch (const json::parse_error& e) {
        LOG_WARN("Backend {}: dropping unparsable frame: {}", impl_->config.id, e.what());
        return;
    }

    try {
        if (!j.is_object()) {
            LOG_WARN("Backend {}: dropping non-object frame", impl_->config.id);
            return;
        }

        auto type = j.contains("type") && j["type"].is_string()
            ? j["type"].get<std::string>() : std::string("res");
        if (type == "event") {
            LOG_DEBUG("Backend {} event: {}", impl_->config.id,
                      j.value("event", std::string("unknown")));
            return;
        }

        std::string id;
        if (j.contains("id") && j["id"].is_string()) {
            id = j["id"].get<std::string>();
        } else if (j.contains("id") && j["id"].is_number_integer()) {
            id = std::to_string(j["id"].get<std::int64_t>());
        } else {
            LOG_WARN("Backend {}: dropping frame without id", impl_->config.id);
            return;
        }

        Result<json> result;
        if (!j.contains("ok") || !j["ok"].is_boolean()) {
            result = std::unexpected(make_error(ErrorCode::ProtocolError,
                "Malformed response from backend '" + impl_->config.id + "'",
                "missing boolean 'ok'"));
        } else if (j["ok"].get<bool>()) {
            result = j.contains("payload") ? j["payload"] : json(nullptr);
        } else if (j.contains("error") && j["error"].is_object()) {
            const auto& err = j["error"];
            auto message = err.contains("message") && err["message"].is_string()
                ? err["message"].get<std::string>() : std::string("Tool error");
            auto kind = err.contains("kind") && err["kind"].is_string()
                ? err["kind"].get<std::string>() : std::string();
            result = std::unexpected(make_error(ErrorCode::ToolError,
                                                std::move(message), std::move(kind)));
        } else {
            result = std::unexpected(make_error(ErrorCode::ProtocolError,
                "Malformed error response from backend '" + impl_->config.id + "'",
                "missing 'error' object"));
        }

        if (!impl_->complete(id, std::move(result))) {
            LOG_DEBUG("Backend {}: discarding reply for unknown request {}",
                      impl_->config.id, id);
        }
    } catch (const json::exception& e) {
        LOG_WARN("Backend {}: dropping malformed frame: {}", impl_->config.id, e.what());
    }
}

auto Connector::request(std::string method, json params,
                        std::chrono::milliseconds timeout, bool handshake)
    -> awaitable<Result<json>> {
    std::shared_ptr<SendGate> gate;
    {
        std::lock_guard lock(impl_->mutex);
        auto status = impl_->tracker.status();
        if (!handshake && !accepts_calls(status)) {
            co_return make_fail(make_error(ErrorCode::BackendUnavailable,
                "Backend '" + impl_->config.id + "' is " +
                std::string(backend_status_to_string(status))));
        }
        gate = impl_->gate;
    }

    auto deadline = SteadyClock::now() + timeout;
    if (!co_await gate->acquire_until(deadline)) {
        Result<json> timed_out = std::unexpected(make_error(ErrorCode::Timeout,
            "Timed out waiting for backend '" + impl_->config.id + "'",
            method + " queued for " + std::to_string(timeout.count()) + "ms"));
        if (!handshake) {
            account(timed_out);
        }
        co_return timed_out;
    }
    GateLease lease(gate);

    auto result = co_await send(std::move(method), std::move(params),
                                remaining(deadline), handshake);
    if (!handshake) {
        account(result);
    }
    co_return result;
}

auto Connector::send(std::string method, json params,
                     std::chrono::milliseconds timeout, bool handshake)
    -> awaitable<Result<json>> {
    auto id = impl_->allocate_id();
    json frame = {
        {"type", "req"},
        {"id", id},
        {"method", method},
        {"params", std::move(params)},
    };

    using channel_t = net::experimental::concurrent_channel<void(
        boost::system::error_code, Result<json>)>;
    auto channel = std::make_shared<channel_t>(impl_->ioc, 1);
    auto timer = std::make_shared<net::steady_timer>(impl_->ioc, timeout);

    {
        std::lock_guard lock(impl_->mutex);
        if (!handshake && !accepts_calls(impl_->tracker.status())) {
            co_return make_fail(make_error(ErrorCode::BackendUnavailable,
                "Backend '" + impl_->config.id + "' is unavailable"));
        }
        impl_->pending[id] = PendingRequest{
            method,
            [channel](Result<json> result) {
                channel->try_send(boost::system::error_code{}, std::move(result));
            },
            timer,
        };
    }

    // A timed-out request is forgotten; its late reply no longer matches.
    std::weak_ptr<Connector> weak = weak_from_this();
    timer->async_wait([weak, id, method, timeout](boost::system::error_code ec) {
        if (ec) return;
        if (auto self = weak.lock()) {
            self->impl_->complete(id, std::unexpected(make_error(ErrorCode::Timeout,
                "Backend '" + self->impl_->config.id + "' did not answer " + method,
                "after " + std::to_string(timeout.count()) + "ms")));
        }
    });

    auto deadline = SteadyClock::now() + timeout;
    auto write_gate = impl_->write_gate;
    if (!co_await write_gate->acquire_until(deadline)) {
        impl_->complete(id, std::unexpected(make_error(ErrorCode::Timeout,
            "Timed out writing to backend '" + impl_->config.id + "'", method)));
    } else {
        GateLease lease(write_gate);
        auto written = co_await net::co_spawn(impl_->strand,
            write_frame(frame.dump()), net::use_awaitable);
        if (!written) {
            impl_->complete(id, std::unexpected(make_error(ErrorCode::BackendUnavailable,
                "Failed to send to backend '" + impl_->config.id + "'",
                written.error().what())));
        }
    }

    auto result = co_await channel->async_receive(net::use_awaitable);
    co_return result;
}

void Connector::account(const Result<json>& result) {
    BackendStatus before;
    BackendStatus after;
    {
        std::lock_guard lock(impl_->mutex);
        before = impl_->tracker.status();
        if (result || result.error().code() == ErrorCode::ToolError) {
            impl_->tracker.record_success();
        } else if (result.error().code() == ErrorCode::Timeout ||
                   result.error().code() == ErrorCode::ProtocolError) {
            impl_->tracker.record_failure();
        }
        after = impl_->tracker.status();
    }

    impl_->log_transition(before, after);
    if (before != after && after == BackendStatus::Failed) {
        enter_failed_state();
    }
}

auto Connector::list_tools() -> awaitable<Result<std::vector<ToolDefinition>>> {
    auto reply = co_await request("tools.list", json::object(),
        std::chrono::milliseconds{impl_->config.call_timeout_ms}, false);
    if (!reply) {
        co_return make_fail(reply.error());
    }

    std::expected<std::vector<ToolDefinition>, std::string> tools;
    try {
        tools = parse_tool_catalog(*reply);
    } catch (const json::exception& e) {
        tools = std::unexpected(std::string(e.what()));
    }
    if (!tools) {
        auto error = make_error(ErrorCode::ProtocolError,
            "Malformed tool catalog from backend '" + impl_->config.id + "'",
            tools.error());
        account(std::unexpected(error));
        co_return make_fail(std::move(error));
    }

    for (auto& tool : *tools) {
        tool.owner_id = impl_->config.id;
    }
    co_return std::move(*tools);
}

auto Connector::call(std::string_view tool_name, json args,
                     std::optional<std::chrono::milliseconds> timeout)
    -> awaitable<Result<json>> {
    if (args.is_null()) {
        args = json::object();
    }
    co_return co_await request("tools.call",
        json{{"name", std::string(tool_name)}, {"args", std::move(args)}},
        timeout.value_or(std::chrono::milliseconds{impl_->config.call_timeout_ms}),
        false);
}

auto Connector::ping(std::chrono::milliseconds timeout) -> awaitable<VoidResult> {
    auto reply = co_await request("health.ping", json::object(), timeout, false);
    if (!reply && reply.error().code() != ErrorCode::ToolError) {
        co_return make_fail(reply.error());
    }
    co_return ok_result();
}

} // namespace toolhub::backend
