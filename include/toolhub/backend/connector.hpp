#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include "toolhub/backend/descriptor.hpp"
#include "toolhub/backend/tool_definition.hpp"
#include "toolhub/core/config.hpp"
#include "toolhub/core/error.hpp"

namespace toolhub::backend {

using boost::asio::awaitable;

/// Session with one backend tool provider.
///
/// The base class owns request correlation, per-backend ordering, timeouts,
/// health accounting and start/retry policy. Transports only move frames:
/// they implement open/write_frame/close and report inbound frames through
/// deliver() and session loss through connection_lost().
class Connector : public std::enable_shared_from_this<Connector> {
public:
    Connector(boost::asio::io_context& ioc, BackendConfig config, HealthConfig health);
    virtual ~Connector();

    Connector(const Connector&) = delete;
    Connector& operator=(const Connector&) = delete;

    [[nodiscard]] auto id() const -> const std::string&;
    [[nodiscard]] auto config() const -> const BackendConfig&;
    [[nodiscard]] auto status() const -> BackendStatus;
    [[nodiscard]] auto descriptor() const -> BackendDescriptor;

    /// Requests the backend accepts concurrently (from its handshake).
    [[nodiscard]] auto max_in_flight() const -> std::size_t;

    /// Start attempts made since the last explicit start or restart.
    [[nodiscard]] auto start_attempts() const -> int;

    /// Launch or connect, then handshake. On failure the backend is marked
    /// failed and retried in the background with exponential backoff until
    /// the retry budget is spent. The returned result is the first attempt's.
    auto start() -> awaitable<VoidResult>;

    /// Operator restart: resets the retry budget and starts afresh from any
    /// state, including an exhausted failed state.
    auto restart() -> awaitable<VoidResult>;

    /// Close the session, cancel pending retries and fail in-flight requests.
    auto stop() -> awaitable<void>;

    /// Catalog discovery (`tools.list`). Owner ids are set to this backend.
    auto list_tools() -> awaitable<Result<std::vector<ToolDefinition>>>;

    /// Invoke one tool. `timeout` defaults to the configured call timeout.
    auto call(std::string_view tool_name, json args,
              std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> awaitable<Result<json>>;

    /// No-op liveness probe (`health.ping`).
    auto ping(std::chrono::milliseconds timeout) -> awaitable<VoidResult>;

protected:
    [[nodiscard]] auto io_context() -> boost::asio::io_context&;

    /// Establish the transport session. `session` tags the session so a
    /// late disconnect from an older session is ignored.
    virtual auto open(std::uint64_t session) -> awaitable<VoidResult> = 0;

    /// Send one serialized frame. Never called concurrently.
    virtual auto write_frame(std::string frame) -> awaitable<VoidResult> = 0;

    /// Tear the session down. Must be safe to call when not open.
    virtual auto close() -> awaitable<void> = 0;

    /// Inbound frame from the backend.
    void deliver(std::string_view frame);

    /// The session identified by `session` has ended unexpectedly.
    void connection_lost(std::uint64_t session, std::string_view reason);

private:
    auto attempt_start() -> awaitable<VoidResult>;
    void schedule_retry();
    void enter_failed_state();

    auto request(std::string method, json params,
                 std::chrono::milliseconds timeout, bool handshake)
        -> awaitable<Result<json>>;
    auto send(std::string method, json params,
              std::chrono::milliseconds timeout, bool handshake)
        -> awaitable<Result<json>>;
    void account(const Result<json>& result);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

using ConnectorPtr = std::shared_ptr<Connector>;

/// Builds the transport-specific connector for a backend config.
auto make_connector(boost::asio::io_context& ioc, const BackendConfig& config,
                    const HealthConfig& health) -> Result<ConnectorPtr>;

} // namespace toolhub::backend
