#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

#include "toolhub/backend/send_gate.hpp"
#include "toolhub/core/config.hpp"
#include "toolhub/core/error.hpp"
#include "toolhub/gateway/frame.hpp"
#include "toolhub/gateway/protocol.hpp"

namespace toolhub::gateway {

using boost::asio::awaitable;
namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

/// One connected caller. Requests are handled concurrently; responses are
/// written one at a time and may arrive out of request order.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using WsStream = websocket::stream<beast::tcp_stream>;

    Connection(net::io_context& ioc, WsStream ws, std::string id,
               std::shared_ptr<Protocol> protocol);

    /// Read frames until the peer goes away.
    auto run() -> awaitable<void>;

    auto send(const ResponseFrame& frame) -> awaitable<Result<void>>;
    auto close() -> awaitable<void>;

    [[nodiscard]] auto id() const noexcept -> const std::string& { return id_; }
    [[nodiscard]] auto is_open() const noexcept -> bool { return open_; }

private:
    auto handle_request(RequestFrame req) -> awaitable<void>;
    auto close_stream() -> awaitable<void>;

    WsStream ws_;
    std::string id_;
    std::shared_ptr<Protocol> protocol_;
    std::shared_ptr<backend::SendGate> write_gate_;
    std::atomic<bool> open_{true};
};

/// Listens for WebSocket callers and routes their requests through the
/// protocol table.
class GatewayServer {
public:
    GatewayServer(net::io_context& ioc, std::shared_ptr<Protocol> protocol);

    /// Bind and accept until stop(). Fails if the port cannot be bound.
    auto start(const GatewayConfig& config) -> awaitable<VoidResult>;

    auto stop() -> awaitable<void>;

    [[nodiscard]] auto protocol() -> std::shared_ptr<Protocol> { return protocol_; }
    [[nodiscard]] auto connection_count() const -> std::size_t;
    [[nodiscard]] auto is_running() const noexcept -> bool { return running_; }

    /// Port actually bound; differs from the configured one when that was 0.
    [[nodiscard]] auto bound_port() const noexcept -> std::uint16_t { return bound_port_; }

private:
    auto accept_loop() -> awaitable<void>;
    auto handle_connection(tcp::socket socket) -> awaitable<void>;

    net::io_context& ioc_;
    std::shared_ptr<Protocol> protocol_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    std::size_t max_connections_ = 64;

    mutable std::mutex connections_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Connection>> connections_;

    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> bound_port_{0};
};

} // namespace toolhub::gateway
