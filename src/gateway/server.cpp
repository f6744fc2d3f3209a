#include "toolhub/gateway/server.hpp"

#include "toolhub/core/logger.hpp"
#include "toolhub/core/utils.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>

namespace toolhub::gateway {

// ===========================================================================
// Connection
// ===========================================================================

Connection::Connection(net::io_context& ioc, WsStream ws, std::string id,
                       std::shared_ptr<Protocol> protocol)
    : ws_(std::move(ws))
    , id_(std::move(id))
    , protocol_(std::move(protocol))
    , write_gate_(std::make_shared<backend::SendGate>(ioc, 1)) {}

auto Connection::send(const ResponseFrame& frame) -> awaitable<Result<void>> {
    if (!open_) {
        co_return make_fail(
            make_error(ErrorCode::IoError, "Connection is closed", id_));
    }

    auto text = serialize_response(frame);
    auto gate = write_gate_;
    co_await gate->acquire_until(std::chrono::steady_clock::time_point::max());
    struct Release {
        std::shared_ptr<backend::SendGate> gate;
        ~Release() { gate->release(); }
    } release{gate};

    if (!open_) {
        co_return make_fail(
            make_error(ErrorCode::IoError, "Connection closed while queued", id_));
    }

    try {
        ws_.text(true);
        co_await ws_.async_write(net::buffer(text), net::use_awaitable);
        co_return ok_result();
    } catch (const boost::system::system_error& e) {
        LOG_WARN("Connection {}: write error: {}", id_, e.what());
        open_ = false;
        co_return make_fail(
            make_error(ErrorCode::IoError, "WebSocket write failed", e.what()));
    }
}

auto Connection::close() -> awaitable<void> {
    if (!open_.exchange(false)) co_return;

    // The close frame is a write: it runs on the connection's strand and
    // waits behind any response already being written.
    co_await net::co_spawn(ws_.get_executor(),
        [self = shared_from_this()]() -> awaitable<void> {
            co_await self->close_stream();
        },
        net::use_awaitable);
}

auto Connection::close_stream() -> awaitable<void> {
    auto gate = write_gate_;
    co_await gate->acquire_until(std::chrono::steady_clock::time_point::max());
    struct Release {
        std::shared_ptr<backend::SendGate> gate;
        ~Release() { gate->release(); }
    } release{gate};

    try {
        co_await ws_.async_close(websocket::close_code::normal, net::use_awaitable);
    } catch (const boost::system::system_error& e) {
        LOG_DEBUG("Connection {}: close error (expected if peer gone): {}",
                  id_, e.what());
    }
}

auto Connection::run() -> awaitable<void> {
    beast::flat_buffer buffer;

    while (open_) {
        try {
            co_await ws_.async_read(buffer, net::use_awaitable);
        } catch (const boost::system::system_error& e) {
            if (e.code() == websocket::error::closed) {
                LOG_INFO("Connection {}: peer closed", id_);
            } else {
                LOG_WARN("Connection {}: read error: {}", id_, e.what());
            }
            open_ = false;
            break;
        }

        auto data = beast::buffers_to_string(buffer.data());
        buffer.consume(buffer.size());

        auto request = parse_request(data);
        if (!request) {
            LOG_WARN("Connection {}: bad frame: {}", id_, request.error().what());
            auto sent = co_await send(make_error_response(peek_request_id(data), request.error()));
            if (!sent) break;
            continue;
        }

        // Each request runs on its own so a slow tool does not hold up
        // calls to other backends from the same caller.
        net::co_spawn(ws_.get_executor(),
            [self = shared_from_this(), req = std::move(*request)]() mutable -> awaitable<void> {
                co_await self->handle_request(std::move(req));
            },
            net::detached);
    }
}

auto Connection::handle_request(RequestFrame req) -> awaitable<void> {
    LOG_DEBUG("Connection {}: request method={} id={}", id_, req.method, req.id);

    auto result = co_await protocol_->dispatch(req);

    ResponseFrame response;
    if (result) {
        response = make_response(req.id, std::move(*result));
    } else {
        LOG_DEBUG("Connection {}: {} failed: {}", id_, req.method, result.error().what());
        response = make_error_response(req.id, result.error());
    }

    auto sent = co_await send(response);
    if (!sent) {
        LOG_DEBUG("Connection {}: dropped response {}: {}", id_, req.id, sent.error().what());
    }
}

// ===========================================================================
// GatewayServer
// ===========================================================================

GatewayServer::GatewayServer(net::io_context& ioc, std::shared_ptr<Protocol> protocol)
    : ioc_(ioc)
    , protocol_(std::move(protocol)) {}

auto GatewayServer::start(const GatewayConfig& config) -> awaitable<VoidResult> {
    max_connections_ = config.max_connections;

    auto address = (config.bind == BindMode::All)
        ? net::ip::make_address("0.0.0.0")
        : net::ip::make_address("127.0.0.1");
    auto endpoint = tcp::endpoint{address, config.port};

    try {
        acceptor_ = std::make_unique<tcp::acceptor>(ioc_);
        acceptor_->open(endpoint.protocol());
        acceptor_->set_option(net::socket_base::reuse_address(true));
        acceptor_->bind(endpoint);
        acceptor_->listen(net::socket_base::max_listen_connections);
    } catch (const boost::system::system_error& e) {
        co_return make_fail(make_error(ErrorCode::IoError,
            "Failed to bind gateway on " + address.to_string() + ":" +
                std::to_string(config.port),
            e.what()));
    }

    bound_port_ = acceptor_->local_endpoint().port();
    running_ = true;
    LOG_INFO("Gateway listening on ws://{}:{}", address.to_string(), bound_port_.load());

    co_await accept_loop();
    co_return ok_result();
}

auto GatewayServer::stop() -> awaitable<void> {
    if (!running_.exchange(false)) co_return;

    if (acceptor_) {
        boost::system::error_code ec;
        acceptor_->close(ec);
    }

    std::unordered_map<std::string, std::shared_ptr<Connection>> connections;
    {
        std::lock_guard lock(connections_mutex_);
        connections.swap(connections_);
    }
    LOG_INFO("Gateway shutting down, closing {} connections", connections.size());
    for (auto& [id, conn] : connections) {
        co_await conn->close();
    }
    LOG_INFO("Gateway stopped");
}

auto GatewayServer::connection_count() const -> std::size_t {
    std::lock_guard lock(connections_mutex_);
    return connections_.size();
}

auto GatewayServer::accept_loop() -> awaitable<void> {
    while (running_) {
        try {
            // One strand per connection; its requests and writes share it.
            auto socket = co_await acceptor_->async_accept(
                net::any_io_executor(net::make_strand(ioc_)), net::use_awaitable);

            if (connection_count() >= max_connections_) {
                LOG_WARN("Max connections ({}) reached, rejecting", max_connections_);
                socket.close();
                continue;
            }

            auto executor = socket.get_executor();
            net::co_spawn(executor, handle_connection(std::move(socket)), net::detached);
        } catch (const boost::system::system_error& e) {
            if (!running_) break;
            LOG_ERROR("Accept error: {}", e.what());
        }
    }
}

auto GatewayServer::handle_connection(tcp::socket socket) -> awaitable<void> {
    auto conn_id = utils::generate_uuid();
    boost::system::error_code ep_ec;
    auto remote_ep = socket.remote_endpoint(ep_ec);
    LOG_INFO("New connection {} from {}:{}", conn_id,
             remote_ep.address().to_string(), remote_ep.port());

    Connection::WsStream ws(std::move(socket));
    try {
        ws.set_option(websocket::stream_base::timeout::suggested(
            beast::role_type::server));
        ws.set_option(websocket::stream_base::decorator(
            [](websocket::response_type& res) {
                res.set(beast::http::field::server, "toolhub-gateway/1.0");
            }));
        co_await ws.async_accept(net::use_awaitable);
    } catch (const boost::system::system_error& e) {
        LOG_WARN("Connection {}: WebSocket handshake failed: {}", conn_id, e.what());
        co_return;
    }

    auto conn = std::make_shared<Connection>(ioc_, std::move(ws), conn_id, protocol_);
    {
        std::lock_guard lock(connections_mutex_);
        connections_[conn_id] = conn;
    }

    co_await conn->run();

    {
        std::lock_guard lock(connections_mutex_);
        connections_.erase(conn_id);
    }
    LOG_INFO("Connection {} closed", conn_id);
}

} // namespace toolhub::gateway
