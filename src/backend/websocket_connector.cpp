#include "toolhub/backend/websocket_connector.hpp"
#include "toolhub/core/logger.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

namespace toolhub::backend {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

struct WebSocketConnector::Session {
    websocket::stream<beast::tcp_stream> ws;

    explicit Session(net::any_io_executor executor) : ws(executor) {}
};

auto parse_ws_endpoint(std::string_view url) -> Result<WsEndpoint> {
    if (!url.starts_with("ws://")) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "Unsupported WebSocket endpoint", std::string(url)));
    }

    auto rest = url.substr(5);
    auto path_pos = rest.find('/');
    auto host_port = rest.substr(0, path_pos);

    WsEndpoint ep;
    ep.target = (path_pos != std::string_view::npos)
        ? std::string(rest.substr(path_pos)) : std::string("/");

    auto colon_pos = host_port.rfind(':');
    if (colon_pos != std::string_view::npos) {
        ep.host = std::string(host_port.substr(0, colon_pos));
        ep.port = std::string(host_port.substr(colon_pos + 1));
    } else {
        ep.host = std::string(host_port);
        ep.port = "80";
    }

    if (ep.host.empty() || ep.port.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "Malformed WebSocket endpoint", std::string(url)));
    }
    return ep;
}

WebSocketConnector::WebSocketConnector(net::io_context& ioc, BackendConfig config,
                                       HealthConfig health)
    : Connector(ioc, std::move(config), health) {}

WebSocketConnector::~WebSocketConnector() {
    if (session_) {
        beast::error_code ec;
        beast::get_lowest_layer(session_->ws).socket().close(ec);
    }
}

auto WebSocketConnector::open(std::uint64_t session) -> awaitable<VoidResult> {
    auto endpoint = parse_ws_endpoint(config().endpoint);
    if (!endpoint) {
        co_return make_fail(endpoint.error());
    }

    auto executor = co_await net::this_coro::executor;
    auto current = std::make_shared<Session>(executor);

    try {
        tcp::resolver resolver(executor);
        auto results = co_await resolver.async_resolve(
            endpoint->host, endpoint->port, net::use_awaitable);

        beast::get_lowest_layer(current->ws).expires_after(
            std::chrono::milliseconds(config().handshake_timeout_ms));
        auto ep = co_await beast::get_lowest_layer(current->ws).async_connect(
            results, net::use_awaitable);

        beast::get_lowest_layer(current->ws).expires_never();
        current->ws.set_option(websocket::stream_base::timeout::suggested(
            beast::role_type::client));
        current->ws.set_option(websocket::stream_base::decorator(
            [](websocket::request_type& req) {
                req.set(beast::http::field::user_agent, "toolhub-gateway/1.0");
            }));

        auto host = endpoint->host + ":" + std::to_string(ep.port());
        co_await current->ws.async_handshake(host, endpoint->target, net::use_awaitable);
    } catch (const beast::system_error& se) {
        co_return make_fail(make_error(ErrorCode::BackendUnavailable,
            "Failed to connect to backend '" + id() + "'", se.what()));
    }

    session_ = current;
    LOG_INFO("Backend {} connected to {}", id(), config().endpoint);

    auto self = std::static_pointer_cast<WebSocketConnector>(shared_from_this());
    net::co_spawn(executor,
        [self, session]() -> awaitable<void> {
            co_await self->read_loop(session);
        }, net::detached);

    co_return ok_result();
}

auto WebSocketConnector::read_loop(std::uint64_t session) -> awaitable<void> {
    auto current = session_;
    beast::flat_buffer buffer;
    std::string reason = "connection closed";

    while (true) {
        beast::error_code ec;
        co_await current->ws.async_read(buffer,
            net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            if (ec != websocket::error::closed) {
                reason = ec.message();
            }
            break;
        }
        auto msg = beast::buffers_to_string(buffer.data());
        buffer.consume(buffer.size());
        deliver(msg);
    }

    connection_lost(session, reason);
}

auto WebSocketConnector::write_frame(std::string frame) -> awaitable<VoidResult> {
    auto current = session_;
    if (!current || !current->ws.is_open()) {
        co_return make_fail(make_error(ErrorCode::BackendUnavailable,
            "Backend connection is not open", id()));
    }

    beast::error_code ec;
    current->ws.text(true);
    co_await current->ws.async_write(net::buffer(frame),
        net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        co_return make_fail(make_error(ErrorCode::BackendUnavailable,
            "Failed to write to backend", ec.message()));
    }
    co_return ok_result();
}

auto WebSocketConnector::close() -> awaitable<void> {
    auto current = std::move(session_);
    if (!current) {
        co_return;
    }

    // A graceful close may not overlap an in-flight write, so drop the socket.
    beast::get_lowest_layer(current->ws).close();
    LOG_INFO("Backend {} disconnected from {}", id(), config().endpoint);
}

} // namespace toolhub::backend
