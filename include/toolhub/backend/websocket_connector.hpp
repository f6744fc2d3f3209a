#pragma once

#include <memory>
#include <string>

#include "toolhub/backend/connector.hpp"

namespace toolhub::backend {

/// Parsed `ws://host[:port][/path]` endpoint.
struct WsEndpoint {
    std::string host;
    std::string port;
    std::string target;
};

auto parse_ws_endpoint(std::string_view url) -> Result<WsEndpoint>;

/// Backend reachable over a WebSocket, one JSON frame per message.
class WebSocketConnector : public Connector {
public:
    WebSocketConnector(boost::asio::io_context& ioc, BackendConfig config, HealthConfig health);
    ~WebSocketConnector() override;

protected:
    auto open(std::uint64_t session) -> awaitable<VoidResult> override;
    auto write_frame(std::string frame) -> awaitable<VoidResult> override;
    auto close() -> awaitable<void> override;

private:
    auto read_loop(std::uint64_t session) -> awaitable<void>;

    struct Session;
    std::shared_ptr<Session> session_;
};

} // namespace toolhub::backend
