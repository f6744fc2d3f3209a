#include "toolhub/backend/connector.hpp"
#include "toolhub/backend/stdio_connector.hpp"
#include "toolhub/backend/websocket_connector.hpp"

namespace toolhub::backend {

auto make_connector(boost::asio::io_context& ioc, const BackendConfig& config,
                    const HealthConfig& health) -> Result<ConnectorPtr> {
    if (config.transport == "stdio") {
        return std::make_shared<StdioConnector>(ioc, config, health);
    }
    if (config.transport == "websocket") {
        auto endpoint = parse_ws_endpoint(config.endpoint);
        if (!endpoint) {
            return std::unexpected(endpoint.error());
        }
        return std::make_shared<WebSocketConnector>(ioc, config, health);
    }
    return std::unexpected(make_error(ErrorCode::InvalidConfig,
        "Unknown backend transport '" + config.transport + "'", config.id));
}

} // namespace toolhub::backend
