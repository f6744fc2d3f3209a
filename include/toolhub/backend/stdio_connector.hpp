#pragma once

#include <memory>

#include "toolhub/backend/connector.hpp"

namespace toolhub::backend {

/// Backend running as a child process, speaking line-delimited JSON frames
/// over its stdin/stdout.
class StdioConnector : public Connector {
public:
    StdioConnector(boost::asio::io_context& ioc, BackendConfig config, HealthConfig health);
    ~StdioConnector() override;

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
