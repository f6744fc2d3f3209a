#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "toolhub/core/error.hpp"
#include "toolhub/gateway/frame.hpp"

namespace toolhub::gateway {

using boost::asio::awaitable;

/// Signature for an RPC method handler. Errors are returned, not thrown,
/// so their kind reaches the caller intact.
using MethodHandler = std::function<awaitable<Result<json>>(json params)>;

/// Metadata about a registered RPC method.
struct MethodInfo {
    std::string name;
    std::string description;
    std::string group;
};

/// Method table of the inbound surface. Routes request frames to handlers.
class Protocol {
public:
    Protocol();

    /// Registering a name twice replaces the earlier handler.
    void register_method(std::string name, MethodHandler handler,
                         std::string description = "",
                         std::string group = "");

    [[nodiscard]] auto has_method(std::string_view name) const -> bool;

    /// All registered methods, sorted by name.
    [[nodiscard]] auto methods() const -> std::vector<MethodInfo>;

    [[nodiscard]] auto methods_in_group(std::string_view group) const
        -> std::vector<MethodInfo>;

    /// Unknown methods are NotFound. A handler that throws a JSON type or
    /// access error was given params of the wrong shape: InvalidArgument.
    /// Any other exception becomes InternalError.
    auto dispatch(const RequestFrame& request) -> awaitable<Result<json>>;

private:
    struct Entry {
        MethodHandler handler;
        MethodInfo info;
    };

    std::map<std::string, Entry, std::less<>> methods_;
};

} // namespace toolhub::gateway
