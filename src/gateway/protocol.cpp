#include "toolhub/gateway/protocol.hpp"

#include "toolhub/core/logger.hpp"
#include "toolhub/core/types.hpp"

#include <chrono>

namespace toolhub::gateway {

using SteadyClock = std::chrono::steady_clock;

Protocol::Protocol() = default;

void Protocol::register_method(std::string name, MethodHandler handler,
                               std::string description, std::string group) {
    if (methods_.contains(name)) {
        LOG_WARN("Method {} registered twice; replacing the earlier handler", name);
    }
    LOG_DEBUG("Registering method: {} [{}]", name, group);
    MethodInfo info{
        .name = name,
        .description = std::move(description),
        .group = std::move(group),
    };
    methods_.insert_or_assign(std::move(name),
                              Entry{.handler = std::move(handler), .info = std::move(info)});
}

auto Protocol::has_method(std::string_view name) const -> bool {
    return methods_.find(name) != methods_.end();
}

auto Protocol::methods() const -> std::vector<MethodInfo> {
    std::vector<MethodInfo> result;
    result.reserve(methods_.size());
    for (const auto& [_, entry] : methods_) {
        result.push_back(entry.info);
    }
    return result;
}

auto Protocol::methods_in_group(std::string_view group) const
    -> std::vector<MethodInfo> {
    std::vector<MethodInfo> result;
    for (const auto& [_, entry] : methods_) {
        if (entry.info.group == group) {
            result.push_back(entry.info);
        }
    }
    return result;
}

auto Protocol::dispatch(const RequestFrame& request) -> awaitable<Result<json>> {
    auto it = methods_.find(request.method);
    if (it == methods_.end()) {
        co_return make_fail(
            make_error(ErrorCode::NotFound, "Method not found: " + request.method));
    }

    auto started = SteadyClock::now();
    Result<json> result = json(nullptr);
    try {
        result = co_await it->second.handler(request.params);
    } catch (const json::exception& e) {
        LOG_WARN("Method {} rejected params: {}", request.method, e.what());
        result = std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Invalid params for " + request.method, e.what()));
    } catch (const std::exception& e) {
        LOG_ERROR("Method {} threw exception: {}", request.method, e.what());
        result = std::unexpected(make_error(ErrorCode::InternalError,
            "Method execution failed", e.what()));
    }

    LOG_TRACE("Method {} id={} finished in {}ms ok={}", request.method, request.id,
              std::chrono::duration_cast<std::chrono::milliseconds>(
                  SteadyClock::now() - started).count(),
              result.has_value());
    co_return result;
}

} // namespace toolhub::gateway
