#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "toolhub/core/config.hpp"
#include "toolhub/core/types.hpp"

namespace toolhub::backend {

enum class BackendStatus {
    Unstarted,
    Starting,
    Ready,
    Degraded,
    Failed,
};

NLOHMANN_JSON_SERIALIZE_ENUM(BackendStatus, {
    {BackendStatus::Unstarted, "unstarted"},
    {BackendStatus::Starting, "starting"},
    {BackendStatus::Ready, "ready"},
    {BackendStatus::Degraded, "degraded"},
    {BackendStatus::Failed, "failed"},
})

auto backend_status_to_string(BackendStatus status) -> std::string_view;

/// True for statuses whose tools are visible to callers.
[[nodiscard]] inline auto is_live(BackendStatus status) -> bool {
    return status == BackendStatus::Ready;
}

/// True for statuses that accept calls.
[[nodiscard]] inline auto accepts_calls(BackendStatus status) -> bool {
    return status == BackendStatus::Ready || status == BackendStatus::Degraded;
}

/// How to start or reach a backend.
struct LaunchSpec {
    std::string transport;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<std::string> working_dir;
    std::string endpoint;
};

auto launch_spec_from_config(const BackendConfig& config) -> LaunchSpec;

struct BackendDescriptor {
    std::string id;
    LaunchSpec launch_spec;
    BackendStatus status = BackendStatus::Unstarted;
    std::optional<Timestamp> last_seen_at;
    int consecutive_failures = 0;
};

void to_json(json& j, const LaunchSpec& spec);
void to_json(json& j, const BackendDescriptor& d);

} // namespace toolhub::backend
