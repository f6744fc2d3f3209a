#include "toolhub/backend/descriptor.hpp"

namespace toolhub::backend {

auto backend_status_to_string(BackendStatus status) -> std::string_view {
    switch (status) {
        case BackendStatus::Unstarted: return "unstarted";
        case BackendStatus::Starting: return "starting";
        case BackendStatus::Ready: return "ready";
        case BackendStatus::Degraded: return "degraded";
        case BackendStatus::Failed: return "failed";
    }
    return "unknown";
}

auto launch_spec_from_config(const BackendConfig& config) -> LaunchSpec {
    return LaunchSpec{
        .transport = config.transport,
        .command = config.command,
        .args = config.args,
        .env = config.env,
        .working_dir = config.working_dir,
        .endpoint = config.endpoint,
    };
}

void to_json(json& j, const LaunchSpec& spec) {
    j = json{{"transport", spec.transport}};
    if (spec.transport == "websocket") {
        j["endpoint"] = spec.endpoint;
        return;
    }
    j["command"] = spec.command;
    j["args"] = spec.args;
    // Only variable names; values may carry credentials.
    auto env_keys = json::array();
    for (const auto& [key, value] : spec.env) {
        env_keys.push_back(key);
    }
    j["env"] = env_keys;
    if (spec.working_dir) {
        j["working_dir"] = *spec.working_dir;
    }
}

void to_json(json& j, const BackendDescriptor& d) {
    j = json{
        {"id", d.id},
        {"launch_spec", d.launch_spec},
        {"status", d.status},
        {"consecutive_failures", d.consecutive_failures},
    };
    if (d.last_seen_at) {
        j["last_seen_at"] = to_epoch_ms(*d.last_seen_at);
    } else {
        j["last_seen_at"] = nullptr;
    }
}

} // namespace toolhub::backend
