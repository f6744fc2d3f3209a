#include "toolhub/core/config.hpp"
#include "toolhub/core/logger.hpp"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <unordered_set>

namespace toolhub {

namespace {

void resolve_backend_env_refs(BackendConfig& backend) {
    backend.command = resolve_env_refs(backend.command);
    for (auto& arg : backend.args) {
        arg = resolve_env_refs(arg);
    }
    for (auto& [key, value] : backend.env) {
        value = resolve_env_refs(value);
    }
    if (backend.working_dir) {
        backend.working_dir = resolve_env_refs(*backend.working_dir);
    }
    backend.endpoint = resolve_env_refs(backend.endpoint);
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        auto config = j.get<Config>();
        for (auto& backend : config.backends) {
            resolve_backend_env_refs(backend);
        }
        return config;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

void apply_env_overrides(Config& config) {
    if (auto* val = std::getenv("TOOLHUB_PORT")) {
        try {
            std::size_t used = 0;
            auto port = std::stoi(val, &used);
            if (used != std::strlen(val) || port < 0 || port > 65535) {
                LOG_WARN("Ignoring out-of-range TOOLHUB_PORT '{}'", val);
            } else {
                config.gateway.port = static_cast<uint16_t>(port);
            }
        } catch (const std::exception&) {
            LOG_WARN("Ignoring invalid TOOLHUB_PORT '{}'", val);
        }
    }
    if (auto* val = std::getenv("TOOLHUB_BIND")) {
        config.gateway.bind = (std::string(val) == "all") ? BindMode::All : BindMode::Loopback;
    }
    if (auto* val = std::getenv("TOOLHUB_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("TOOLHUB_DATA_DIR")) {
        config.data_dir = val;
    }
    if (auto* val = std::getenv("TOOLHUB_REGISTRY_PATH")) {
        config.registry.path = val;
    }
}

auto validate_config(const Config& config) -> VoidResult {
    std::unordered_set<std::string> seen;
    for (const auto& backend : config.backends) {
        if (backend.id.empty()) {
            return std::unexpected(make_error(
                ErrorCode::InvalidConfig, "Backend id must not be empty"));
        }
        if (!seen.insert(backend.id).second) {
            return std::unexpected(make_error(
                ErrorCode::InvalidConfig, "Duplicate backend id", backend.id));
        }
        if (backend.transport == "stdio") {
            if (backend.command.empty()) {
                return std::unexpected(make_error(
                    ErrorCode::InvalidConfig,
                    "stdio backend requires a command", backend.id));
            }
        } else if (backend.transport == "websocket") {
            if (!backend.endpoint.starts_with("ws://")) {
                return std::unexpected(make_error(
                    ErrorCode::InvalidConfig,
                    "websocket backend requires a ws:// endpoint", backend.id));
            }
        } else {
            return std::unexpected(make_error(
                ErrorCode::InvalidConfig,
                "Unknown backend transport '" + backend.transport + "'",
                backend.id));
        }
        if (backend.call_timeout_ms <= 0 || backend.handshake_timeout_ms <= 0) {
            return std::unexpected(make_error(
                ErrorCode::InvalidConfig,
                "Backend timeouts must be positive", backend.id));
        }
    }

    const auto& health = config.health;
    if (health.degrade_after_failures < 1 || health.fail_after_degraded_failures < 1) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "Failure thresholds must be at least 1"));
    }
    if (health.backoff_initial_ms <= 0 || health.backoff_max_ms < health.backoff_initial_ms) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "Invalid backoff settings"));
    }
    return {};
}

auto default_config() -> Config {
    return Config{};
}

auto default_data_dir() -> std::filesystem::path {
    if (auto* val = std::getenv("TOOLHUB_DATA_DIR")) {
        return val;
    }
    auto home = std::filesystem::path(std::getenv("HOME") ? std::getenv("HOME") : "/tmp");
    return home / ".toolhub";
}

auto registry_path(const Config& config) -> std::filesystem::path {
    if (config.registry.path) {
        return *config.registry.path;
    }
    auto dir = config.data_dir ? std::filesystem::path(*config.data_dir)
                               : default_data_dir();
    return dir / "tool_registry.json";
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // Check for $$ escape
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            // Escaped: $${VAR} -> literal ${VAR}
            result += '$';
            i += 2;
            continue;
        }

        // Check for ${VAR} pattern
        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                auto var_name = input.substr(i + 2, close - i - 2);
                std::string var_name_str(var_name);

                if (auto* val = std::getenv(var_name_str.c_str())) {
                    result += val;
                } else {
                    // Preserve unresolved refs
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

} // namespace toolhub
