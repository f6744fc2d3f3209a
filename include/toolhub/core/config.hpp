#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "toolhub/core/error.hpp"
#include "toolhub/core/types.hpp"

// std::optional serializer for nlohmann/json — enables NLOHMANN_DEFINE macros
// to work with optional fields via j.value("key", default_val)
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace toolhub {

struct GatewayConfig {
    uint16_t port = 18790;
    BindMode bind = BindMode::Loopback;
    size_t max_connections = 64;
    size_t worker_threads = 4;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(GatewayConfig, port, bind, max_connections, worker_threads)

/// Static description of one backend tool provider.
struct BackendConfig {
    std::string id;
    std::string transport = "stdio";  // "stdio" or "websocket"
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<std::string> working_dir;
    std::string endpoint;             // ws://host:port/path for websocket backends
    int call_timeout_ms = 30000;
    int handshake_timeout_ms = 10000;
    bool enabled = true;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(BackendConfig, id, transport, command, args, env, working_dir, endpoint, call_timeout_ms, handshake_timeout_ms, enabled)

struct RegistryConfig {
    std::optional<std::string> path;  // default: <data_dir>/tool_registry.json
    int schema_version = 1;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(RegistryConfig, path, schema_version)

struct InstrumentationConfig {
    int interactive_threshold_ms = 500;
    int batch_threshold_ms = 5000;
    size_t window_size = 64;
    double error_rate_alert = 0.25;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(InstrumentationConfig, interactive_threshold_ms, batch_threshold_ms, window_size, error_rate_alert)

struct HealthConfig {
    int interval_seconds = 30;
    int degrade_after_failures = 3;
    int fail_after_degraded_failures = 3;
    int max_start_retries = 5;
    int backoff_initial_ms = 1000;
    int backoff_max_ms = 30000;
    int ping_timeout_ms = 2000;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(HealthConfig, interval_seconds, degrade_after_failures, fail_after_degraded_failures, max_start_retries, backoff_initial_ms, backoff_max_ms, ping_timeout_ms)

struct Config {
    GatewayConfig gateway;
    std::vector<BackendConfig> backends;
    RegistryConfig registry;
    InstrumentationConfig instrumentation;
    HealthConfig health;
    std::string log_level = "info";
    std::optional<std::string> data_dir;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, gateway, backends, registry, instrumentation, health, log_level, data_dir)

auto load_config(const std::filesystem::path& path) -> Config;
auto default_config() -> Config;
auto default_data_dir() -> std::filesystem::path;

/// Applies TOOLHUB_* environment overrides on top of an existing config.
void apply_env_overrides(Config& config);

/// Checks backend ids and launch specs. Returns InvalidConfig on the first
/// problem found.
auto validate_config(const Config& config) -> VoidResult;

/// Effective registry file location for this config.
auto registry_path(const Config& config) -> std::filesystem::path;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace toolhub
