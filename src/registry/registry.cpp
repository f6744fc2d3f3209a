#include "toolhub/registry/registry.hpp"
#include "toolhub/core/logger.hpp"
#include "toolhub/core/utils.hpp"

#include <algorithm>

namespace toolhub::registry {

namespace {

auto corrupt(std::string message, std::string detail = {}) -> Error {
    return make_error(ErrorCode::RegistryCorrupt, std::move(message), std::move(detail));
}

auto check_parameter_schema(const std::string& tool, const json& schema) -> VoidResult {
    if (!schema.is_object()) {
        return std::unexpected(corrupt("parameter_schema is not an object", tool));
    }
    if (!schema.contains("properties")) {
        return {};
    }
    const auto& props = schema["properties"];
    if (!props.is_object()) {
        return std::unexpected(corrupt("parameter_schema.properties is not an object", tool));
    }
    for (const auto& [param, spec] : props.items()) {
        if (!spec.is_object() || !spec.contains("type")) {
            return std::unexpected(corrupt(
                "Parameter '" + param + "' has no type", tool));
        }
    }
    return {};
}

} // anonymous namespace

Registry::Registry(std::vector<ToolDefinition> tools, Timestamp generated_at, int schema_version)
    : tools_(std::move(tools)),
      generated_at_(from_epoch_ms(to_epoch_ms(generated_at))),
      schema_version_(schema_version) {
    index_.reserve(tools_.size());
    for (std::size_t i = 0; i < tools_.size(); ++i) {
        index_.emplace(tools_[i].name, i);
    }
}

auto Registry::merge(const std::vector<BackendCatalog>& catalogs, Timestamp generated_at)
    -> Result<Registry> {
    std::vector<ToolDefinition> merged;
    std::unordered_map<std::string, std::string> owners;

    for (const auto& catalog : catalogs) {
        for (const auto& tool : catalog.tools) {
            auto [it, inserted] = owners.emplace(tool.name, catalog.owner_id);
            if (!inserted) {
                if (it->second != catalog.owner_id) {
                    LOG_ERROR("Tool name collision: '{}' offered by {} and {}",
                              tool.name, it->second, catalog.owner_id);
                    return std::unexpected(make_error(ErrorCode::RegistryCollision,
                        "Tool '" + tool.name + "' is offered by more than one backend",
                        it->second + "," + catalog.owner_id));
                }
                LOG_WARN("Backend {} lists tool '{}' twice; keeping the first",
                         catalog.owner_id, tool.name);
                continue;
            }
            auto copy = tool;
            copy.owner_id = catalog.owner_id;
            merged.push_back(std::move(copy));
        }
    }

    return Registry(std::move(merged), generated_at, kSchemaVersion);
}

auto validate_registry_json(const json& j, const std::set<std::string>& known_backends)
    -> VoidResult {
    if (!j.is_object()) {
        return std::unexpected(corrupt("Registry document is not an object"));
    }
    if (!j.contains("schema_version") || !j["schema_version"].is_number_integer()) {
        return std::unexpected(corrupt("Missing schema_version"));
    }
    if (j["schema_version"].get<int>() != kSchemaVersion) {
        return std::unexpected(corrupt("Unsupported schema_version",
            std::to_string(j["schema_version"].get<int>())));
    }
    if (!j.contains("tools") || !j["tools"].is_array()) {
        return std::unexpected(corrupt("Missing tools array"));
    }
    if (!j.contains("total_tools") || !j["total_tools"].is_number_integer()) {
        return std::unexpected(corrupt("Missing total_tools"));
    }
    if (j.contains("generated_at") && !j["generated_at"].is_number_integer()) {
        return std::unexpected(corrupt("generated_at is not an integer"));
    }

    const auto& tools = j["tools"];
    if (j["total_tools"].get<std::int64_t>() != static_cast<std::int64_t>(tools.size())) {
        return std::unexpected(corrupt("total_tools does not match tool count",
            std::to_string(j["total_tools"].get<std::int64_t>()) + " != " +
            std::to_string(tools.size())));
    }

    std::set<std::string> names;
    for (const auto& tool : tools) {
        if (!tool.is_object()) {
            return std::unexpected(corrupt("Tool entry is not an object"));
        }
        if (!tool.contains("name") || !tool["name"].is_string() ||
            tool["name"].get<std::string>().empty()) {
            return std::unexpected(corrupt("Tool entry has no name"));
        }
        auto name = tool["name"].get<std::string>();
        if (!tool.contains("owner_id") || !tool["owner_id"].is_string()) {
            return std::unexpected(corrupt("Tool has no owner_id", name));
        }
        for (const char* field : {"description", "category"}) {
            if (tool.contains(field) && !tool[field].is_string()) {
                return std::unexpected(corrupt(
                    std::string("Tool field '") + field + "' is not a string", name));
            }
        }
        if (tool.contains("parameter_schema")) {
            if (auto ok = check_parameter_schema(name, tool["parameter_schema"]); !ok) {
                return ok;
            }
        }
        if (!names.insert(name).second) {
            return std::unexpected(corrupt("Duplicate tool name", name));
        }
        auto owner = tool["owner_id"].get<std::string>();
        if (!known_backends.contains(owner)) {
            return std::unexpected(corrupt(
                "Tool owner is not a configured backend", name + " -> " + owner));
        }
    }
    return {};
}

auto Registry::from_json(const json& j, const std::set<std::string>& known_backends)
    -> Result<Registry> {
    if (auto valid = validate_registry_json(j, known_backends); !valid) {
        return std::unexpected(valid.error());
    }

    std::vector<ToolDefinition> tools;
    tools.reserve(j["tools"].size());
    for (const auto& entry : j["tools"]) {
        tools.push_back(entry.get<ToolDefinition>());
    }
    return Registry(std::move(tools),
                    from_epoch_ms(j.value("generated_at", std::int64_t{0})),
                    j["schema_version"].get<int>());
}

auto Registry::to_json() const -> json {
    auto tools = json::array();
    for (const auto& tool : tools_) {
        tools.push_back(tool);
    }
    return json{
        {"schema_version", schema_version_},
        {"generated_at", to_epoch_ms(generated_at_)},
        {"total_tools", tools_.size()},
        {"backends", backends()},
        {"tools", std::move(tools)},
    };
}

auto Registry::backends() const -> std::vector<std::string> {
    std::vector<std::string> ids;
    for (const auto& tool : tools_) {
        if (std::find(ids.begin(), ids.end(), tool.owner_id) == ids.end()) {
            ids.push_back(tool.owner_id);
        }
    }
    return ids;
}

auto Registry::find(std::string_view name) const -> const ToolDefinition* {
    auto it = index_.find(std::string(name));
    if (it == index_.end()) {
        return nullptr;
    }
    return &tools_[it->second];
}

auto Registry::check_owners(const std::set<std::string>& known_backends) const -> VoidResult {
    for (const auto& tool : tools_) {
        if (!known_backends.contains(tool.owner_id)) {
            return std::unexpected(corrupt(
                "Tool owner is not a configured backend",
                tool.name + " -> " + tool.owner_id));
        }
    }
    return {};
}

auto Registry::digest() const -> std::string {
    auto tools = json::array();
    for (const auto& tool : tools_) {
        tools.push_back(tool);
    }
    return utils::sha256(tools.dump());
}

auto Registry::operator==(const Registry& other) const -> bool {
    return schema_version_ == other.schema_version_ &&
           generated_at_ == other.generated_at_ &&
           tools_ == other.tools_;
}

} // namespace toolhub::registry
