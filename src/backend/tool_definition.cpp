#include "toolhub/backend/tool_definition.hpp"

namespace toolhub::backend {

void to_json(json& j, const ToolDefinition& t) {
    j = json{
        {"name", t.name},
        {"owner_id", t.owner_id},
        {"description", t.description},
        {"category", t.category},
        {"parameter_schema", t.parameter_schema},
    };
}

void from_json(const json& j, ToolDefinition& t) {
    t.name = j.value("name", "");
    t.owner_id = j.value("owner_id", "");
    t.description = j.value("description", "");
    t.category = j.value("category", "");
    t.parameter_schema = j.value("parameter_schema", json::object());
}

auto parse_tool_catalog(const json& payload)
    -> std::expected<std::vector<ToolDefinition>, std::string> {
    if (!payload.is_object() || !payload.contains("tools") ||
        !payload["tools"].is_array()) {
        return std::unexpected("tools.list payload has no 'tools' array");
    }

    std::vector<ToolDefinition> tools;
    tools.reserve(payload["tools"].size());
    for (const auto& entry : payload["tools"]) {
        if (!entry.is_object()) {
            return std::unexpected("tool entry is not an object");
        }
        if (!entry.contains("name") || !entry["name"].is_string() ||
            entry["name"].get<std::string>().empty()) {
            return std::unexpected("tool entry has no name");
        }
        if (entry.contains("parameter_schema") &&
            !entry["parameter_schema"].is_object()) {
            return std::unexpected("parameter_schema of '" +
                                   entry["name"].get<std::string>() +
                                   "' is not an object");
        }

        ToolDefinition tool;
        from_json(entry, tool);
        // Ownership is decided by the gateway, never by the backend.
        tool.owner_id.clear();
        tools.push_back(std::move(tool));
    }
    return tools;
}

} // namespace toolhub::backend
