#pragma once

#include <expected>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "toolhub/core/types.hpp"

namespace toolhub::backend {

/// A callable tool as advertised by a backend and exposed by the gateway.
struct ToolDefinition {
    std::string name;
    std::string owner_id;
    std::string description;
    json parameter_schema = json::object();
    std::string category;

    auto operator==(const ToolDefinition&) const -> bool = default;
};

void to_json(json& j, const ToolDefinition& t);
void from_json(const json& j, ToolDefinition& t);

/// Parses the payload of a backend `tools.list` reply. Tools without a
/// string name are rejected as a whole; owner_id is left empty for the
/// caller to assign.
auto parse_tool_catalog(const json& payload)
    -> std::expected<std::vector<ToolDefinition>, std::string>;

} // namespace toolhub::backend
