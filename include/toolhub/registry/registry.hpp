#pragma once

#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "toolhub/backend/tool_definition.hpp"
#include "toolhub/core/error.hpp"
#include "toolhub/core/types.hpp"

namespace toolhub::registry {

using backend::ToolDefinition;

inline constexpr int kSchemaVersion = 1;

/// One backend's contribution to a rebuild.
struct BackendCatalog {
    std::string owner_id;
    std::vector<ToolDefinition> tools;
};

/// Immutable, unique-by-name view of every tool the gateway exposes.
/// Tools keep the order they were merged in.
class Registry {
public:
    Registry() = default;

    /// Merge per-backend catalogs in the given order. A name claimed by two
    /// different owners is a RegistryCollision.
    static auto merge(const std::vector<BackendCatalog>& catalogs,
                      Timestamp generated_at = Clock::now()) -> Result<Registry>;

    /// Parse and validate a registry document. Any violation, including an
    /// owner outside `known_backends`, is RegistryCorrupt.
    static auto from_json(const json& j, const std::set<std::string>& known_backends)
        -> Result<Registry>;

    [[nodiscard]] auto to_json() const -> json;

    [[nodiscard]] auto tools() const -> const std::vector<ToolDefinition>& { return tools_; }
    [[nodiscard]] auto total_tools() const -> std::size_t { return tools_.size(); }
    [[nodiscard]] auto generated_at() const -> Timestamp { return generated_at_; }
    [[nodiscard]] auto schema_version() const -> int { return schema_version_; }
    [[nodiscard]] auto empty() const -> bool { return tools_.empty(); }

    /// Distinct owner ids in first-seen order.
    [[nodiscard]] auto backends() const -> std::vector<std::string>;

    [[nodiscard]] auto find(std::string_view name) const -> const ToolDefinition*;

    /// Every owner is among `known_backends`.
    [[nodiscard]] auto check_owners(const std::set<std::string>& known_backends) const
        -> VoidResult;

    /// SHA-256 over the serialized tool list; independent of generated_at.
    [[nodiscard]] auto digest() const -> std::string;

    auto operator==(const Registry& other) const -> bool;

private:
    Registry(std::vector<ToolDefinition> tools, Timestamp generated_at, int schema_version);

    std::vector<ToolDefinition> tools_;
    std::unordered_map<std::string, std::size_t> index_;
    Timestamp generated_at_{};
    int schema_version_ = kSchemaVersion;
};

/// Structural checks shared by load and `registry validate`.
auto validate_registry_json(const json& j, const std::set<std::string>& known_backends)
    -> VoidResult;

} // namespace toolhub::registry
