#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include "toolhub/backend/connector.hpp"
#include "toolhub/backend/send_gate.hpp"
#include "toolhub/core/error.hpp"
#include "toolhub/dispatch/instrumentation.hpp"
#include "toolhub/registry/store.hpp"

namespace toolhub::dispatch {

using boost::asio::awaitable;
using backend::ToolDefinition;

/// Optional narrowing for tool listings. Empty fields match everything.
struct ToolFilter {
    std::string query;    // case-insensitive substring of name or description
    std::string backend;  // case-insensitive substring of the owner id
};

struct SearchHit {
    ToolDefinition tool;
    int score = 0;
};

struct BatchItem {
    std::string name;
    json args = json::object();
};

struct BatchItemResult {
    std::size_t index = 0;
    std::string name;
    Result<json> result;
    std::chrono::milliseconds duration{0};
};

struct BatchSummary {
    std::vector<BatchItemResult> results;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::chrono::milliseconds duration{0};
};

struct ReloadSummary {
    std::size_t previous_tools = 0;
    std::size_t total_tools = 0;
    bool persisted = false;
};

/// Single entry point for listing and invoking tools.
///
/// Lookups read one registry snapshot and never touch a backend; calls are
/// forwarded to the owning connector, which orders them per backend.
class Dispatcher {
public:
    Dispatcher(boost::asio::io_context& ioc,
               registry::RegistryStore& store,
               std::vector<backend::ConnectorPtr> connectors,
               Instrumentation& instrumentation);

    /// Tools of ready backends, in registry order.
    [[nodiscard]] auto list_tools(const ToolFilter& filter = {}) const
        -> std::vector<ToolDefinition>;

    /// Any registered tool, live or not.
    [[nodiscard]] auto get_tool(std::string_view name) const -> Result<ToolDefinition>;

    /// Scored match over live tools: name +10, description +5, owner +2.
    [[nodiscard]] auto search_tools(std::string_view query) const -> std::vector<SearchHit>;

    /// Live tool names grouped by category tag.
    [[nodiscard]] auto categories() const -> std::map<std::string, std::vector<std::string>>;

    auto call_tool(std::string_view name, json args) -> awaitable<Result<json>>;

    /// Runs every item in order; a failing item does not stop the rest.
    auto batch_call(std::vector<BatchItem> items) -> awaitable<BatchSummary>;

    /// Rebuild from the backends, persist, and install the result. On a
    /// collision the previous registry stays live.
    auto reload() -> awaitable<Result<ReloadSummary>>;

    /// Operator restart of one backend, followed by a reload on success.
    auto restart_backend(std::string_view id) -> awaitable<Result<ReloadSummary>>;

    [[nodiscard]] auto connector(std::string_view id) const -> backend::ConnectorPtr;
    [[nodiscard]] auto connectors() const -> const std::vector<backend::ConnectorPtr>& {
        return connectors_;
    }

    /// Ids of backends whose tools are currently visible.
    [[nodiscard]] auto live_backends() const -> std::set<std::string>;

    [[nodiscard]] auto store() -> registry::RegistryStore& { return store_; }
    [[nodiscard]] auto instrumentation() -> Instrumentation& { return instrumentation_; }

private:
    auto invoke(const backend::ConnectorPtr& connector, const std::string& name,
                json args, CallClass cls) -> awaitable<Result<json>>;
    [[nodiscard]] auto is_visible(const ToolDefinition& tool) const -> bool;

    registry::RegistryStore& store_;
    std::vector<backend::ConnectorPtr> connectors_;
    Instrumentation& instrumentation_;
    std::shared_ptr<backend::SendGate> reload_gate_;
};

} // namespace toolhub::dispatch
