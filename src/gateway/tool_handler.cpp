#include "toolhub/gateway/tool_handler.hpp"

#include "toolhub/core/logger.hpp"

namespace toolhub::gateway {

namespace {

auto optional_string(const json& params, const char* key) -> Result<std::string> {
    if (!params.is_object() || !params.contains(key) || params[key].is_null()) {
        return std::string{};
    }
    if (!params[key].is_string()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            std::string("'") + key + "' must be a string"));
    }
    return params[key].get<std::string>();
}

auto required_string(const json& params, const char* key) -> Result<std::string> {
    auto value = optional_string(params, key);
    if (value && value->empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            std::string("'") + key + "' is required"));
    }
    return value;
}

auto tools_to_json(const std::vector<backend::ToolDefinition>& tools) -> json {
    auto arr = json::array();
    for (const auto& t : tools) {
        arr.push_back(t);
    }
    return arr;
}

} // anonymous namespace

auto batch_summary_to_json(const dispatch::BatchSummary& summary) -> json {
    auto results = json::array();
    for (const auto& item : summary.results) {
        json entry = {
            {"index", item.index},
            {"name", item.name},
            {"ok", item.result.has_value()},
            {"duration_ms", item.duration.count()},
        };
        if (item.result) {
            entry["result"] = *item.result;
        } else {
            entry["error"] = error_to_json(item.result.error());
        }
        results.push_back(std::move(entry));
    }
    return json{
        {"results", std::move(results)},
        {"total", summary.results.size()},
        {"succeeded", summary.succeeded},
        {"failed", summary.failed},
        {"duration_ms", summary.duration.count()},
    };
}

void register_tool_handlers(Protocol& protocol, dispatch::Dispatcher& dispatcher) {
    // tools.list
    protocol.register_method("tools.list",
        [&dispatcher](json params) -> awaitable<Result<json>> {
            auto query = optional_string(params, "query");
            if (!query) co_return make_fail(query.error());
            auto backend = optional_string(params, "backend");
            if (!backend) co_return make_fail(backend.error());

            auto tools = dispatcher.list_tools(dispatch::ToolFilter{*query, *backend});
            co_return json{{"tools", tools_to_json(tools)}, {"count", tools.size()}};
        },
        "List tools of ready backends, optionally filtered", "tools");

    // tools.get
    protocol.register_method("tools.get",
        [&dispatcher](json params) -> awaitable<Result<json>> {
            auto name = required_string(params, "name");
            if (!name) co_return make_fail(name.error());

            auto tool = dispatcher.get_tool(*name);
            if (!tool) co_return make_fail(tool.error());

            auto owner = dispatcher.connector(tool->owner_id);
            co_return json{
                {"tool", *tool},
                {"schema_version", dispatcher.store().current()->schema_version()},
                {"owner_status", owner ? json(owner->status()) : json(nullptr)},
            };
        },
        "Describe one tool", "tools");

    // tools.search
    protocol.register_method("tools.search",
        [&dispatcher](json params) -> awaitable<Result<json>> {
            auto query = required_string(params, "query");
            if (!query) co_return make_fail(query.error());

            auto hits = dispatcher.search_tools(*query);
            auto results = json::array();
            for (const auto& hit : hits) {
                json entry = hit.tool;
                entry["score"] = hit.score;
                results.push_back(std::move(entry));
            }
            co_return json{
                {"query", *query},
                {"results", std::move(results)},
                {"count", hits.size()},
            };
        },
        "Search tools by name, description and owner", "tools");

    // tools.categories
    protocol.register_method("tools.categories",
        [&dispatcher]([[maybe_unused]] json params) -> awaitable<Result<json>> {
            auto categories = dispatcher.categories();
            co_return json{{"categories", categories}, {"count", categories.size()}};
        },
        "Group live tools by category", "tools");

    // tools.call
    protocol.register_method("tools.call",
        [&dispatcher](json params) -> awaitable<Result<json>> {
            auto name = required_string(params, "name");
            if (!name) co_return make_fail(name.error());

            auto args = params.value("args", json::object());
            if (!args.is_object()) {
                co_return make_fail(make_error(ErrorCode::InvalidArgument,
                    "'args' must be an object"));
            }
            co_return co_await dispatcher.call_tool(*name, std::move(args));
        },
        "Invoke a tool on its owning backend", "tools");

    // tools.batch_call
    protocol.register_method("tools.batch_call",
        [&dispatcher](json params) -> awaitable<Result<json>> {
            const json* calls = nullptr;
            if (params.is_array()) {
                calls = &params;
            } else if (params.is_object() && params.contains("calls") &&
                       params["calls"].is_array()) {
                calls = &params["calls"];
            }
            if (!calls) {
                co_return make_fail(make_error(ErrorCode::InvalidArgument,
                    "'calls' must be an array"));
            }

            std::vector<dispatch::BatchItem> items;
            items.reserve(calls->size());
            for (const auto& call : *calls) {
                dispatch::BatchItem item;
                if (call.is_object()) {
                    if (call.contains("name") && call["name"].is_string()) {
                        item.name = call["name"].get<std::string>();
                    }
                    if (call.contains("args")) {
                        item.args = call["args"];
                    }
                }
                items.push_back(std::move(item));
            }

            auto summary = co_await dispatcher.batch_call(std::move(items));
            co_return batch_summary_to_json(summary);
        },
        "Invoke several tools in order, continuing past failures", "tools");

    // tools.stats
    protocol.register_method("tools.stats",
        [&dispatcher](json params) -> awaitable<Result<json>> {
            auto name = optional_string(params, "name");
            if (!name) co_return make_fail(name.error());

            auto& instrumentation = dispatcher.instrumentation();
            if (!name->empty()) {
                auto stats = instrumentation.stats(*name);
                if (!stats) {
                    co_return make_fail(make_error(ErrorCode::NotFound,
                        "No calls recorded for tool", *name));
                }
                co_return json(*stats);
            }
            co_return json{{"tools", instrumentation.all_stats()}};
        },
        "Per-tool call counters and latency", "tools");

    // registry.reload
    protocol.register_method("registry.reload",
        [&dispatcher]([[maybe_unused]] json params) -> awaitable<Result<json>> {
            auto summary = co_await dispatcher.reload();
            if (!summary) co_return make_fail(summary.error());
            co_return json{
                {"previous_tools", summary->previous_tools},
                {"total_tools", summary->total_tools},
                {"persisted", summary->persisted},
            };
        },
        "Rebuild the registry from the backends and persist it", "registry");
}

} // namespace toolhub::gateway
