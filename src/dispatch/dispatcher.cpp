#include "toolhub/dispatch/dispatcher.hpp"
#include "toolhub/core/logger.hpp"
#include "toolhub/core/utils.hpp"

#include <algorithm>

namespace toolhub::dispatch {

using SteadyClock = std::chrono::steady_clock;

namespace {

auto outcome_of(const Result<json>& result) -> CallOutcome {
    if (result) return CallOutcome::Success;
    if (result.error().code() == ErrorCode::Timeout) return CallOutcome::Timeout;
    return CallOutcome::Error;
}

auto elapsed_since(SteadyClock::time_point start) -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start);
}

} // anonymous namespace

Dispatcher::Dispatcher(boost::asio::io_context& ioc,
                       registry::RegistryStore& store,
                       std::vector<backend::ConnectorPtr> connectors,
                       Instrumentation& instrumentation)
    : store_(store),
      connectors_(std::move(connectors)),
      instrumentation_(instrumentation),
      reload_gate_(std::make_shared<backend::SendGate>(ioc, 1)) {}

auto Dispatcher::connector(std::string_view id) const -> backend::ConnectorPtr {
    for (const auto& c : connectors_) {
        if (c->id() == id) return c;
    }
    return nullptr;
}

auto Dispatcher::live_backends() const -> std::set<std::string> {
    std::set<std::string> live;
    for (const auto& c : connectors_) {
        if (backend::is_live(c->status())) {
            live.insert(c->id());
        }
    }
    return live;
}

auto Dispatcher::is_visible(const ToolDefinition& tool) const -> bool {
    auto owner = connector(tool.owner_id);
    return owner && backend::is_live(owner->status());
}

auto Dispatcher::list_tools(const ToolFilter& filter) const -> std::vector<ToolDefinition> {
    auto snapshot = store_.current();
    std::vector<ToolDefinition> result;
    for (const auto& tool : snapshot->tools()) {
        if (!is_visible(tool)) continue;
        if (!filter.backend.empty() && !utils::icontains(tool.owner_id, filter.backend)) {
            continue;
        }
        if (!filter.query.empty() &&
            !utils::icontains(tool.name, filter.query) &&
            !utils::icontains(tool.description, filter.query)) {
            continue;
        }
        result.push_back(tool);
    }
    return result;
}

auto Dispatcher::get_tool(std::string_view name) const -> Result<ToolDefinition> {
    auto snapshot = store_.current();
    const auto* tool = snapshot->find(name);
    if (!tool) {
        return std::unexpected(make_error(ErrorCode::ToolNotFound,
            "Tool not found", std::string(name)));
    }
    return *tool;
}

auto Dispatcher::search_tools(std::string_view query) const -> std::vector<SearchHit> {
    std::vector<SearchHit> hits;
    if (utils::trim(query).empty()) {
        return hits;
    }

    for (const auto& tool : list_tools()) {
        int score = 0;
        if (utils::icontains(tool.name, query)) score += 10;
        if (utils::icontains(tool.description, query)) score += 5;
        if (utils::icontains(tool.owner_id, query)) score += 2;
        if (score > 0) {
            hits.push_back(SearchHit{tool, score});
        }
    }
    std::stable_sort(hits.begin(), hits.end(),
        [](const SearchHit& a, const SearchHit& b) { return a.score > b.score; });
    return hits;
}

auto Dispatcher::categories() const -> std::map<std::string, std::vector<std::string>> {
    std::map<std::string, std::vector<std::string>> result;
    for (const auto& tool : list_tools()) {
        auto key = tool.category.empty() ? std::string("uncategorized") : tool.category;
        result[key].push_back(tool.name);
    }
    return result;
}

auto Dispatcher::invoke(const backend::ConnectorPtr& connector, const std::string& name,
                        json args, CallClass cls) -> awaitable<Result<json>> {
    auto started_at = Clock::now();
    auto start = SteadyClock::now();

    auto result = co_await connector->call(name, std::move(args));

    instrumentation_.record(CallRecord{
        .tool_name = name,
        .started_at = started_at,
        .duration = elapsed_since(start),
        .outcome = outcome_of(result),
    }, cls);
    co_return result;
}

auto Dispatcher::call_tool(std::string_view name, json args) -> awaitable<Result<json>> {
    backend::ConnectorPtr owner;
    std::string tool_name(name);
    {
        auto snapshot = store_.current();
        const auto* tool = snapshot->find(name);
        if (!tool) {
            co_return make_fail(make_error(ErrorCode::ToolNotFound,
                "Tool not found", tool_name));
        }
        owner = connector(tool->owner_id);
        if (!owner) {
            co_return make_fail(make_error(ErrorCode::BackendUnavailable,
                "Owner of tool is not configured", tool->owner_id));
        }
    }

    co_return co_await invoke(owner, tool_name, std::move(args), CallClass::Interactive);
}

auto Dispatcher::batch_call(std::vector<BatchItem> items) -> awaitable<BatchSummary> {
    BatchSummary summary;
    summary.results.reserve(items.size());
    auto batch_start = SteadyClock::now();
    auto snapshot = store_.current();

    for (std::size_t i = 0; i < items.size(); ++i) {
        auto& item = items[i];
        auto item_start = SteadyClock::now();
        BatchItemResult entry{.index = i, .name = item.name, .result = json(nullptr)};

        const auto* tool = item.name.empty() ? nullptr : snapshot->find(item.name);
        if (item.name.empty()) {
            entry.result = std::unexpected(make_error(ErrorCode::InvalidArgument,
                "Batch item has no tool name", "index " + std::to_string(i)));
        } else if (!item.args.is_object()) {
            entry.result = std::unexpected(make_error(ErrorCode::InvalidArgument,
                "Batch item args must be an object", "index " + std::to_string(i)));
        } else if (!tool) {
            entry.result = std::unexpected(make_error(ErrorCode::ToolNotFound,
                "Tool not found", item.name));
        } else if (auto owner = connector(tool->owner_id); !owner) {
            entry.result = std::unexpected(make_error(ErrorCode::BackendUnavailable,
                "Owner of tool is not configured", tool->owner_id));
        } else {
            entry.result = co_await invoke(owner, item.name, std::move(item.args),
                                           CallClass::Batch);
        }

        entry.duration = elapsed_since(item_start);
        if (entry.result) {
            ++summary.succeeded;
        } else {
            ++summary.failed;
            LOG_DEBUG("Batch item {} ({}) failed: {}", i, item.name,
                      entry.result.error().what());
        }
        summary.results.push_back(std::move(entry));
    }

    summary.duration = elapsed_since(batch_start);
    instrumentation_.record_batch(items.size(), summary.duration);
    co_return summary;
}

auto Dispatcher::reload() -> awaitable<Result<ReloadSummary>> {
    auto gate = reload_gate_;
    co_await gate->acquire_until(SteadyClock::time_point::max());
    struct Release {
        std::shared_ptr<backend::SendGate> gate;
        ~Release() { gate->release(); }
    } release{gate};

    auto previous = store_.current();
    auto rebuilt = co_await store_.rebuild(connectors_);
    if (!rebuilt) {
        LOG_ERROR("Registry reload failed, keeping {} tools: {}",
                  previous->total_tools(), rebuilt.error().what());
        co_return make_fail(rebuilt.error());
    }

    ReloadSummary summary{
        .previous_tools = previous->total_tools(),
        .total_tools = rebuilt->total_tools(),
    };

    auto persisted = store_.persist(*rebuilt);
    if (!persisted) {
        LOG_ERROR("Registry rebuilt but not persisted: {}", persisted.error().what());
    }
    summary.persisted = persisted.has_value();
    store_.replace(std::move(*rebuilt));

    LOG_INFO("Registry reloaded: {} -> {} tools", summary.previous_tools, summary.total_tools);
    co_return summary;
}

auto Dispatcher::restart_backend(std::string_view id) -> awaitable<Result<ReloadSummary>> {
    auto target = connector(id);
    if (!target) {
        co_return make_fail(make_error(ErrorCode::NotFound,
            "Unknown backend", std::string(id)));
    }

    auto started = co_await target->restart();
    if (!started) {
        co_return make_fail(started.error());
    }
    co_return co_await reload();
}

} // namespace toolhub::dispatch
