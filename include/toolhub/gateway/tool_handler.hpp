#pragma once

#include "toolhub/dispatch/dispatcher.hpp"
#include "toolhub/gateway/protocol.hpp"

namespace toolhub::gateway {

/// Registers tools.list, tools.get, tools.search, tools.categories,
/// tools.call, tools.batch_call, tools.stats and registry.reload.
void register_tool_handlers(Protocol& protocol, dispatch::Dispatcher& dispatcher);

/// Wire form of a batch outcome.
auto batch_summary_to_json(const dispatch::BatchSummary& summary) -> json;

} // namespace toolhub::gateway
