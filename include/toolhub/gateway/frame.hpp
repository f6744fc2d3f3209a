#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "toolhub/core/error.hpp"
#include "toolhub/core/types.hpp"

namespace toolhub::gateway {

/// One call from a gateway client. Numeric ids are kept as their text so
/// the response can echo them back.
struct RequestFrame {
    std::string id;
    std::string method;
    json params;
};

void from_json(const json& j, RequestFrame& f);

/// The answer to one request, correlated by id.
struct ResponseFrame {
    std::string id;
    bool ok = true;
    std::optional<json> payload;
    std::optional<json> error;

    [[nodiscard]] auto is_error() const noexcept -> bool {
        return error.has_value();
    }
};

void to_json(json& j, const ResponseFrame& f);

/// Parses one inbound text message. Bad JSON is SerializationError; a
/// message that is not a request is ProtocolError.
auto parse_request(std::string_view data) -> Result<RequestFrame>;

/// Best-effort id of a message that failed to parse, so the error
/// response still correlates. Empty when there is none.
auto peek_request_id(std::string_view data) -> std::string;

auto serialize_response(const ResponseFrame& frame) -> std::string;

auto make_response(const std::string& id, json payload) -> ResponseFrame;
auto make_error_response(const std::string& id, const Error& error) -> ResponseFrame;

} // namespace toolhub::gateway
