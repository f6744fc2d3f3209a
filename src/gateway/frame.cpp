#include "toolhub/gateway/frame.hpp"

namespace toolhub::gateway {

namespace {

auto id_text(const json& id) -> std::optional<std::string> {
    if (id.is_string()) return id.get<std::string>();
    if (id.is_number_integer() || id.is_number_unsigned()) return id.dump();
    return std::nullopt;
}

auto protocol_error(std::string message, std::string detail = "") -> Error {
    return make_error(ErrorCode::ProtocolError, std::move(message), std::move(detail));
}

} // anonymous namespace

void from_json(const json& j, RequestFrame& f) {
    const auto& id = j.at("id");
    if (auto text = id_text(id)) {
        f.id = std::move(*text);
    } else {
        // Throws type_error for anything else.
        f.id = id.get<std::string>();
    }
    j.at("method").get_to(f.method);
    if (j.contains("params") && !j.at("params").is_null()) {
        f.params = j.at("params");
    } else {
        f.params = json::object();
    }
}

void to_json(json& j, const ResponseFrame& f) {
    j = json{
        {"type", "res"},
        {"id", f.id},
        {"ok", f.ok},
    };
    if (f.payload) j["payload"] = *f.payload;
    if (f.error) j["error"] = *f.error;
}

auto parse_request(std::string_view data) -> Result<RequestFrame> {
    json j;
    try {
        j = json::parse(data);
    } catch (const json::parse_error& e) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
            "Failed to parse frame JSON", e.what()));
    }

    if (!j.is_object()) {
        return std::unexpected(protocol_error("Frame must be a JSON object"));
    }
    if (j.contains("type")) {
        if (!j["type"].is_string() || j["type"].get<std::string>() != "req") {
            return std::unexpected(protocol_error("Only request frames are accepted",
                j["type"].dump()));
        }
    }
    if (!j.contains("id")) {
        return std::unexpected(protocol_error("Request has no id"));
    }
    if (!j.contains("method") || !j["method"].is_string() ||
        j["method"].get_ref<const std::string&>().empty()) {
        return std::unexpected(protocol_error("Request has no method"));
    }

    try {
        return j.get<RequestFrame>();
    } catch (const json::exception& e) {
        return std::unexpected(protocol_error("Malformed request fields", e.what()));
    }
}

auto peek_request_id(std::string_view data) -> std::string {
    auto j = json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("id")) {
        return {};
    }
    return id_text(j["id"]).value_or("");
}

auto serialize_response(const ResponseFrame& frame) -> std::string {
    return json(frame).dump();
}

auto make_response(const std::string& id, json payload) -> ResponseFrame {
    return ResponseFrame{
        .id = id,
        .ok = true,
        .payload = std::move(payload),
        .error = std::nullopt,
    };
}

auto make_error_response(const std::string& id, const Error& error) -> ResponseFrame {
    return ResponseFrame{
        .id = id,
        .ok = false,
        .payload = std::nullopt,
        .error = error_to_json(error),
    };
}

} // namespace toolhub::gateway
