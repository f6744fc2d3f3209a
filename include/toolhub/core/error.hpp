#pragma once

#include <expected>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace toolhub {

enum class ErrorCode {
    Unknown = 1,
    InvalidConfig,
    InvalidArgument,
    NotFound,
    BackendUnavailable,
    ProtocolError,
    Timeout,
    ToolNotFound,
    ToolError,
    RegistryCorrupt,
    RegistryCollision,
    IoError,
    SerializationError,
    InternalError,
};

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    [[nodiscard]] auto what() const -> std::string {
        if (detail_.empty()) return message_;
        return message_ + ": " + detail_;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = std::expected<void, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

/// Wire name of an error kind, e.g. "TOOL_NOT_FOUND".
inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::BackendUnavailable: return "BACKEND_UNAVAILABLE";
        case ErrorCode::ProtocolError: return "PROTOCOL_ERROR";
        case ErrorCode::Timeout: return "TIMEOUT";
        case ErrorCode::ToolNotFound: return "TOOL_NOT_FOUND";
        case ErrorCode::ToolError: return "TOOL_ERROR";
        case ErrorCode::RegistryCorrupt: return "REGISTRY_CORRUPT";
        case ErrorCode::RegistryCollision: return "REGISTRY_COLLISION";
        case ErrorCode::IoError: return "IO_ERROR";
        case ErrorCode::SerializationError: return "SERIALIZATION_ERROR";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

/// Inverse of error_code_to_string. Unrecognized names map to Unknown.
inline auto error_code_from_string(std::string_view name) -> ErrorCode {
    for (int i = static_cast<int>(ErrorCode::Unknown);
         i <= static_cast<int>(ErrorCode::InternalError); ++i) {
        auto code = static_cast<ErrorCode>(i);
        if (error_code_to_string(code) == name) return code;
    }
    return ErrorCode::Unknown;
}

/// Wire form of an error: `{kind, message, detail?}`.
inline auto error_to_json(const Error& error) -> nlohmann::json {
    nlohmann::json j = {
        {"kind", std::string(error_code_to_string(error.code()))},
        {"message", std::string(error.message())},
    };
    if (!error.detail().empty()) {
        j["detail"] = std::string(error.detail());
    }
    return j;
}

// GCC 14 ICE workaround for co_return std::unexpected(...) in coroutines.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=112341
struct Fail {
    Error error;

    explicit Fail(Error e) : error(std::move(e)) {}

    template <typename T>
    operator Result<T>() && { return std::unexpected(std::move(error)); }
};

/// Use co_return make_fail(err) instead of co_return std::unexpected(err).
inline auto make_fail(Error e) -> Fail { return Fail(std::move(e)); }

/// Use co_return ok_result() instead of co_return Result<void>{}.
inline auto ok_result() -> Result<void> { return {}; }

} // namespace toolhub
