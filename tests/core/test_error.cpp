#include <catch2/catch_test_macros.hpp>

#include "toolhub/core/error.hpp"

TEST_CASE("Error creation and accessors", "[error]") {
    SECTION("basic error") {
        toolhub::Error err(toolhub::ErrorCode::ToolNotFound, "tool not found");
        CHECK(err.code() == toolhub::ErrorCode::ToolNotFound);
        CHECK(err.message() == "tool not found");
        CHECK(err.detail() == "");
        CHECK(err.what() == "tool not found");
    }

    SECTION("error with detail") {
        toolhub::Error err(toolhub::ErrorCode::Timeout,
                           "backend did not answer", "after 500ms");
        CHECK(err.code() == toolhub::ErrorCode::Timeout);
        CHECK(err.detail() == "after 500ms");
        CHECK(err.what() == "backend did not answer: after 500ms");
    }
}

TEST_CASE("Error kinds have stable wire names", "[error]") {
    using toolhub::ErrorCode;
    using toolhub::error_code_to_string;

    CHECK(error_code_to_string(ErrorCode::BackendUnavailable) == "BACKEND_UNAVAILABLE");
    CHECK(error_code_to_string(ErrorCode::ProtocolError) == "PROTOCOL_ERROR");
    CHECK(error_code_to_string(ErrorCode::Timeout) == "TIMEOUT");
    CHECK(error_code_to_string(ErrorCode::ToolNotFound) == "TOOL_NOT_FOUND");
    CHECK(error_code_to_string(ErrorCode::ToolError) == "TOOL_ERROR");
    CHECK(error_code_to_string(ErrorCode::RegistryCorrupt) == "REGISTRY_CORRUPT");
    CHECK(error_code_to_string(ErrorCode::RegistryCollision) == "REGISTRY_COLLISION");

    SECTION("names parse back to the same kind") {
        for (int i = static_cast<int>(ErrorCode::Unknown);
             i <= static_cast<int>(ErrorCode::InternalError); ++i) {
            auto code = static_cast<ErrorCode>(i);
            CHECK(toolhub::error_code_from_string(error_code_to_string(code)) == code);
        }
    }

    SECTION("unrecognized names map to Unknown") {
        CHECK(toolhub::error_code_from_string("NO_SUCH_KIND") == ErrorCode::Unknown);
    }
}

TEST_CASE("error_to_json emits kind, message and optional detail", "[error]") {
    auto plain = toolhub::error_to_json(
        toolhub::make_error(toolhub::ErrorCode::ToolNotFound, "Tool not found"));
    CHECK(plain["kind"] == "TOOL_NOT_FOUND");
    CHECK(plain["message"] == "Tool not found");
    CHECK_FALSE(plain.contains("detail"));

    auto detailed = toolhub::error_to_json(
        toolhub::make_error(toolhub::ErrorCode::ToolError, "disk full", "io_failure"));
    CHECK(detailed["kind"] == "TOOL_ERROR");
    CHECK(detailed["message"] == "disk full");
    CHECK(detailed["detail"] == "io_failure");
}

TEST_CASE("Result type success and error", "[error]") {
    toolhub::Result<int> ok = 42;
    REQUIRE(ok.has_value());
    CHECK(*ok == 42);

    toolhub::Result<int> failed = std::unexpected(
        toolhub::make_error(toolhub::ErrorCode::InvalidArgument, "bad value"));
    REQUIRE_FALSE(failed.has_value());
    CHECK(failed.error().code() == toolhub::ErrorCode::InvalidArgument);
}

TEST_CASE("make_fail converts to any Result", "[error]") {
    toolhub::Result<std::string> as_string =
        toolhub::make_fail(toolhub::make_error(toolhub::ErrorCode::IoError, "closed"));
    REQUIRE_FALSE(as_string.has_value());
    CHECK(as_string.error().code() == toolhub::ErrorCode::IoError);

    toolhub::VoidResult as_void =
        toolhub::make_fail(toolhub::make_error(toolhub::ErrorCode::Timeout, "slow"));
    REQUIRE_FALSE(as_void.has_value());

    CHECK(toolhub::ok_result().has_value());
}
