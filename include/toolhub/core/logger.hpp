#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace toolhub {

/// Process-wide logger. It writes to stderr because `check` and
/// `registry show` print their results on stdout.
class Logger {
public:
    static void init(std::string_view name = "toolhub", std::string_view level = "info");
    static auto get() -> std::shared_ptr<spdlog::logger>&;

    /// Accepts spdlog's level names ("trace" through "critical", "off").
    /// Anything else falls back to info and returns false.
    static auto set_level(std::string_view level) -> bool;
    [[nodiscard]] static auto level() -> std::string_view;

    static void flush();
};

} // namespace toolhub

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::toolhub::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::toolhub::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::toolhub::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::toolhub::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::toolhub::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::toolhub::Logger::get(), __VA_ARGS__)
