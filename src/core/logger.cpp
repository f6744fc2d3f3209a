#include "toolhub/core/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace toolhub {

namespace {
    std::shared_ptr<spdlog::logger> g_logger;
}

void Logger::init(std::string_view name, std::string_view level) {
    spdlog::drop(std::string(name));
    g_logger = spdlog::stderr_color_mt(std::string(name));
    g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
    if (!set_level(level)) {
        g_logger->warn("Unknown log level '{}', using info", level);
    }
}

auto Logger::get() -> std::shared_ptr<spdlog::logger>& {
    if (!g_logger) {
        init();
    }
    return g_logger;
}

auto Logger::set_level(std::string_view level) -> bool {
    auto parsed = spdlog::level::from_str(std::string(level));
    // from_str maps unknown names to off.
    if (parsed == spdlog::level::off && level != "off") {
        get()->set_level(spdlog::level::info);
        return false;
    }
    get()->set_level(parsed);
    return true;
}

auto Logger::level() -> std::string_view {
    auto name = spdlog::level::to_string_view(get()->level());
    return std::string_view(name.data(), name.size());
}

void Logger::flush() {
    if (g_logger) g_logger->flush();
}

} // namespace toolhub
