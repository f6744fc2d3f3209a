#pragma once

#include <functional>
#include <string>

#include <CLI/CLI.hpp>

#include "toolhub/core/config.hpp"

#ifndef TOOLHUB_VERSION_STRING
#define TOOLHUB_VERSION_STRING "0.1.0-dev"
#endif

namespace toolhub::cli {

/// State shared between the global options and the selected subcommand.
/// Subcommand callbacks only record an action; it runs once the
/// configuration has been loaded.
struct CommandContext {
    Config config;
    std::string config_path;
    std::string log_level;
    std::function<int(Config&)> action;
};

/// `serve`: run the gateway until SIGINT/SIGTERM.
void register_serve_command(CLI::App& app, CommandContext& context);

/// `check`: start every backend once and print a health report.
void register_check_command(CLI::App& app, CommandContext& context);

/// `registry validate` and `registry show`.
void register_registry_command(CLI::App& app, CommandContext& context);

/// `version`: print the build version.
void register_version_command(CLI::App& app, CommandContext& context);

} // namespace toolhub::cli
