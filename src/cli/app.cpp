#include "toolhub/cli/app.hpp"
#include "toolhub/core/logger.hpp"

#include <filesystem>

namespace toolhub::cli {

App::App()
    : cli_("toolhub", "Tool registry gateway")
{
    cli_.set_version_flag("--version", TOOLHUB_VERSION_STRING,
                          "Display version information");

    cli_.add_option("-c,--config", context_.config_path,
                    "Path to configuration file (JSON)")
        ->envname("TOOLHUB_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("--log-level", context_.log_level,
                    "Log level (trace, debug, info, warn, error, critical)");

    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    if (!context_.config_path.empty()) {
        context_.config = load_config(std::filesystem::path(context_.config_path));
    }
    apply_env_overrides(context_.config);
    if (!context_.log_level.empty()) {
        context_.config.log_level = context_.log_level;
    }

    Logger::init("toolhub", context_.config.log_level);
    if (!context_.config_path.empty()) {
        LOG_INFO("Loaded configuration from: {}", context_.config_path);
    }

    if (!context_.action) {
        return 0;
    }
    return context_.action(context_.config);
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() -> Config& {
    return context_.config;
}

auto App::config() const -> const Config& {
    return context_.config;
}

void App::setup_commands() {
    register_serve_command(cli_, context_);
    register_check_command(cli_, context_);
    register_registry_command(cli_, context_);
    register_version_command(cli_, context_);
}

} // namespace toolhub::cli
