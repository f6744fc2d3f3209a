#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "toolhub/cli/commands.hpp"
#include "toolhub/core/config.hpp"

namespace toolhub::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11, loads the configuration, then
/// runs the selected subcommand (serve, check, registry, version).
class App {
public:
    App();
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code.
    auto run(int argc, char** argv) -> int;

    [[nodiscard]] auto cli() -> CLI::App&;
    [[nodiscard]] auto config() -> Config&;
    [[nodiscard]] auto config() const -> const Config&;

private:
    void setup_commands();

    CLI::App cli_;
    CommandContext context_;
};

} // namespace toolhub::cli
