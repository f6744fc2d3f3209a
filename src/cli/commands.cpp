#include "toolhub/cli/commands.hpp"
#include "toolhub/core/logger.hpp"

#include <algorithm>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <set>
#include <thread>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <nlohmann/json.hpp>

#include "toolhub/backend/connector.hpp"
#include "toolhub/dispatch/dispatcher.hpp"
#include "toolhub/dispatch/instrumentation.hpp"
#include "toolhub/gateway/health_handler.hpp"
#include "toolhub/gateway/server.hpp"
#include "toolhub/gateway/tool_handler.hpp"
#include "toolhub/health/monitor.hpp"
#include "toolhub/registry/store.hpp"

namespace toolhub::cli {

using json = nlohmann::json;
namespace net = boost::asio;

namespace {

auto known_backend_ids(const Config& config) -> std::set<std::string> {
    std::set<std::string> ids;
    for (const auto& b : config.backends) {
        if (b.enabled) ids.insert(b.id);
    }
    return ids;
}

/// Everything a running gateway needs besides the inbound server.
struct Runtime {
    explicit Runtime(const Config& config)
        : store(registry_path(config), known_backend_ids(config))
        , instrumentation(config.instrumentation) {}

    registry::RegistryStore store;
    dispatch::Instrumentation instrumentation;
    std::vector<backend::ConnectorPtr> connectors;
    std::unique_ptr<dispatch::Dispatcher> dispatcher;
};

auto build_runtime(net::io_context& ioc, const Config& config)
    -> Result<std::unique_ptr<Runtime>> {
    auto runtime = std::make_unique<Runtime>(config);

    for (const auto& bc : config.backends) {
        if (!bc.enabled) {
            LOG_INFO("Backend {} is disabled", bc.id);
            continue;
        }
        auto connector = backend::make_connector(ioc, bc, config.health);
        if (!connector) {
            return std::unexpected(connector.error());
        }
        runtime->connectors.push_back(std::move(*connector));
    }

    // Serve the last persisted catalog until the backends report in.
    auto loaded = runtime->store.load();
    if (loaded.error) {
        LOG_ERROR("Starting with an empty registry: {}", loaded.error->what());
    }
    runtime->store.replace(std::move(loaded.registry));

    runtime->dispatcher = std::make_unique<dispatch::Dispatcher>(
        ioc, runtime->store, runtime->connectors, runtime->instrumentation);
    return runtime;
}

/// Starts every connector concurrently. Returns how many came up.
auto start_backends(net::io_context& ioc,
                    const std::vector<backend::ConnectorPtr>& connectors)
    -> awaitable<std::size_t> {
    using Done = net::experimental::concurrent_channel<
        void(boost::system::error_code, bool)>;
    auto done = std::make_shared<Done>(ioc, connectors.size());

    for (const auto& connector : connectors) {
        net::co_spawn(ioc, connector->start(),
            [done, id = connector->id()](std::exception_ptr ep, VoidResult result) {
                bool ok = false;
                if (ep) {
                    try {
                        std::rethrow_exception(ep);
                    } catch (const std::exception& e) {
                        LOG_ERROR("Backend {} start threw: {}", id, e.what());
                    }
                } else {
                    ok = result.has_value();
                }
                done->try_send(boost::system::error_code{}, ok);
            });
    }

    std::size_t up = 0;
    for (std::size_t i = 0; i < connectors.size(); ++i) {
        if (co_await done->async_receive(net::use_awaitable)) {
            ++up;
        }
    }
    LOG_INFO("{} of {} backends started", up, connectors.size());
    co_return up;
}

auto stop_backends(const std::vector<backend::ConnectorPtr>& connectors)
    -> awaitable<void> {
    for (const auto& connector : connectors) {
        co_await connector->stop();
    }
}

auto print_error(const Error& error) -> void {
    std::cerr << error_code_to_string(error.code()) << ": " << error.message();
    if (!error.detail().empty()) {
        std::cerr << " (" << error.detail() << ")";
    }
    std::cerr << "\n";
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// serve command
// ---------------------------------------------------------------------------

void register_serve_command(CLI::App& app, CommandContext& context) {
    auto* sub = app.add_subcommand("serve", "Run the tool registry gateway");

    struct Options {
        uint16_t port = 0;
        std::string bind;
    };
    auto opts = std::make_shared<Options>();

    sub->add_option("-p,--port", opts->port, "Listen port (overrides config)");
    sub->add_option("-b,--bind", opts->bind, "Bind mode: loopback or all")
        ->check(CLI::IsMember({"loopback", "all"}));

    sub->callback([&context, opts]() {
        context.action = [opts](Config& config) -> int {
            if (opts->port != 0) {
                config.gateway.port = opts->port;
            }
            if (!opts->bind.empty()) {
                config.gateway.bind = (opts->bind == "all") ? BindMode::All : BindMode::Loopback;
            }

            if (auto valid = validate_config(config); !valid) {
                LOG_ERROR("Invalid configuration: {}", valid.error().what());
                return 1;
            }

            std::signal(SIGPIPE, SIG_IGN);

            net::io_context ioc;
            auto runtime = build_runtime(ioc, config);
            if (!runtime) {
                LOG_ERROR("Failed to set up backends: {}", runtime.error().what());
                return 1;
            }
            auto& rt = **runtime;

            auto protocol = std::make_shared<gateway::Protocol>();
            health::HealthMonitor monitor(ioc, *rt.dispatcher, config.health);
            gateway::register_tool_handlers(*protocol, *rt.dispatcher);
            gateway::register_health_handlers(*protocol, *rt.dispatcher, monitor,
                gateway::GatewayInfo{.version = TOOLHUB_VERSION_STRING});
            LOG_INFO("{} RPC methods registered", protocol->methods().size());

            gateway::GatewayServer server(ioc, protocol);
            int exit_code = 0;

            auto shutdown = [&]() -> awaitable<void> {
                monitor.stop();
                co_await server.stop();
                co_await stop_backends(rt.connectors);
                ioc.stop();
            };

            net::signal_set signals(ioc, SIGINT, SIGTERM);
            signals.async_wait([&](auto ec, int sig) {
                if (ec) return;
                LOG_INFO("Received signal {}, shutting down", sig);
                net::co_spawn(ioc, shutdown(), net::detached);
            });

            net::co_spawn(ioc, server.start(config.gateway),
                [&](std::exception_ptr ep, VoidResult result) {
                    if (ep || !result) {
                        if (!result) {
                            LOG_ERROR("Gateway failed: {}", result.error().what());
                        }
                        exit_code = 1;
                        signals.cancel();
                        net::co_spawn(ioc, shutdown(), net::detached);
                    }
                });

            net::co_spawn(ioc,
                [&]() -> awaitable<void> {
                    auto up = co_await start_backends(ioc, rt.connectors);
                    if (up > 0) {
                        auto reloaded = co_await rt.dispatcher->reload();
                        if (!reloaded) {
                            LOG_ERROR("Initial registry build failed: {}",
                                      reloaded.error().what());
                        }
                    } else if (!rt.connectors.empty()) {
                        LOG_WARN("No backend started; serving the persisted registry");
                    }
                    monitor.start();
                },
                net::detached);

            auto workers = std::max<std::size_t>(1, config.gateway.worker_threads);
            std::vector<std::thread> threads;
            threads.reserve(workers - 1);
            for (std::size_t i = 1; i < workers; ++i) {
                threads.emplace_back([&ioc]() { ioc.run(); });
            }
            LOG_INFO("Gateway running on {} threads. Press Ctrl+C to stop.", workers);
            ioc.run();
            for (auto& t : threads) {
                t.join();
            }

            LOG_INFO("Gateway stopped.");
            Logger::flush();
            return exit_code;
        };
    });
}

// ---------------------------------------------------------------------------
// check command
// ---------------------------------------------------------------------------

void register_check_command(CLI::App& app, CommandContext& context) {
    auto* sub = app.add_subcommand("check",
        "Start every backend once, print a health report and exit");

    sub->callback([&context]() {
        context.action = [](Config& config) -> int {
            if (auto valid = validate_config(config); !valid) {
                print_error(valid.error());
                return 1;
            }

            std::signal(SIGPIPE, SIG_IGN);

            net::io_context ioc;
            auto runtime = build_runtime(ioc, config);
            if (!runtime) {
                print_error(runtime.error());
                return 1;
            }
            auto& rt = **runtime;
            health::HealthMonitor monitor(ioc, *rt.dispatcher, config.health);

            std::optional<health::HealthReport> report;
            net::co_spawn(ioc,
                [&]() -> awaitable<void> {
                    auto up = co_await start_backends(ioc, rt.connectors);
                    if (up > 0) {
                        auto reloaded = co_await rt.dispatcher->reload();
                        if (!reloaded) {
                            LOG_ERROR("Registry build failed: {}", reloaded.error().what());
                        }
                    }
                    report = co_await monitor.full_health_check();
                    co_await stop_backends(rt.connectors);
                    ioc.stop();
                },
                net::detached);
            ioc.run();

            if (!report) {
                std::cerr << "Health check did not complete\n";
                return 1;
            }
            std::cout << json(*report).dump(2) << "\n";
            return report->healthy() ? 0 : 1;
        };
    });
}

// ---------------------------------------------------------------------------
// registry command
// ---------------------------------------------------------------------------

void register_registry_command(CLI::App& app, CommandContext& context) {
    auto* sub = app.add_subcommand("registry", "Inspect the persisted tool registry");
    sub->require_subcommand(1);

    auto path = std::make_shared<std::string>();
    auto* validate = sub->add_subcommand("validate",
        "Validate a registry file against the configured backends");
    validate->add_option("-p,--path", *path, "Registry file (default: configured path)");

    validate->callback([&context, path]() {
        context.action = [path](Config& config) -> int {
            auto file = path->empty() ? registry_path(config) : std::filesystem::path(*path);
            auto registry = registry::RegistryStore::read_file(file, known_backend_ids(config));
            if (!registry) {
                std::cerr << file.string() << " is invalid\n";
                print_error(registry.error());
                return 1;
            }
            std::cout << file.string() << " is valid: " << registry->total_tools()
                      << " tools from " << registry->backends().size() << " backends\n";
            return 0;
        };
    });

    auto* show = sub->add_subcommand("show", "Print the loaded registry");
    show->callback([&context]() {
        context.action = [](Config& config) -> int {
            auto loaded = registry::RegistryStore::load(registry_path(config),
                                                        known_backend_ids(config));
            if (loaded.error) {
                print_error(*loaded.error);
                return 1;
            }
            if (loaded.recovered_from_backup) {
                std::cerr << "Loaded from backup\n";
            }
            std::cout << loaded.registry.to_json().dump(2) << "\n";
            return 0;
        };
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app, CommandContext& context) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([&context]() {
        context.action = []([[maybe_unused]] Config& config) -> int {
            std::cout << "toolhub " << TOOLHUB_VERSION_STRING << "\n";
            std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
            std::cout << "Compiler: clang " << __clang_major__ << "."
                      << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
            std::cout << "Compiler: gcc " << __GNUC__ << "."
                      << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#endif
            return 0;
        };
    });
}

} // namespace toolhub::cli
