/**
 * @file main.cpp
 * @brief openstack_client_exporter entry point.
 *
 * Wires the exporter together:
 *   Config → Logger → SessionFactory → GarbageCollector → ProbeOrchestrator → HttpServer
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "core/version.hpp"
#include "gc/garbage_collector.hpp"
#include "orchestrator/probe_orchestrator.hpp"
#include "provider/openstack/http_transport.hpp"
#include "provider/openstack/openstack_session.hpp"
#include "provider/ssh_shell.hpp"
#include "server/exporter_routes.hpp"
#include "server/http_server.hpp"
#include "telemetry/json_sink.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>

extern char** environ;

using namespace openstack_exporter;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> timeout;
    std::optional<std::string> flavor;
    std::optional<std::string> image;
    std::optional<std::string> internal_network;
    std::optional<std::string> external_network;
    std::optional<std::string> user;
    std::optional<std::string> listen;
    std::optional<std::string> log_level;
    bool disable_objectstore = false;
    bool disable_instance = false;
};

void print_usage() {
    std::cout << "Usage: " << kProgramName << " [OPTIONS]\n"
              << "  --config <path>              TOML configuration file\n"
              << "  --timeout <duration>         Maximum timeout for a request (default 59s)\n"
              << "  --flavor <name>              Name of the instance flavor (default t2.small)\n"
              << "  --image <name>               Name of the image (default ubuntu-16.04-x86_64)\n"
              << "  --internal-network <name>    Name of the internal network (default private)\n"
              << "  --external-network <name>    Name of the external network (default internet)\n"
              << "  --user <name>                Username used for sshing into the instance\n"
              << "  --listen <host:port>         Address to serve metrics on (default 127.0.0.1:9539)\n"
              << "  --log-level <level>          debug, info, warn or error\n"
              << "  --disable-objectstore        Disable the object store probe\n"
              << "  --disable-instance           Disable the instance probe\n"
              << "  --help, -h                   Show this help message\n"
              << "\nProvider credentials are read from OS_AUTH_URL, OS_USERNAME, OS_PASSWORD,\n"
              << "OS_PROJECT_NAME, OS_USER_DOMAIN_NAME, OS_PROJECT_DOMAIN_NAME, OS_REGION_NAME\n"
              << "and OS_INTERFACE.\n";
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::optional<std::string> inline_value;
        if (auto eq = arg.find('='); arg.starts_with("--") && eq != std::string::npos) {
            inline_value = arg.substr(eq + 1);
            arg.resize(eq);
        }

        auto value = [&]() -> Result<std::string> {
            if (inline_value) return *inline_value;
            if (i + 1 >= argc) {
                return Error{ErrorKind::Configuration, arg + " requires a value"};
            }
            return std::string{argv[++i]};
        };
        auto assign = [&](std::optional<std::string>& target) -> Result<void> {
            auto v = value();
            if (!v) return v.error();
            target = *v;
            return Result<void>{};
        };

        Result<void> ok;
        if (arg == "--config") {
            auto v = value();
            if (!v) return v.error();
            args.config_path = *v;
        } else if (arg == "--timeout") {
            ok = assign(args.timeout);
        } else if (arg == "--flavor") {
            ok = assign(args.flavor);
        } else if (arg == "--image") {
            ok = assign(args.image);
        } else if (arg == "--internal-network") {
            ok = assign(args.internal_network);
        } else if (arg == "--external-network") {
            ok = assign(args.external_network);
        } else if (arg == "--user") {
            ok = assign(args.user);
        } else if (arg == "--listen") {
            ok = assign(args.listen);
        } else if (arg == "--log-level") {
            ok = assign(args.log_level);
        } else if (arg == "--disable-objectstore") {
            args.disable_objectstore = true;
        } else if (arg == "--disable-instance") {
            args.disable_instance = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            return Error{ErrorKind::Configuration, "unknown option " + arg};
        }
        if (!ok) return ok.error();
    }
    return args;
}

Result<Config> build_config(const CLIArgs& args) {
    Config config = default_config();
    if (args.config_path) {
        auto loaded = load_config(*args.config_path);
        if (!loaded) return loaded.error();
        config = *loaded;
    }

    if (args.timeout) {
        auto timeout = parse_duration(*args.timeout);
        if (!timeout) {
            return Error{ErrorKind::Configuration, "invalid --timeout '" + *args.timeout + "'"};
        }
        config.probes.request_timeout =
            std::chrono::ceil<std::chrono::seconds>(*timeout);
    }
    if (args.flavor) config.instance.flavor = *args.flavor;
    if (args.image) config.instance.image = *args.image;
    if (args.internal_network) config.instance.internal_network = *args.internal_network;
    if (args.external_network) config.instance.external_network = *args.external_network;
    if (args.user) config.instance.user = *args.user;
    if (args.log_level) config.telemetry.log_level = *args.log_level;
    if (args.disable_objectstore) config.probes.enable_object_store = false;
    if (args.disable_instance) config.probes.enable_instance = false;
    if (args.listen) {
        auto address = split_host_port(*args.listen);
        if (!address) return address.error();
        config.server.listen_address = address->first;
        config.server.port = address->second;
    }

    if (auto valid = validate_config(config); !valid) return valid.error();
    return config;
}

/// Names (never values) of the OS_* variables in the environment.
std::string provider_variables() {
    std::string names;
    for (char** env = environ; env != nullptr && *env != nullptr; ++env) {
        std::string_view entry{*env};
        if (!entry.starts_with("OS_")) continue;
        if (!names.empty()) names += ",";
        names += std::string{entry.substr(0, entry.find('='))};
    }
    return names.empty() ? "none" : names;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        std::cerr << args.error().message << "\n\n";
        print_usage();
        return 2;
    }

    auto config_result = build_config(*args);
    if (!config_result) {
        std::cerr << "Invalid configuration: " << config_result.error().message << std::endl;
        return 1;
    }
    const Config config = std::move(*config_result);

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir,
                                                  std::string{kProgramName},
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    Logger logger(std::move(log_sink), parse_log_level(config.telemetry.log_level));
    logger.info(std::string{kProgramName} + " " + std::string{kVersion} + " starting");
    logger.info("Provider environment: " + provider_variables());
    logger.info("Probes: instance=" + std::string{config.probes.enable_instance ? "on" : "off"}
                + " objectstore=" + std::string{config.probes.enable_object_store ? "on" : "off"}
                + ", timeout " + std::to_string(config.probes.request_timeout.count()) + "s");

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Provider ─────────────────────────────
    auto transport = std::make_shared<CurlTransport>();
    OpenStackSessionFactory sessions(transport);
    SshRemoteShell shell(SshOptions{
        .identity_file = config.instance.ssh_identity_file,
        .connect_timeout_s = config.instance.ssh_connect_timeout_s,
    });

    // ── Garbage Collector ────────────────────
    GarbageCollector gc(GarbageCollector::options_from(config), sessions, logger);
    gc.start();

    // ── Orchestrator + Scrape Endpoint ───────
    ProbeOrchestrator orchestrator(config, make_probes(config, sessions, shell, logger),
                                   logger, &gc);
    ExporterRoutes routes(config.server, orchestrator, logger);

    HttpServer server(logger, config.executor.thread_count);
    auto listen_result = server.listen(config.server.listen_address, config.server.port);
    if (!listen_result) {
        logger.error("Could not start HTTP server: " + listen_result.error().message);
        gc.stop();
        return 1;
    }
    server.serve(routes.handler());
    logger.info("Serving " + config.server.metrics_path + " on "
                + config.server.listen_address + ":" + std::to_string(server.port()));

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Cleaning up...");
    server.stop();
    gc.stop();
    logger.info(std::string{kProgramName} + " stopped");
    logger.flush();
    return 0;
}
