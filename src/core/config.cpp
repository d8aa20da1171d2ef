/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <cstdlib>

#include <toml++/toml.hpp>

namespace openstack_exporter {

namespace {

std::string env_or(const char* name, std::string fallback) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') return fallback;
    return value;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::Configuration,
                     "Configuration file not found: " + path.string()};
    }

    Config config;

    try {
        auto tbl = toml::parse_file(path.string());

        // [server]
        if (auto server = tbl["server"]; server.is_table()) {
            config.server.listen_address =
                server["listen_address"].value_or(config.server.listen_address);
            config.server.port = static_cast<uint16_t>(
                server["port"].value_or(int64_t{config.server.port}));
            config.server.metrics_path =
                server["metrics_path"].value_or(config.server.metrics_path);
        }

        // [probes]
        if (auto probes = tbl["probes"]; probes.is_table()) {
            config.probes.request_timeout = std::chrono::seconds{
                probes["request_timeout_s"].value_or(
                    int64_t{config.probes.request_timeout.count()})};
            config.probes.enable_instance =
                probes["enable_instance"].value_or(config.probes.enable_instance);
            config.probes.enable_object_store =
                probes["enable_object_store"].value_or(config.probes.enable_object_store);
            config.probes.poll_interval_ms = static_cast<uint32_t>(
                probes["poll_interval_ms"].value_or(int64_t{config.probes.poll_interval_ms}));
            config.probes.max_poll_interval_ms = static_cast<uint32_t>(
                probes["max_poll_interval_ms"].value_or(
                    int64_t{config.probes.max_poll_interval_ms}));
            config.probes.payload_bytes = static_cast<uint64_t>(
                probes["payload_bytes"].value_or(
                    static_cast<int64_t>(config.probes.payload_bytes)));
        }

        // [instance]
        if (auto instance = tbl["instance"]; instance.is_table()) {
            auto& ic = config.instance;
            ic.flavor = instance["flavor"].value_or(ic.flavor);
            ic.image = instance["image"].value_or(ic.image);
            ic.internal_network = instance["internal_network"].value_or(ic.internal_network);
            ic.external_network = instance["external_network"].value_or(ic.external_network);
            ic.user = instance["user"].value_or(ic.user);
            ic.keypair = instance["keypair"].value_or(ic.keypair);
            ic.ssh_identity_file = instance["ssh_identity_file"].value_or(ic.ssh_identity_file);
            ic.ssh_command = instance["ssh_command"].value_or(ic.ssh_command);
            ic.ssh_connect_timeout_s = static_cast<uint32_t>(
                instance["ssh_connect_timeout_s"].value_or(int64_t{ic.ssh_connect_timeout_s}));
            ic.ssh_attempts = static_cast<uint32_t>(
                instance["ssh_attempts"].value_or(int64_t{ic.ssh_attempts}));
        }

        // [gc]
        if (auto gc = tbl["gc"]; gc.is_table()) {
            config.gc.interval = std::chrono::seconds{
                gc["interval_s"].value_or(int64_t{config.gc.interval.count()})};
            config.gc.retention = std::chrono::seconds{
                gc["retention_s"].value_or(int64_t{config.gc.retention.count()})};
        }

        // [executor]
        if (auto executor = tbl["executor"]; executor.is_table()) {
            const auto threads = executor["thread_count"].value_or(int64_t{0});
            if (threads < 0 || threads > kMaxThreadCount) {
                return Error{ErrorKind::Configuration,
                             "executor.thread_count must be within 0.."
                             + std::to_string(kMaxThreadCount)};
            }
            config.executor.thread_count = static_cast<uint32_t>(threads);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Configuration,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }

    if (auto valid = validate_config(config); !valid) {
        return valid.error();
    }
    return config;
}

Config default_config() {
    return Config{};
}

Result<void> validate_config(const Config& config) {
    if (config.probes.request_timeout.count() <= 0) {
        return Error{ErrorKind::Configuration, "probes.request_timeout_s must be positive"};
    }
    if (config.gc.interval.count() <= 0) {
        return Error{ErrorKind::Configuration, "gc.interval_s must be positive"};
    }
    if (config.gc.retention <= config.probes.request_timeout) {
        return Error{ErrorKind::Configuration,
                     "gc.retention_s (" + std::to_string(config.gc.retention.count())
                     + ") must exceed probes.request_timeout_s ("
                     + std::to_string(config.probes.request_timeout.count()) + ")"};
    }
    if (config.probes.poll_interval_ms == 0
        || config.probes.max_poll_interval_ms < config.probes.poll_interval_ms) {
        return Error{ErrorKind::Configuration,
                     "probes.max_poll_interval_ms must be >= poll_interval_ms > 0"};
    }
    if (config.instance.ssh_attempts == 0) {
        return Error{ErrorKind::Configuration, "instance.ssh_attempts must be positive"};
    }
    if (config.probes.payload_bytes == 0) {
        return Error{ErrorKind::Configuration, "probes.payload_bytes must be positive"};
    }
    return Result<void>{};
}

Result<Credentials> credentials_from_env() {
    Credentials creds;
    creds.auth_url = env_or("OS_AUTH_URL", "");
    creds.username = env_or("OS_USERNAME", "");
    creds.password = env_or("OS_PASSWORD", "");
    creds.user_domain_name = env_or("OS_USER_DOMAIN_NAME", creds.user_domain_name);
    creds.project_name = env_or("OS_PROJECT_NAME", "");
    creds.project_domain_name = env_or("OS_PROJECT_DOMAIN_NAME", creds.project_domain_name);
    creds.region_name = env_or("OS_REGION_NAME", "");
    creds.interface = env_or("OS_INTERFACE", creds.interface);

    if (creds.auth_url.empty()) {
        return Error{ErrorKind::Configuration, "OS_AUTH_URL is not set"};
    }
    if (creds.username.empty()) {
        return Error{ErrorKind::Configuration, "OS_USERNAME is not set"};
    }
    if (creds.password.empty()) {
        return Error{ErrorKind::Configuration, "OS_PASSWORD is not set"};
    }
    return creds;
}

}  // namespace openstack_exporter
