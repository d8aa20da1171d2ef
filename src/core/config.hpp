/**
 * @file config.hpp
 * @brief Exporter configuration with TOML deserialization.
 *
 * The Config value is built once at startup (defaults, then an optional TOML
 * file, then command-line overrides) and handed by const reference to the
 * orchestrator, the probes and the garbage collector.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "core/result.hpp"
#include "core/types.hpp"

namespace openstack_exporter {

struct ServerConfig {
    std::string listen_address = "127.0.0.1";
    uint16_t port = 9539;
    std::string metrics_path = "/metrics";
};

struct ProbesConfig {
    std::chrono::seconds request_timeout{59};
    bool enable_instance = true;
    bool enable_object_store = true;
    uint32_t poll_interval_ms = 1000;
    uint32_t max_poll_interval_ms = 5000;
    uint64_t payload_bytes = 1024;
};

struct InstanceConfig {
    std::string flavor = "t2.small";
    std::string image = "ubuntu-16.04-x86_64";
    std::string internal_network = "private";
    std::string external_network = "internet";
    std::string user = "ubuntu";
    std::string keypair;             ///< Empty = boot without a keypair
    std::string ssh_identity_file;   ///< Empty = ssh client default
    std::string ssh_command = "true";
    uint32_t ssh_connect_timeout_s = 10;
    uint32_t ssh_attempts = 5;       ///< sshd may still be starting once ACTIVE
};

struct GcConfig {
    std::chrono::seconds interval{60};
    std::chrono::seconds retention{600};
};

/// Upper bound accepted for executor.thread_count.
inline constexpr int64_t kMaxThreadCount = 1024;

struct ExecutorConfig {
    uint32_t thread_count = 0;       ///< Concurrent scrape connections; 0 = max(2, hardware_concurrency)
};

struct TelemetryConfig {
    std::filesystem::path log_dir;   ///< Empty = stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level exporter configuration.
 */
struct Config {
    ServerConfig server;
    ProbesConfig probes;
    InstanceConfig instance;
    GcConfig gc;
    ExecutorConfig executor;
    TelemetryConfig telemetry;
};

/**
 * @brief Provider credentials, read from OS_* environment variables.
 */
struct Credentials {
    std::string auth_url;
    std::string username;
    std::string password;
    std::string user_domain_name = "Default";
    std::string project_name;
    std::string project_domain_name = "Default";
    std::string region_name;
    std::string interface = "public";
};

/**
 * @brief Load configuration from a TOML file and validate it.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Check cross-field constraints.
 *
 * The retention threshold must exceed the request timeout, otherwise the
 * collector could delete resources of a probe that is still running.
 */
Result<void> validate_config(const Config& config);

/**
 * @brief Read credentials from the process environment.
 *
 * Returns a Configuration error naming the first missing mandatory variable.
 */
Result<Credentials> credentials_from_env();

}  // namespace openstack_exporter
