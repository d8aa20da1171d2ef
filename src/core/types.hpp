/**
 * @file types.hpp
 * @brief Fundamental types used throughout the OpenStack exporter.
 *
 * Defines clock aliases, the probe and resource vocabularies and the
 * provider-side resource handle. All types are plain values.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "core/result.hpp"

namespace openstack_exporter {

// ─────────────────────────────────────────────
// Clock Types
// ─────────────────────────────────────────────

using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

/// Seconds since the Unix epoch as a double, the unit of every exported timestamp.
[[nodiscard]] inline double to_unix_seconds(Timestamp t) noexcept {
    return std::chrono::duration<double>(t.time_since_epoch()).count();
}

// ─────────────────────────────────────────────
// Resource Kinds
// ─────────────────────────────────────────────

enum class ResourceKind : uint8_t {
    Server,       ///< Compute instance
    FloatingIp,   ///< Public address bound to an instance port
    Container     ///< Object-store container (with its objects)
};

[[nodiscard]] constexpr std::string_view to_string(ResourceKind kind) noexcept {
    switch (kind) {
        case ResourceKind::Server:     return "server";
        case ResourceKind::FloatingIp: return "floating_ip";
        case ResourceKind::Container:  return "container";
    }
    return "unknown";
}

/// Every kind the exporter creates, in the order the collector sweeps them.
/// Floating IPs go before servers so their port bindings are released first.
inline constexpr ResourceKind kAllResourceKinds[] = {
    ResourceKind::FloatingIp,
    ResourceKind::Server,
    ResourceKind::Container,
};

/**
 * @brief A provider-side object identified by kind, provider id and name.
 *
 * For containers the provider id is the container name. Floating IPs have
 * no name attribute; their ResourceName is stored in the description.
 */
struct ResourceHandle {
    ResourceKind kind{ResourceKind::Server};
    std::string id;
    std::string name;

    bool operator==(const ResourceHandle&) const = default;
};

// ─────────────────────────────────────────────
// Probe Kinds & Outcomes
// ─────────────────────────────────────────────

enum class ProbeKind : uint8_t {
    Compute,
    Storage
};

[[nodiscard]] constexpr std::string_view to_string(ProbeKind kind) noexcept {
    switch (kind) {
        case ProbeKind::Compute: return "instance";
        case ProbeKind::Storage: return "objectstore";
    }
    return "unknown";
}

enum class ProbeOutcome : uint8_t {
    Success,
    Timeout,
    ProviderError,
    RemoteShellError,
    VerificationFailed,
    ConfigurationError,
    InternalError
};

[[nodiscard]] constexpr std::string_view to_string(ProbeOutcome outcome) noexcept {
    switch (outcome) {
        case ProbeOutcome::Success:            return "success";
        case ProbeOutcome::Timeout:            return "timeout";
        case ProbeOutcome::ProviderError:      return "provider_error";
        case ProbeOutcome::RemoteShellError:   return "remote_shell_error";
        case ProbeOutcome::VerificationFailed: return "verification_failed";
        case ProbeOutcome::ConfigurationError: return "configuration_error";
        case ProbeOutcome::InternalError:      return "internal_error";
    }
    return "unknown";
}

inline constexpr ProbeOutcome kAllProbeOutcomes[] = {
    ProbeOutcome::Success,
    ProbeOutcome::Timeout,
    ProbeOutcome::ProviderError,
    ProbeOutcome::RemoteShellError,
    ProbeOutcome::VerificationFailed,
    ProbeOutcome::ConfigurationError,
    ProbeOutcome::InternalError,
};

/// Map an error to the terminal outcome it produces for a probe run.
[[nodiscard]] constexpr ProbeOutcome outcome_for(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Timeout:       return ProbeOutcome::Timeout;
        case ErrorKind::Provider:      return ProbeOutcome::ProviderError;
        case ErrorKind::NotFound:      return ProbeOutcome::ProviderError;
        case ErrorKind::RemoteShell:   return ProbeOutcome::RemoteShellError;
        case ErrorKind::Verification:  return ProbeOutcome::VerificationFailed;
        case ErrorKind::Configuration: return ProbeOutcome::ConfigurationError;
        case ErrorKind::Internal:      return ProbeOutcome::InternalError;
    }
    return ProbeOutcome::InternalError;
}

// ─────────────────────────────────────────────
// Garbage Collector Totals
// ─────────────────────────────────────────────

/**
 * @brief Lifetime statistics of the garbage collector, published on every scrape.
 */
struct GcTotals {
    uint64_t sweeps{0};
    uint64_t deleted{0};
    uint64_t delete_failures{0};
    uint64_t list_failures{0};
    std::optional<Timestamp> last_sweep;
};

}  // namespace openstack_exporter
