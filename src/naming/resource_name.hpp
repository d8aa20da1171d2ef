/**
 * @file resource_name.hpp
 * @brief Tagged, timestamped names for every resource the exporter creates.
 *
 * Format: `{tag}-{suffix}-{unix seconds}`, for example
 * `openstack-client-exporter-a8Kp2xQz-1718000000`.
 *
 * Not every OpenStack resource exposes a reliable creation time across
 * releases, so the creation instant is carried in the name and is the only
 * input the garbage collector uses to compute age.
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>

#include "core/types.hpp"

namespace openstack_exporter {

/// Marks every resource this exporter ever creates.
inline constexpr std::string_view kResourceTag = "openstack-client-exporter";

/// Length of the random segment.
inline constexpr size_t kNameSuffixLength = 8;

/**
 * @brief A parsed resource name.
 */
struct ResourceName {
    std::string tag;
    std::string suffix;
    Timestamp created;

    [[nodiscard]] std::string str() const;
};

/**
 * @brief Thread-safe generator of unique resource names.
 */
class NameGenerator {
public:
    NameGenerator();
    explicit NameGenerator(uint64_t seed);

    /// Generate a fresh name stamped with `now` (truncated to whole seconds).
    [[nodiscard]] std::string create(Timestamp now = std::chrono::system_clock::now());

private:
    std::mutex mutex_;
    std::mt19937_64 rng_;
};

/// Generate a name with the process-wide generator.
[[nodiscard]] std::string create_name();

/// Parse a name; nullopt if it lacks the tag or a well-formed timestamp.
[[nodiscard]] std::optional<ResourceName> parse_name(std::string_view name);

/// True if `name` was produced by this exporter.
[[nodiscard]] bool has_resource_tag(std::string_view name) noexcept;

/// Age of a tagged resource relative to `now`; nullopt if unparseable.
[[nodiscard]] std::optional<std::chrono::seconds> resource_age(std::string_view name,
                                                               Timestamp now);

}  // namespace openstack_exporter
