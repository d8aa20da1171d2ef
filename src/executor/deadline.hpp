/**
 * @file deadline.hpp
 * @brief Shared cancellable time bound for one scrape.
 *
 * A Deadline is the context every probe phase and provider call is bound to:
 * a steady-clock expiry instant plus a stop token. Expiry is cooperative;
 * callers check expired(), size their own timeouts from remaining(), and
 * wait with sleep_for(), which wakes as soon as stop is requested.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>

#include "core/types.hpp"

namespace openstack_exporter {

class Deadline {
public:
    /// Deadline at a fixed instant, optionally chained to a parent stop token.
    explicit Deadline(SteadyTime expires_at, std::stop_token stop = {});

    /// Deadline `timeout` from now.
    static Deadline after(Duration timeout, std::stop_token stop = {});

    /// Deadline that only ends when stop is requested.
    static Deadline unbounded(std::stop_token stop = {});

    [[nodiscard]] bool expired() const noexcept;
    [[nodiscard]] bool stop_requested() const noexcept;
    [[nodiscard]] Duration remaining() const noexcept;
    [[nodiscard]] SteadyTime expires_at() const noexcept { return expires_at_; }
    [[nodiscard]] std::stop_token token() const noexcept { return stop_; }

    /// A deadline no later than this one and no later than now + limit.
    [[nodiscard]] Deadline child(Duration limit) const;

    /**
     * @brief Sleep for `duration`, waking early on expiry or stop.
     * @return true if the full duration elapsed and the deadline is still live.
     */
    bool sleep_for(Duration duration) const;

private:
    SteadyTime expires_at_;
    std::stop_token stop_;
};

}  // namespace openstack_exporter
