/**
 * @file deadline.cpp
 * @brief Deadline implementation.
 */

#include "executor/deadline.hpp"

#include <algorithm>

namespace openstack_exporter {

namespace {

/// now + d, saturating at SteadyTime::max() instead of overflowing.
SteadyTime saturating_add(SteadyTime now, Duration d) noexcept {
    if (d <= Duration::zero()) return now;
    const auto headroom = std::chrono::duration_cast<Duration>(SteadyTime::max() - now);
    if (d >= headroom) return SteadyTime::max();
    return now + d;
}

}  // anonymous namespace

Deadline::Deadline(SteadyTime expires_at, std::stop_token stop)
    : expires_at_(expires_at), stop_(std::move(stop)) {}

Deadline Deadline::after(Duration timeout, std::stop_token stop) {
    return Deadline(saturating_add(std::chrono::steady_clock::now(), timeout), std::move(stop));
}

Deadline Deadline::unbounded(std::stop_token stop) {
    return Deadline(SteadyTime::max(), std::move(stop));
}

bool Deadline::expired() const noexcept {
    return stop_requested() || std::chrono::steady_clock::now() >= expires_at_;
}

bool Deadline::stop_requested() const noexcept {
    return stop_.stop_requested();
}

Duration Deadline::remaining() const noexcept {
    if (stop_requested()) return Duration{0};
    if (expires_at_ == SteadyTime::max()) return Duration::max();
    auto left = std::chrono::duration_cast<Duration>(
        expires_at_ - std::chrono::steady_clock::now());
    return std::max(left, Duration{0});
}

Deadline Deadline::child(Duration limit) const {
    const auto bound = saturating_add(std::chrono::steady_clock::now(), limit);
    if (expires_at_ <= bound) {
        return *this;
    }
    return Deadline(bound, stop_);
}

bool Deadline::sleep_for(Duration duration) const {
    if (expired()) return false;

    auto wake_at = std::min(expires_at_, saturating_add(std::chrono::steady_clock::now(), duration));

    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    // Predicate is only satisfied by a stop request; the timeout is the normal path.
    cv.wait_until(lock, stop_, wake_at, [] { return false; });

    return !expired();
}

}  // namespace openstack_exporter
