/**
 * @file step_timer.cpp
 * @brief StepTimer implementation.
 */

#include "telemetry/step_timer.hpp"

namespace openstack_exporter {

StepTimer::StepTimer(ProbeKind probe, MetricsCollector& metrics, Clock clock)
    : probe_(probe), metrics_(metrics), clock_(std::move(clock)) {}

Result<void> StepTimer::step(const Deadline& deadline, std::string_view name) {
    auto now = clock_();
    metrics_.record_step(probe_, name, now);
    history_.emplace_back(std::string{name}, now);

    if (deadline.expired()) {
        return Error{ErrorKind::Timeout, "timeout after " + std::string{name}};
    }
    return Result<void>{};
}

}  // namespace openstack_exporter
