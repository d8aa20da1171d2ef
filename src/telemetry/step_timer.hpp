/**
 * @file step_timer.hpp
 * @brief Per-run checkpoint that publishes step completion instants.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/deadline.hpp"
#include "telemetry/metrics_collector.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace openstack_exporter {

/**
 * @brief Records the wall-clock instant each step of one probe run completed.
 *
 * step() publishes unconditionally, then reports a Timeout error if the
 * shared deadline has already fired. It never blocks and never retries.
 * The history is owned by the run; the collector sees each step immediately.
 */
class StepTimer {
public:
    using Clock = std::function<Timestamp()>;

    StepTimer(ProbeKind probe, MetricsCollector& metrics,
              Clock clock = [] { return std::chrono::system_clock::now(); });

    Result<void> step(const Deadline& deadline, std::string_view name);

    [[nodiscard]] const std::vector<std::pair<std::string, Timestamp>>& history() const noexcept {
        return history_;
    }

    [[nodiscard]] ProbeKind probe() const noexcept { return probe_; }

private:
    ProbeKind probe_;
    MetricsCollector& metrics_;
    Clock clock_;
    std::vector<std::pair<std::string, Timestamp>> history_;
};

}  // namespace openstack_exporter
