/**
 * @file probe.hpp
 * @brief Lifecycle contract shared by the compute and storage probes.
 *
 * A probe run opens its own provider session, creates tagged resources,
 * waits for them, exercises them and deletes them. Every phase boundary is a
 * StepTimer checkpoint; the first failure ends the run and leaves whatever
 * was created for the garbage collector.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/deadline.hpp"
#include "provider/cloud.hpp"
#include "telemetry/metrics_collector.hpp"
#include "telemetry/step_timer.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace openstack_exporter {

/**
 * @brief One execution of one probe variant.
 */
struct ProbeRun {
    ProbeKind kind{ProbeKind::Compute};
    Timestamp start;
    std::vector<std::pair<std::string, Timestamp>> steps;
    ProbeOutcome outcome{ProbeOutcome::Success};
    std::optional<Error> error;
    Duration elapsed{0};

    [[nodiscard]] bool succeeded() const noexcept { return outcome == ProbeOutcome::Success; }
};

/**
 * @brief Abstract probe. Subclasses implement the resource phases in exercise().
 *
 * Probes hold no per-run state, so one instance may serve concurrent scrapes.
 */
class Probe {
public:
    Probe(ProbeKind kind, SessionFactory& sessions, Logger& logger);
    virtual ~Probe() = default;

    Probe(const Probe&) = delete;
    Probe& operator=(const Probe&) = delete;

    /// Run every phase under `deadline`, publishing steps into `metrics`.
    ProbeRun run(const Deadline& deadline, MetricsCollector& metrics);

    [[nodiscard]] ProbeKind kind() const noexcept { return kind_; }

protected:
    /// Phases after authentication. Returns the first failure.
    virtual Result<void> exercise(const Deadline& deadline,
                                  CloudSession& session,
                                  StepTimer& timer) = 0;

    Logger& logger() noexcept { return logger_; }

private:
    ProbeKind kind_;
    SessionFactory& sessions_;
    Logger& logger_;
};

/// Exponential backoff between readiness polls, capped at `max`.
[[nodiscard]] Duration next_poll_interval(Duration current, Duration max) noexcept;

}  // namespace openstack_exporter
