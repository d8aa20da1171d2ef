/**
 * @file probe.cpp
 * @brief Probe::run, the phase driver shared by every variant.
 */

#include "probe/probe.hpp"

#include <algorithm>
#include <chrono>

namespace openstack_exporter {

Probe::Probe(ProbeKind kind, SessionFactory& sessions, Logger& logger)
    : kind_(kind), sessions_(sessions), logger_(logger) {}

ProbeRun Probe::run(const Deadline& deadline, MetricsCollector& metrics) {
    const std::string name{to_string(kind_)};
    const auto started = std::chrono::steady_clock::now();

    ProbeRun run;
    run.kind = kind_;
    run.start = std::chrono::system_clock::now();

    StepTimer timer(kind_, metrics);

    auto result = [&]() -> Result<void> {
        if (auto s = timer.step(deadline, "start"); !s) return s;

        auto session = sessions_.open(deadline);
        if (!session) return session.error();
        if (auto s = timer.step(deadline, "authenticated"); !s) return s;

        return exercise(deadline, **session, timer);
    }();

    run.steps = timer.history();
    run.elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - started);

    if (result) {
        run.outcome = ProbeOutcome::Success;
        logger_.log(LogLevel::Info, name,
                    name + " finished in " + std::to_string(run.elapsed.count()) + "ms");
    } else {
        run.outcome = outcome_for(result.error().kind);
        run.error = result.error();
        logger_.log(LogLevel::Warn, name,
                    name + " failed after " + std::to_string(run.elapsed.count()) + "ms ("
                    + std::string{to_string(run.outcome)} + "): " + result.error().message);
    }
    return run;
}

Duration next_poll_interval(Duration current, Duration max) noexcept {
    return std::min(current * 2, max);
}

}  // namespace openstack_exporter
