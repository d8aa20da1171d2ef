/**
 * @file probe_orchestrator.cpp
 * @brief ProbeOrchestrator implementation.
 */

#include "orchestrator/probe_orchestrator.hpp"
#include "core/version.hpp"
#include "executor/task_group.hpp"
#include "probe/compute_probe.hpp"
#include "probe/storage_probe.hpp"
#include "telemetry/metrics_collector.hpp"

#include <chrono>

namespace openstack_exporter {

ProbeOrchestrator::ProbeOrchestrator(const Config& config,
                                     std::vector<std::unique_ptr<Probe>> probes,
                                     Logger& logger,
                                     const GarbageCollector* gc)
    : config_(config), probes_(std::move(probes)), logger_(logger), gc_(gc) {}

Duration ProbeOrchestrator::default_timeout() const noexcept {
    return std::chrono::duration_cast<Duration>(config_.probes.request_timeout);
}

ScrapeResult ProbeOrchestrator::handle_scrape(std::optional<Duration> timeout,
                                              std::stop_token stop) {
    const auto started = std::chrono::steady_clock::now();

    ScrapeResult result;
    result.timeout = timeout.value_or(default_timeout());

    MetricsCollector metrics;
    metrics.record_build_info(kVersion);

    {
        TaskGroup<ProbeRun> group(result.timeout, std::move(stop));
        for (auto& probe : probes_) {
            group.spawn(std::string{to_string(probe->kind())},
                        [&probe, &metrics](const Deadline& deadline) -> Result<ProbeRun> {
                            return probe->run(deadline, metrics);
                        });
        }

        auto outcomes = group.wait();
        for (size_t i = 0; i < outcomes.size(); ++i) {
            if (outcomes[i]) {
                result.runs.push_back(std::move(*outcomes[i]));
                continue;
            }
            // The unit escaped with an exception; its steps are already published.
            const auto& error = outcomes[i].error();
            logger_.log(LogLevel::Error, to_string(probes_[i]->kind()), error.message);
            ProbeRun run;
            run.kind = probes_[i]->kind();
            run.outcome = outcome_for(error.kind);
            run.error = error;
            result.runs.push_back(std::move(run));
        }
    }

    for (const auto& run : result.runs) {
        metrics.record_outcome(run.kind, run.outcome, run.elapsed);
    }
    if (gc_ != nullptr) {
        metrics.record_gc_totals(gc_->totals());
    }

    result.body = metrics.serialize();
    result.elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - started);
    logger_.log(LogLevel::Debug, "scrape",
                "scrape finished in " + std::to_string(result.elapsed.count()) + "ms ("
                + std::to_string(result.runs.size()) + " probes, timeout "
                + std::to_string(result.timeout.count()) + "ms)");
    return result;
}

std::vector<std::unique_ptr<Probe>> make_probes(const Config& config,
                                                SessionFactory& sessions,
                                                RemoteShell& shell,
                                                Logger& logger) {
    std::vector<std::unique_ptr<Probe>> probes;
    if (config.probes.enable_instance) {
        probes.push_back(std::make_unique<ComputeProbe>(config.probes, config.instance,
                                                        sessions, shell, logger));
    }
    if (config.probes.enable_object_store) {
        probes.push_back(std::make_unique<StorageProbe>(config.probes, sessions, logger));
    }
    return probes;
}

}  // namespace openstack_exporter
