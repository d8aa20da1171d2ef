/**
 * @file probe_orchestrator.hpp
 * @brief Runs the enabled probes concurrently for one scrape.
 *
 * handle_scrape() derives one Deadline from the requested timeout, spawns
 * every probe onto its own thread in a TaskGroup bound to it, and returns only after every
 * probe has returned. The response is therefore a complete snapshot of the
 * scrape window, partial and timed-out runs included.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "gc/garbage_collector.hpp"
#include "probe/probe.hpp"
#include "provider/cloud.hpp"

#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace openstack_exporter {

/**
 * @brief Everything produced by one scrape.
 */
struct ScrapeResult {
    std::vector<ProbeRun> runs;   ///< One per enabled probe, in probe order
    std::string body;             ///< Prometheus text exposition
    Duration timeout{0};          ///< Effective shared deadline
    Duration elapsed{0};
};

class ProbeOrchestrator {
public:
    /**
     * @param config   Immutable configuration; must outlive the orchestrator.
     * @param probes   Enabled probes, run concurrently on every scrape.
     * @param gc       Collector whose totals are published; may be null.
     */
    ProbeOrchestrator(const Config& config,
                      std::vector<std::unique_ptr<Probe>> probes,
                      Logger& logger,
                      const GarbageCollector* gc = nullptr);

    /**
     * @brief Run one full probe round.
     * @param timeout  Per-request override; nullopt = configured default.
     * @param stop     Parent cancellation (process shutdown).
     */
    ScrapeResult handle_scrape(std::optional<Duration> timeout = std::nullopt,
                               std::stop_token stop = {});

    [[nodiscard]] Duration default_timeout() const noexcept;
    [[nodiscard]] size_t probe_count() const noexcept { return probes_.size(); }

private:
    const Config& config_;
    std::vector<std::unique_ptr<Probe>> probes_;
    Logger& logger_;
    const GarbageCollector* gc_;
};

/// The probes `config` enables, in the order instance, objectstore.
std::vector<std::unique_ptr<Probe>> make_probes(const Config& config,
                                                SessionFactory& sessions,
                                                RemoteShell& shell,
                                                Logger& logger);

}  // namespace openstack_exporter
