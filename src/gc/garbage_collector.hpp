/**
 * @file garbage_collector.hpp
 * @brief Background sweeper for tagged resources that outlived the retention.
 *
 * The collector keeps no inventory of its own. Each sweep opens a fresh
 * session, lists every kind the exporter creates, and deletes tagged
 * resources whose name-embedded age exceeds the retention. Deletions are
 * independent; a failure is logged and counted and the sweep moves on.
 *
 * The retention must exceed the longest probe run, so a resource that is
 * still in use by a probe is never old enough to be a candidate.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/deadline.hpp"
#include "provider/cloud.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>

namespace openstack_exporter {

/**
 * @brief What one sweep saw and did.
 */
struct SweepReport {
    size_t listed = 0;           ///< Tagged resources returned by the provider
    size_t candidates = 0;       ///< Older than the retention
    size_t deleted = 0;
    size_t delete_failures = 0;
    size_t list_failures = 0;    ///< Session or per-kind listing failures
};

class GarbageCollector {
public:
    using Clock = std::function<Timestamp()>;

    struct Options {
        Duration interval{std::chrono::seconds{60}};
        std::chrono::seconds retention{600};
        Duration sweep_timeout{std::chrono::seconds{59}};  ///< Bound of one sweep
    };

    /// Interval and retention from [gc]; one sweep is bounded by the request timeout.
    static Options options_from(const Config& config);

    GarbageCollector(Options options,
                     SessionFactory& sessions,
                     Logger& logger,
                     Clock clock = [] { return std::chrono::system_clock::now(); });
    ~GarbageCollector();

    GarbageCollector(const GarbageCollector&) = delete;
    GarbageCollector& operator=(const GarbageCollector&) = delete;

    /// Launch the sweep loop on its own thread. No-op if already running.
    void start();

    /// Stop the loop and join it. An in-flight sweep is cancelled.
    void stop();

    [[nodiscard]] bool running() const noexcept;

    /**
     * @brief Sleep-then-sweep loop on the calling thread.
     * @param stop        Ends the loop (and cancels the current sweep).
     * @param max_cycles  0 = run until stopped.
     */
    void run(std::stop_token stop, uint64_t max_cycles = 0);

    /// One sweep with ages computed against `now`.
    SweepReport sweep_once(Timestamp now, std::stop_token stop = {});

    /// One sweep at the injected clock's current time.
    SweepReport sweep_once(std::stop_token stop = {});

    [[nodiscard]] GcTotals totals() const;

    /// Block until `count` sweeps have completed in total, or `timeout` elapsed.
    bool wait_for_sweeps(uint64_t count, Duration timeout) const;

    [[nodiscard]] const Options& options() const noexcept { return options_; }

private:
    void sweep_kind(CloudSession& session, ResourceKind kind, Timestamp now,
                    const Deadline& deadline, SweepReport& report);
    void record(const SweepReport& report, Timestamp now);

    Options options_;
    SessionFactory& sessions_;
    Logger& logger_;
    Clock clock_;

    mutable std::mutex mutex_;
    mutable std::condition_variable sweep_cv_;
    GcTotals totals_;
    std::jthread worker_;
};

}  // namespace openstack_exporter
