/**
 * @file garbage_collector.cpp
 * @brief GarbageCollector implementation.
 */

#include "gc/garbage_collector.hpp"
#include "naming/resource_name.hpp"

#include <exception>
#include <memory>

namespace openstack_exporter {

namespace {

constexpr std::string_view kComponent = "gc";

std::string describe(const ResourceHandle& resource) {
    return std::string{to_string(resource.kind)} + " " + resource.name + " (" + resource.id + ")";
}

}  // anonymous namespace

GarbageCollector::Options GarbageCollector::options_from(const Config& config) {
    return Options{
        .interval = std::chrono::duration_cast<Duration>(config.gc.interval),
        .retention = config.gc.retention,
        .sweep_timeout = std::chrono::duration_cast<Duration>(config.probes.request_timeout),
    };
}

GarbageCollector::GarbageCollector(Options options,
                                   SessionFactory& sessions,
                                   Logger& logger,
                                   Clock clock)
    : options_(options), sessions_(sessions), logger_(logger), clock_(std::move(clock)) {}

GarbageCollector::~GarbageCollector() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

void GarbageCollector::start() {
    if (worker_.joinable()) return;
    logger_.log(LogLevel::Info, kComponent,
                "starting: interval " + std::to_string(options_.interval.count())
                + "ms, retention " + std::to_string(options_.retention.count()) + "s");
    worker_ = std::jthread([this](std::stop_token stop) { run(stop); });
}

void GarbageCollector::stop() {
    if (!worker_.joinable()) return;
    worker_.request_stop();
    worker_.join();
    worker_ = std::jthread{};
    logger_.log(LogLevel::Info, kComponent, "stopped");
}

bool GarbageCollector::running() const noexcept {
    return worker_.joinable();
}

void GarbageCollector::run(std::stop_token stop, uint64_t max_cycles) {
    const auto idle = Deadline::unbounded(stop);
    for (uint64_t cycle = 0; max_cycles == 0 || cycle < max_cycles; ++cycle) {
        if (!idle.sleep_for(options_.interval)) break;
        sweep_once(stop);
    }
}

// ─────────────────────────────────────────────
// Sweep
// ─────────────────────────────────────────────

SweepReport GarbageCollector::sweep_once(std::stop_token stop) {
    return sweep_once(clock_(), std::move(stop));
}

SweepReport GarbageCollector::sweep_once(Timestamp now, std::stop_token stop) {
    SweepReport report;
    const auto deadline = Deadline::after(options_.sweep_timeout, std::move(stop));

    auto session = [&]() -> Result<std::shared_ptr<CloudSession>> {
        try {
            return sessions_.open(deadline);
        } catch (const std::exception& ex) {
            return Error{ErrorKind::Internal, std::string{"session factory threw: "} + ex.what()};
        }
    }();
    if (!session) {
        logger_.log(LogLevel::Warn, kComponent,
                    "sweep skipped, no session: " + session.error().message);
        ++report.list_failures;
        record(report, now);
        return report;
    }

    for (auto kind : kAllResourceKinds) {
        if (deadline.expired()) {
            logger_.log(LogLevel::Warn, kComponent, "sweep deadline reached, remaining kinds skipped");
            break;
        }
        try {
            sweep_kind(**session, kind, now, deadline, report);
        } catch (const std::exception& ex) {
            // A malformed provider reply must not end the collector thread.
            logger_.log(LogLevel::Error, kComponent,
                        "sweep of " + std::string{to_string(kind)} + " aborted: " + ex.what());
            ++report.list_failures;
        }
    }

    record(report, now);
    if (report.candidates > 0 || report.list_failures > 0) {
        logger_.log(LogLevel::Info, kComponent,
                    "sweep done: " + std::to_string(report.listed) + " tagged, "
                    + std::to_string(report.deleted) + " deleted, "
                    + std::to_string(report.delete_failures) + " failed");
    }
    return report;
}

void GarbageCollector::sweep_kind(CloudSession& session,
                                  ResourceKind kind,
                                  Timestamp now,
                                  const Deadline& deadline,
                                  SweepReport& report) {
    auto listed = session.list_resources(kind, kResourceTag, deadline);
    if (!listed) {
        logger_.log(LogLevel::Warn, kComponent,
                    "cannot list " + std::string{to_string(kind)} + ": "
                    + listed.error().message);
        ++report.list_failures;
        return;
    }

    for (const auto& resource : *listed) {
        if (!has_resource_tag(resource.name)) continue;
        ++report.listed;

        auto age = resource_age(resource.name, now);
        if (!age) {
            logger_.log(LogLevel::Debug, kComponent,
                        "ignoring " + describe(resource) + ": no creation time in name");
            continue;
        }
        if (*age <= options_.retention) continue;

        ++report.candidates;
        auto deleted = session.delete_resource(resource, deadline);
        if (deleted) {
            ++report.deleted;
            logger_.log(LogLevel::Info, kComponent,
                        "deleted " + describe(resource) + ", age "
                        + std::to_string(age->count()) + "s");
        } else {
            ++report.delete_failures;
            logger_.log(LogLevel::Warn, kComponent,
                        "failed to delete " + describe(resource) + ": "
                        + deleted.error().message);
        }
    }
}

void GarbageCollector::record(const SweepReport& report, Timestamp now) {
    {
        std::lock_guard lock(mutex_);
        ++totals_.sweeps;
        totals_.deleted += report.deleted;
        totals_.delete_failures += report.delete_failures;
        totals_.list_failures += report.list_failures;
        totals_.last_sweep = now;
    }
    sweep_cv_.notify_all();
}

GcTotals GarbageCollector::totals() const {
    std::lock_guard lock(mutex_);
    return totals_;
}

bool GarbageCollector::wait_for_sweeps(uint64_t count, Duration timeout) const {
    std::unique_lock lock(mutex_);
    return sweep_cv_.wait_for(lock, timeout, [&] { return totals_.sweeps >= count; });
}

}  // namespace openstack_exporter
