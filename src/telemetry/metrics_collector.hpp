/**
 * @file metrics_collector.hpp
 * @brief Per-scrape metrics surface backed by a prometheus-cpp Registry.
 *
 * One MetricsCollector is created for every scrape, mirroring a fresh
 * registry per request. Concurrent probes publish into it directly; the
 * prometheus-cpp families and gauges are internally synchronized, so
 * publication needs no additional locking.
 */

#pragma once

#include "core/types.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/metric_family.h>
#include <prometheus/registry.h>

namespace openstack_exporter {

inline constexpr std::string_view kStepTimestampMetric =
    "openstack_client_step_timestamp_seconds";
inline constexpr std::string_view kProbeSuccessMetric = "openstack_client_probe_success";
inline constexpr std::string_view kProbeDurationMetric =
    "openstack_client_probe_duration_seconds";
inline constexpr std::string_view kProbeOutcomeMetric = "openstack_client_probe_outcome";
inline constexpr std::string_view kBuildInfoMetric = "openstack_client_exporter_build_info";

class MetricsCollector {
public:
    MetricsCollector();

    /// Publish "step `step` of `probe` completed at `at`".
    void record_step(ProbeKind probe, std::string_view step, Timestamp at);

    /// Publish the terminal outcome and elapsed time of a probe run.
    void record_outcome(ProbeKind probe, ProbeOutcome outcome, Duration elapsed);

    void record_build_info(std::string_view version);
    void record_gc_totals(const GcTotals& totals);

    /// Snapshot of every family, in the order prometheus-cpp collects them.
    [[nodiscard]] std::vector<prometheus::MetricFamily> collect() const;

    /// Prometheus text exposition format (version 0.0.4).
    [[nodiscard]] std::string serialize() const;

    /// Value of the gauge in `family` whose labels equal `labels`, if any.
    [[nodiscard]] std::optional<double> gauge_value(
        std::string_view family,
        const std::map<std::string, std::string>& labels) const;

    [[nodiscard]] const std::shared_ptr<prometheus::Registry>& registry() const noexcept {
        return registry_;
    }

private:
    std::shared_ptr<prometheus::Registry> registry_;
    prometheus::Family<prometheus::Gauge>& step_timestamps_;
    prometheus::Family<prometheus::Gauge>& probe_success_;
    prometheus::Family<prometheus::Gauge>& probe_duration_;
    prometheus::Family<prometheus::Gauge>& probe_outcome_;
};

}  // namespace openstack_exporter
