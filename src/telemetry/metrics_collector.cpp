/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <chrono>

#include <prometheus/counter.h>
#include <prometheus/text_serializer.h>

namespace openstack_exporter {

MetricsCollector::MetricsCollector()
    : registry_(std::make_shared<prometheus::Registry>())
    , step_timestamps_(prometheus::BuildGauge()
          .Name(std::string{kStepTimestampMetric})
          .Help("Unix time at which each probe step completed")
          .Register(*registry_))
    , probe_success_(prometheus::BuildGauge()
          .Name(std::string{kProbeSuccessMetric})
          .Help("1 if the probe completed every step before the deadline")
          .Register(*registry_))
    , probe_duration_(prometheus::BuildGauge()
          .Name(std::string{kProbeDurationMetric})
          .Help("Wall time spent in the probe run")
          .Register(*registry_))
    , probe_outcome_(prometheus::BuildGauge()
          .Name(std::string{kProbeOutcomeMetric})
          .Help("Terminal outcome of the probe run (1 for the observed outcome)")
          .Register(*registry_)) {}

void MetricsCollector::record_step(ProbeKind probe, std::string_view step, Timestamp at) {
    step_timestamps_
        .Add({{"probe", std::string{to_string(probe)}}, {"step", std::string{step}}})
        .Set(to_unix_seconds(at));
}

void MetricsCollector::record_outcome(ProbeKind probe, ProbeOutcome outcome, Duration elapsed) {
    const std::string probe_name{to_string(probe)};

    probe_success_.Add({{"probe", probe_name}})
        .Set(outcome == ProbeOutcome::Success ? 1.0 : 0.0);
    probe_duration_.Add({{"probe", probe_name}})
        .Set(std::chrono::duration<double>(elapsed).count());

    for (auto candidate : kAllProbeOutcomes) {
        probe_outcome_
            .Add({{"probe", probe_name}, {"outcome", std::string{to_string(candidate)}}})
            .Set(candidate == outcome ? 1.0 : 0.0);
    }
}

void MetricsCollector::record_build_info(std::string_view version) {
    prometheus::BuildGauge()
        .Name(std::string{kBuildInfoMetric})
        .Help("Exporter build information")
        .Register(*registry_)
        .Add({{"version", std::string{version}}})
        .Set(1.0);
}

void MetricsCollector::record_gc_totals(const GcTotals& totals) {
    prometheus::BuildCounter()
        .Name("openstack_client_gc_sweeps_total")
        .Help("Garbage collector sweeps since start")
        .Register(*registry_)
        .Add({})
        .Increment(static_cast<double>(totals.sweeps));
    prometheus::BuildCounter()
        .Name("openstack_client_gc_deleted_total")
        .Help("Stale tagged resources deleted by the garbage collector")
        .Register(*registry_)
        .Add({})
        .Increment(static_cast<double>(totals.deleted));
    prometheus::BuildCounter()
        .Name("openstack_client_gc_delete_failures_total")
        .Help("Deletions attempted by the garbage collector that failed")
        .Register(*registry_)
        .Add({})
        .Increment(static_cast<double>(totals.delete_failures));
    prometheus::BuildCounter()
        .Name("openstack_client_gc_list_failures_total")
        .Help("Inventory listings by the garbage collector that failed")
        .Register(*registry_)
        .Add({})
        .Increment(static_cast<double>(totals.list_failures));

    if (totals.last_sweep) {
        prometheus::BuildGauge()
            .Name("openstack_client_gc_last_sweep_timestamp_seconds")
            .Help("Unix time at which the last garbage collector sweep finished")
            .Register(*registry_)
            .Add({})
            .Set(to_unix_seconds(*totals.last_sweep));
    }
}

std::vector<prometheus::MetricFamily> MetricsCollector::collect() const {
    return registry_->Collect();
}

std::string MetricsCollector::serialize() const {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

std::optional<double> MetricsCollector::gauge_value(
    std::string_view family,
    const std::map<std::string, std::string>& labels) const {
    for (const auto& fam : registry_->Collect()) {
        if (fam.name != family) continue;
        for (const auto& metric : fam.metric) {
            if (metric.label.size() != labels.size()) continue;
            bool match = true;
            for (const auto& label : metric.label) {
                auto it = labels.find(label.name);
                if (it == labels.end() || it->second != label.value) {
                    match = false;
                    break;
                }
            }
            if (match) return metric.gauge.value;
        }
    }
    return std::nullopt;
}

}  // namespace openstack_exporter
