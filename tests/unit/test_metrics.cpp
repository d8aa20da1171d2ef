/**
 * @file test_metrics.cpp
 * @brief Unit tests for MetricsCollector and StepTimer.
 */

#include "telemetry/metrics_collector.hpp"
#include "telemetry/step_timer.hpp"

#include <gtest/gtest.h>

using namespace openstack_exporter;
using namespace std::chrono_literals;

namespace {

Timestamp at(int64_t unix_seconds) {
    return Timestamp{std::chrono::seconds{unix_seconds}};
}

}  // namespace

// ═══════════════════════════════════════════════
// MetricsCollector
// ═══════════════════════════════════════════════

TEST(MetricsCollectorTest, RecordStepSetsUnixSeconds) {
    MetricsCollector metrics;
    metrics.record_step(ProbeKind::Storage, "object_uploaded", at(1718000000) + 250ms);

    auto value = metrics.gauge_value(kStepTimestampMetric,
                                     {{"probe", "objectstore"}, {"step", "object_uploaded"}});
    ASSERT_TRUE(value.has_value());
    EXPECT_DOUBLE_EQ(*value, 1718000000.25);
}

TEST(MetricsCollectorTest, RecordStepOverwritesSameStep) {
    MetricsCollector metrics;
    metrics.record_step(ProbeKind::Compute, "start", at(100));
    metrics.record_step(ProbeKind::Compute, "start", at(200));

    auto value = metrics.gauge_value(kStepTimestampMetric,
                                     {{"probe", "instance"}, {"step", "start"}});
    ASSERT_TRUE(value.has_value());
    EXPECT_DOUBLE_EQ(*value, 200.0);
}

TEST(MetricsCollectorTest, OutcomeIsOneHot) {
    MetricsCollector metrics;
    metrics.record_outcome(ProbeKind::Compute, ProbeOutcome::RemoteShellError, 1500ms);

    EXPECT_EQ(metrics.gauge_value(kProbeSuccessMetric, {{"probe", "instance"}}), 0.0);
    EXPECT_EQ(metrics.gauge_value(kProbeDurationMetric, {{"probe", "instance"}}), 1.5);

    for (auto outcome : kAllProbeOutcomes) {
        auto value = metrics.gauge_value(
            kProbeOutcomeMetric,
            {{"probe", "instance"}, {"outcome", std::string{to_string(outcome)}}});
        ASSERT_TRUE(value.has_value()) << to_string(outcome);
        EXPECT_EQ(*value, outcome == ProbeOutcome::RemoteShellError ? 1.0 : 0.0);
    }
}

TEST(MetricsCollectorTest, SuccessOutcome) {
    MetricsCollector metrics;
    metrics.record_outcome(ProbeKind::Storage, ProbeOutcome::Success, 20ms);
    EXPECT_EQ(metrics.gauge_value(kProbeSuccessMetric, {{"probe", "objectstore"}}), 1.0);
}

TEST(MetricsCollectorTest, GaugeValueMissing) {
    MetricsCollector metrics;
    EXPECT_FALSE(metrics.gauge_value(kStepTimestampMetric, {{"probe", "instance"}}).has_value());
    EXPECT_FALSE(metrics.gauge_value("no_such_family", {}).has_value());
}

TEST(MetricsCollectorTest, SerializeUsesTextExposition) {
    MetricsCollector metrics;
    metrics.record_build_info("1.2.3");
    metrics.record_step(ProbeKind::Compute, "server_created", at(1718000000));

    GcTotals totals;
    totals.sweeps = 3;
    totals.deleted = 2;
    totals.last_sweep = at(1718000100);
    metrics.record_gc_totals(totals);

    auto body = metrics.serialize();
    EXPECT_NE(body.find("# TYPE openstack_client_step_timestamp_seconds gauge"), std::string::npos);
    EXPECT_NE(body.find(R"(openstack_client_step_timestamp_seconds{probe="instance",step="server_created"})"),
              std::string::npos);
    EXPECT_NE(body.find(R"(openstack_client_exporter_build_info{version="1.2.3"} 1)"),
              std::string::npos);
    EXPECT_NE(body.find("openstack_client_gc_sweeps_total 3"), std::string::npos);
    EXPECT_NE(body.find("openstack_client_gc_deleted_total 2"), std::string::npos);
    EXPECT_NE(body.find("openstack_client_gc_last_sweep_timestamp_seconds"), std::string::npos);
}

TEST(MetricsCollectorTest, CollectorsAreIndependent) {
    MetricsCollector first;
    MetricsCollector second;
    first.record_step(ProbeKind::Compute, "start", at(1));
    EXPECT_FALSE(second.gauge_value(kStepTimestampMetric,
                                    {{"probe", "instance"}, {"step", "start"}}).has_value());
}

// ═══════════════════════════════════════════════
// StepTimer
// ═══════════════════════════════════════════════

TEST(StepTimerTest, PublishesAndKeepsHistory) {
    MetricsCollector metrics;
    int64_t tick = 1000;
    StepTimer timer(ProbeKind::Storage, metrics, [&tick] { return at(tick++); });

    auto deadline = Deadline::after(5s);
    EXPECT_TRUE(timer.step(deadline, "start"));
    EXPECT_TRUE(timer.step(deadline, "authenticated"));

    ASSERT_EQ(timer.history().size(), 2u);
    EXPECT_EQ(timer.history()[0].first, "start");
    EXPECT_EQ(timer.history()[1].second, at(1001));
    EXPECT_EQ(metrics.gauge_value(kStepTimestampMetric,
                                  {{"probe", "objectstore"}, {"step", "authenticated"}}),
              1001.0);
}

TEST(StepTimerTest, PublishesThenReportsTimeoutAfterExpiry) {
    MetricsCollector metrics;
    StepTimer timer(ProbeKind::Compute, metrics, [] { return at(500); });

    auto expired = Deadline::after(0ms);
    auto result = timer.step(expired, "server_active");

    ASSERT_FALSE(result);
    EXPECT_TRUE(result.error().is(ErrorKind::Timeout));
    EXPECT_EQ(result.error().message, "timeout after server_active");
    EXPECT_EQ(metrics.gauge_value(kStepTimestampMetric,
                                  {{"probe", "instance"}, {"step", "server_active"}}),
              500.0);
}
