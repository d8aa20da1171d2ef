/**
 * @file test_probes.cpp
 * @brief Unit tests for the compute and storage probes against MockCloud.
 */

#include "probe/compute_probe.hpp"
#include "probe/storage_probe.hpp"
#include "naming/resource_name.hpp"
#include "provider/mock_cloud.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <chrono>

using namespace openstack_exporter;
using namespace std::chrono_literals;

namespace {

std::vector<std::string> step_names(const ProbeRun& run) {
    std::vector<std::string> names;
    for (const auto& [name, at] : run.steps) names.push_back(name);
    return names;
}

}  // namespace

class ProbeTest : public ::testing::Test {
protected:
    void SetUp() override {
        probes_.poll_interval_ms = 5;
        probes_.max_poll_interval_ms = 20;
        probes_.payload_bytes = 512;
        instance_.ssh_attempts = 3;
    }

    ProbeRun run_compute(Duration timeout = 5s) {
        ComputeProbe probe(probes_, instance_, cloud_, shell_, logger_);
        return probe.run(Deadline::after(timeout), metrics_);
    }

    ProbeRun run_storage(Duration timeout = 5s) {
        StorageProbe probe(probes_, cloud_, logger_);
        return probe.run(Deadline::after(timeout), metrics_);
    }

    ProbesConfig probes_;
    InstanceConfig instance_;
    MockCloud cloud_;
    MockRemoteShell shell_;
    Logger logger_{std::make_unique<NullSink>()};
    MetricsCollector metrics_;
};

// ═══════════════════════════════════════════════
// Compute
// ═══════════════════════════════════════════════

TEST_F(ProbeTest, ComputeSuccessCleansUp) {
    MockFaults faults;
    faults.polls_until_active = 3;
    cloud_.set_faults(faults);

    auto run = run_compute();

    ASSERT_TRUE(run.succeeded()) << run.error->message;
    EXPECT_EQ(run.kind, ProbeKind::Compute);
    EXPECT_EQ(step_names(run),
              (std::vector<std::string>{"start", "authenticated", "server_created",
                                        "server_active", "floating_ip_attached",
                                        "ssh_connected", "resources_deleted"}));
    EXPECT_FALSE(run.error.has_value());
    EXPECT_EQ(cloud_.total_count(), 0u);

    auto deleted = cloud_.deleted();
    ASSERT_EQ(deleted.size(), 2u);
    EXPECT_EQ(deleted[0].kind, ResourceKind::FloatingIp);
    EXPECT_EQ(deleted[1].kind, ResourceKind::Server);
    EXPECT_TRUE(has_resource_tag(deleted[1].name));
    EXPECT_EQ(shell_.hosts().size(), 1u);

    EXPECT_TRUE(metrics_.gauge_value(kStepTimestampMetric,
                                     {{"probe", "instance"}, {"step", "ssh_connected"}}));
}

TEST_F(ProbeTest, StepInstantsAreNonDecreasing) {
    auto run = run_compute();
    ASSERT_TRUE(run.succeeded());
    for (size_t i = 1; i < run.steps.size(); ++i) {
        EXPECT_LE(run.steps[i - 1].second, run.steps[i].second);
    }
}

TEST_F(ProbeTest, ComputeCreateRejectionIsNotRetried) {
    MockFaults faults;
    faults.fail_create = {ResourceKind::Server};
    cloud_.set_faults(faults);

    auto run = run_compute();

    EXPECT_EQ(run.outcome, ProbeOutcome::ProviderError);
    ASSERT_TRUE(run.error.has_value());
    EXPECT_TRUE(run.error->is(ErrorKind::Provider));
    EXPECT_EQ(step_names(run), (std::vector<std::string>{"start", "authenticated"}));
    EXPECT_EQ(cloud_.create_attempts(ResourceKind::Server), 1u);
    EXPECT_EQ(cloud_.create_attempts(ResourceKind::FloatingIp), 0u);
    EXPECT_EQ(cloud_.total_count(), 0u);
    EXPECT_TRUE(shell_.hosts().empty());
}

TEST_F(ProbeTest, ComputeServerErrorLeavesServer) {
    MockFaults faults;
    faults.server_error_state = true;
    cloud_.set_faults(faults);

    auto run = run_compute();

    EXPECT_EQ(run.outcome, ProbeOutcome::ProviderError);
    ASSERT_TRUE(run.error.has_value());
    EXPECT_NE(run.error->message.find("ERROR"), std::string::npos);
    EXPECT_EQ(step_names(run).back(), "server_created");
    EXPECT_EQ(cloud_.count(ResourceKind::Server), 1u);
    EXPECT_TRUE(cloud_.deleted().empty());
}

TEST_F(ProbeTest, ComputeFloatingIpFailureLeavesServer) {
    MockFaults faults;
    faults.fail_create = {ResourceKind::FloatingIp};
    cloud_.set_faults(faults);

    auto run = run_compute();

    EXPECT_EQ(run.outcome, ProbeOutcome::ProviderError);
    EXPECT_EQ(step_names(run).back(), "server_active");
    EXPECT_EQ(cloud_.count(ResourceKind::Server), 1u);
    EXPECT_EQ(cloud_.count(ResourceKind::FloatingIp), 0u);
}

TEST_F(ProbeTest, ComputeSshRetriesThenFails) {
    shell_.set_failure(true);

    auto run = run_compute();

    EXPECT_EQ(run.outcome, ProbeOutcome::RemoteShellError);
    EXPECT_EQ(shell_.hosts().size(), 3u);
    EXPECT_EQ(step_names(run).back(), "floating_ip_attached");
    EXPECT_EQ(cloud_.count(ResourceKind::Server), 1u);
    EXPECT_EQ(cloud_.count(ResourceKind::FloatingIp), 1u);
}

TEST_F(ProbeTest, ComputeTimeoutWhileWaitingForActive) {
    MockFaults faults;
    faults.polls_until_active = 1000000;
    cloud_.set_faults(faults);

    auto start = std::chrono::steady_clock::now();
    auto run = run_compute(150ms);

    EXPECT_EQ(run.outcome, ProbeOutcome::Timeout);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    EXPECT_EQ(step_names(run).back(), "server_created");
    EXPECT_EQ(cloud_.count(ResourceKind::Server), 1u);
}

TEST_F(ProbeTest, AuthenticationFailure) {
    MockFaults faults;
    faults.fail_auth = true;
    cloud_.set_faults(faults);

    auto run = run_compute();

    EXPECT_EQ(run.outcome, ProbeOutcome::ConfigurationError);
    EXPECT_EQ(step_names(run), (std::vector<std::string>{"start"}));
    EXPECT_EQ(cloud_.total_count(), 0u);
}

TEST_F(ProbeTest, ExpiredDeadlineStillPublishesStart) {
    auto run = run_compute(0ms);

    EXPECT_EQ(run.outcome, ProbeOutcome::Timeout);
    EXPECT_EQ(step_names(run), (std::vector<std::string>{"start"}));
    EXPECT_TRUE(metrics_.gauge_value(kStepTimestampMetric,
                                     {{"probe", "instance"}, {"step", "start"}}));
}

// ═══════════════════════════════════════════════
// Storage
// ═══════════════════════════════════════════════

TEST_F(ProbeTest, StorageSuccessCleansUp) {
    auto run = run_storage();

    ASSERT_TRUE(run.succeeded()) << run.error->message;
    EXPECT_EQ(step_names(run),
              (std::vector<std::string>{"start", "authenticated", "container_created",
                                        "object_uploaded", "object_downloaded",
                                        "object_verified", "resources_deleted"}));
    EXPECT_EQ(cloud_.total_count(), 0u);
    ASSERT_EQ(cloud_.deleted().size(), 1u);
    EXPECT_EQ(cloud_.deleted().front().kind, ResourceKind::Container);
}

TEST_F(ProbeTest, StorageCorruptDownloadIsVerificationFailure) {
    MockFaults faults;
    faults.corrupt_download = true;
    cloud_.set_faults(faults);

    auto run = run_storage();

    EXPECT_EQ(run.outcome, ProbeOutcome::VerificationFailed);
    EXPECT_EQ(step_names(run).back(), "object_downloaded");
    EXPECT_NE(run.error->message.find("512 of 512"), std::string::npos);
    EXPECT_EQ(cloud_.count(ResourceKind::Container), 1u);
}

TEST_F(ProbeTest, StorageUploadFailureLeavesContainer) {
    MockFaults faults;
    faults.fail_upload = true;
    cloud_.set_faults(faults);

    auto run = run_storage();

    EXPECT_EQ(run.outcome, ProbeOutcome::ProviderError);
    EXPECT_EQ(step_names(run).back(), "container_created");
    EXPECT_EQ(cloud_.count(ResourceKind::Container), 1u);
}

TEST_F(ProbeTest, StorageLatencyBeyondDeadlineTimesOut) {
    MockFaults faults;
    faults.latency = 100ms;
    cloud_.set_faults(faults);

    auto run = run_storage(250ms);

    EXPECT_EQ(run.outcome, ProbeOutcome::Timeout);
    EXPECT_LT(run.elapsed, 2s);
}

// ═══════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════

TEST(ProbeHelpersTest, PollIntervalDoublesUpToCap) {
    EXPECT_EQ(next_poll_interval(100ms, 1s), 200ms);
    EXPECT_EQ(next_poll_interval(800ms, 1s), 1s);
    EXPECT_EQ(next_poll_interval(1s, 1s), 1s);
}

TEST(ProbeHelpersTest, RandomPayload) {
    auto a = random_payload(1024);
    auto b = random_payload(1024);
    EXPECT_EQ(a.size(), 1024u);
    EXPECT_NE(a, b);
    EXPECT_TRUE(random_payload(0).empty());
}
