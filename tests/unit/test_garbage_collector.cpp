/**
 * @file test_garbage_collector.cpp
 * @brief Unit tests for the background sweeper.
 */

#include "gc/garbage_collector.hpp"
#include "naming/resource_name.hpp"
#include "probe/compute_probe.hpp"
#include "provider/mock_cloud.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <stdexcept>

using namespace openstack_exporter;
using namespace std::chrono_literals;

namespace {

constexpr int64_t kNow = 1718000000;

Timestamp at(int64_t unix_seconds) {
    return Timestamp{std::chrono::seconds{unix_seconds}};
}

std::string tagged(const std::string& suffix, int64_t created) {
    return std::string{kResourceTag} + "-" + suffix + "-" + std::to_string(created);
}

/// Forwards to a MockCloud session but throws when listing one kind.
class ThrowingListSession : public CloudSession {
public:
    ThrowingListSession(std::shared_ptr<CloudSession> inner, ResourceKind broken)
        : inner_(std::move(inner)), broken_(broken) {}

    Result<ResourceHandle> create_server(const std::string& name, const ServerSpec& spec,
                                         const Deadline& deadline) override {
        return inner_->create_server(name, spec, deadline);
    }
    Result<std::string> server_status(const ResourceHandle& server,
                                      const Deadline& deadline) override {
        return inner_->server_status(server, deadline);
    }
    Result<FloatingIp> attach_floating_ip(const ResourceHandle& server, const std::string& name,
                                          const std::string& external_network,
                                          const Deadline& deadline) override {
        return inner_->attach_floating_ip(server, name, external_network, deadline);
    }
    Result<ResourceHandle> create_container(const std::string& name,
                                            const Deadline& deadline) override {
        return inner_->create_container(name, deadline);
    }
    Result<void> put_object(const std::string& container, const std::string& object,
                            const std::string& data, const Deadline& deadline) override {
        return inner_->put_object(container, object, data, deadline);
    }
    Result<std::string> get_object(const std::string& container, const std::string& object,
                                   const Deadline& deadline) override {
        return inner_->get_object(container, object, deadline);
    }
    Result<void> delete_object(const std::string& container, const std::string& object,
                               const Deadline& deadline) override {
        return inner_->delete_object(container, object, deadline);
    }
    Result<std::vector<std::string>> list_objects(const std::string& container,
                                                  const Deadline& deadline) override {
        return inner_->list_objects(container, deadline);
    }
    Result<std::vector<ResourceHandle>> list_resources(ResourceKind kind, std::string_view tag,
                                                       const Deadline& deadline) override {
        if (kind == broken_) {
            throw std::runtime_error("type must be string, but is null");
        }
        return inner_->list_resources(kind, tag, deadline);
    }
    Result<void> delete_resource(const ResourceHandle& resource,
                                 const Deadline& deadline) override {
        return inner_->delete_resource(resource, deadline);
    }

private:
    std::shared_ptr<CloudSession> inner_;
    ResourceKind broken_;
};

class ThrowingListFactory : public SessionFactory {
public:
    ThrowingListFactory(MockCloud& cloud, ResourceKind broken) : cloud_(cloud), broken_(broken) {}

    Result<std::shared_ptr<CloudSession>> open(const Deadline& deadline) override {
        auto session = cloud_.open(deadline);
        if (!session) return session.error();
        return std::shared_ptr<CloudSession>(
            std::make_shared<ThrowingListSession>(*session, broken_));
    }

private:
    MockCloud& cloud_;
    ResourceKind broken_;
};

/// Factory that throws instead of returning an error.
class ExplodingFactory : public SessionFactory {
public:
    Result<std::shared_ptr<CloudSession>> open(const Deadline&) override {
        throw std::runtime_error("catalog parse blew up");
    }
};

}  // namespace

class GarbageCollectorTest : public ::testing::Test {
protected:
    GarbageCollector::Options options(Duration interval = 60s) {
        GarbageCollector::Options o;
        o.interval = interval;
        o.retention = 600s;
        o.sweep_timeout = 5s;
        return o;
    }

    std::unique_ptr<GarbageCollector> make_gc(Duration interval = 60s) {
        return std::make_unique<GarbageCollector>(options(interval), cloud_, logger_,
                                                  [] { return at(kNow); });
    }

    MockCloud cloud_;
    Logger logger_{std::make_unique<NullSink>()};
};

TEST_F(GarbageCollectorTest, DeletesOnlyTaggedResourcesOlderThanRetention) {
    cloud_.add_resource(ResourceKind::Server, tagged("old00001", kNow - 700));
    cloud_.add_resource(ResourceKind::Server, tagged("young001", kNow - 100));
    cloud_.add_resource(ResourceKind::FloatingIp, tagged("oldfip01", kNow - 3600));
    cloud_.add_resource(ResourceKind::Container, tagged("oldcont1", kNow - 601));
    cloud_.add_resource(ResourceKind::Server, "customer-web-01");

    auto gc = make_gc();
    auto report = gc->sweep_once(at(kNow));

    EXPECT_EQ(report.listed, 4u);
    EXPECT_EQ(report.candidates, 3u);
    EXPECT_EQ(report.deleted, 3u);
    EXPECT_EQ(report.delete_failures, 0u);

    auto servers = cloud_.resources(ResourceKind::Server);
    ASSERT_EQ(servers.size(), 2u);
    EXPECT_TRUE(std::any_of(servers.begin(), servers.end(),
                            [](const auto& r) { return r.name == "customer-web-01"; }));
    EXPECT_EQ(cloud_.count(ResourceKind::FloatingIp), 0u);
    EXPECT_EQ(cloud_.count(ResourceKind::Container), 0u);

    // Floating IPs are released before the servers they are bound to.
    auto deleted = cloud_.deleted();
    ASSERT_EQ(deleted.size(), 3u);
    EXPECT_EQ(deleted[0].kind, ResourceKind::FloatingIp);
    EXPECT_EQ(deleted[1].kind, ResourceKind::Server);
    EXPECT_EQ(deleted[2].kind, ResourceKind::Container);
}

TEST_F(GarbageCollectorTest, AgeEqualToRetentionIsKept) {
    cloud_.add_resource(ResourceKind::Server, tagged("border01", kNow - 600));

    auto report = make_gc()->sweep_once(at(kNow));

    EXPECT_EQ(report.listed, 1u);
    EXPECT_EQ(report.candidates, 0u);
    EXPECT_EQ(cloud_.count(ResourceKind::Server), 1u);
}

TEST_F(GarbageCollectorTest, UnparseableNamesAreIgnored) {
    cloud_.add_resource(ResourceKind::Container, std::string{kResourceTag} + "-garbled");

    auto report = make_gc()->sweep_once(at(kNow));

    EXPECT_EQ(report.listed, 1u);
    EXPECT_EQ(report.candidates, 0u);
    EXPECT_EQ(cloud_.count(ResourceKind::Container), 1u);
}

TEST_F(GarbageCollectorTest, DeleteFailureDoesNotStopSweep) {
    cloud_.add_resource(ResourceKind::Server, tagged("old00001", kNow - 700));
    cloud_.add_resource(ResourceKind::Server, tagged("old00002", kNow - 900));
    cloud_.add_resource(ResourceKind::Container, tagged("oldcont1", kNow - 900));

    MockFaults faults;
    faults.fail_delete = {ResourceKind::Server};
    cloud_.set_faults(faults);

    auto gc = make_gc();
    auto report = gc->sweep_once(at(kNow));

    EXPECT_EQ(report.candidates, 3u);
    EXPECT_EQ(report.delete_failures, 2u);
    EXPECT_EQ(report.deleted, 1u);
    EXPECT_EQ(cloud_.count(ResourceKind::Server), 2u);
    EXPECT_EQ(cloud_.count(ResourceKind::Container), 0u);

    auto totals = gc->totals();
    EXPECT_EQ(totals.sweeps, 1u);
    EXPECT_EQ(totals.deleted, 1u);
    EXPECT_EQ(totals.delete_failures, 2u);
}

TEST_F(GarbageCollectorTest, ListFailureSkipsOnlyThatKind) {
    cloud_.add_resource(ResourceKind::FloatingIp, tagged("oldfip01", kNow - 900));
    cloud_.add_resource(ResourceKind::Server, tagged("old00001", kNow - 900));

    MockFaults faults;
    faults.fail_list = {ResourceKind::FloatingIp};
    cloud_.set_faults(faults);

    auto report = make_gc()->sweep_once(at(kNow));

    EXPECT_EQ(report.list_failures, 1u);
    EXPECT_EQ(report.deleted, 1u);
    EXPECT_EQ(cloud_.count(ResourceKind::FloatingIp), 1u);
    EXPECT_EQ(cloud_.count(ResourceKind::Server), 0u);
}

TEST_F(GarbageCollectorTest, SessionFailureIsCountedAsSweep) {
    MockFaults faults;
    faults.fail_auth = true;
    cloud_.set_faults(faults);

    auto gc = make_gc();
    auto report = gc->sweep_once(at(kNow));

    EXPECT_EQ(report.list_failures, 1u);
    auto totals = gc->totals();
    EXPECT_EQ(totals.sweeps, 1u);
    EXPECT_EQ(totals.list_failures, 1u);
    ASSERT_TRUE(totals.last_sweep.has_value());
    EXPECT_EQ(*totals.last_sweep, at(kNow));
}

TEST_F(GarbageCollectorTest, EachSweepOpensFreshSession) {
    auto gc = make_gc();
    gc->sweep_once();
    gc->sweep_once();
    EXPECT_EQ(cloud_.sessions_opened(), 2u);
    EXPECT_EQ(gc->totals().sweeps, 2u);
}

TEST_F(GarbageCollectorTest, InjectedClockDrivesAge) {
    cloud_.add_resource(ResourceKind::Server, tagged("old00001", kNow - 601));

    auto report = make_gc()->sweep_once();
    EXPECT_EQ(report.deleted, 1u);
}

TEST_F(GarbageCollectorTest, RunLoopHonorsMaxCycles) {
    auto gc = make_gc(5ms);
    gc->run(std::stop_token{}, 3);
    EXPECT_EQ(gc->totals().sweeps, 3u);
}

TEST_F(GarbageCollectorTest, BackgroundLoopSweepsUntilStopped) {
    cloud_.add_resource(ResourceKind::Container, tagged("oldcont1", kNow - 900));

    auto gc = make_gc(10ms);
    gc->start();
    EXPECT_TRUE(gc->running());
    ASSERT_TRUE(gc->wait_for_sweeps(2, 5s));
    gc->stop();

    EXPECT_FALSE(gc->running());
    EXPECT_EQ(cloud_.count(ResourceKind::Container), 0u);
    auto sweeps = gc->totals().sweeps;
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(gc->totals().sweeps, sweeps);
}

TEST_F(GarbageCollectorTest, StopInterruptsLongInterval) {
    auto gc = make_gc(10min);
    gc->start();

    auto start = std::chrono::steady_clock::now();
    gc->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    EXPECT_EQ(gc->totals().sweeps, 0u);
}

TEST_F(GarbageCollectorTest, WaitForSweepsTimesOut) {
    auto gc = make_gc();
    EXPECT_FALSE(gc->wait_for_sweeps(1, 20ms));
}

TEST_F(GarbageCollectorTest, ThrowingListingIsCountedAndSweepContinues) {
    cloud_.add_resource(ResourceKind::FloatingIp, tagged("oldfip01", kNow - 900));
    cloud_.add_resource(ResourceKind::Server, tagged("old00001", kNow - 900));
    cloud_.add_resource(ResourceKind::Container, tagged("oldcont1", kNow - 900));

    ThrowingListFactory sessions(cloud_, ResourceKind::FloatingIp);
    GarbageCollector gc(options(), sessions, logger_, [] { return at(kNow); });

    SweepReport report;
    ASSERT_NO_THROW(report = gc.sweep_once(at(kNow)));

    EXPECT_EQ(report.list_failures, 1u);
    EXPECT_EQ(report.deleted, 2u);
    EXPECT_EQ(cloud_.count(ResourceKind::FloatingIp), 1u);
    EXPECT_EQ(cloud_.count(ResourceKind::Server), 0u);
    EXPECT_EQ(cloud_.count(ResourceKind::Container), 0u);
    EXPECT_EQ(gc.totals().list_failures, 1u);
}

TEST_F(GarbageCollectorTest, BackgroundLoopSurvivesThrowingListing) {
    ThrowingListFactory sessions(cloud_, ResourceKind::Server);
    GarbageCollector gc(options(10ms), sessions, logger_, [] { return at(kNow); });

    gc.start();
    ASSERT_TRUE(gc.wait_for_sweeps(3, 5s));
    EXPECT_TRUE(gc.running());
    gc.stop();

    EXPECT_GE(gc.totals().list_failures, 3u);
}

TEST_F(GarbageCollectorTest, ThrowingSessionFactoryIsCounted) {
    ExplodingFactory sessions;
    GarbageCollector gc(options(), sessions, logger_, [] { return at(kNow); });

    SweepReport report;
    ASSERT_NO_THROW(report = gc.sweep_once(at(kNow)));
    EXPECT_EQ(report.list_failures, 1u);
    EXPECT_EQ(gc.totals().sweeps, 1u);
}

TEST_F(GarbageCollectorTest, TimedOutRunIsCollectedOnlyAfterRetention) {
    MockFaults faults;
    faults.polls_until_active = 1000000;
    cloud_.set_faults(faults);

    ProbesConfig probes;
    probes.poll_interval_ms = 5;
    probes.max_poll_interval_ms = 20;
    InstanceConfig instance;
    MockRemoteShell shell;
    MetricsCollector metrics;
    ComputeProbe probe(probes, instance, cloud_, shell, logger_);

    auto run = probe.run(Deadline::after(100ms), metrics);
    ASSERT_EQ(run.outcome, ProbeOutcome::Timeout);

    auto leftovers = cloud_.resources(ResourceKind::Server);
    ASSERT_EQ(leftovers.size(), 1u);
    auto parsed = parse_name(leftovers.front().name);
    ASSERT_TRUE(parsed.has_value());

    cloud_.set_faults(MockFaults{});
    auto gc = make_gc();

    auto at_retention = gc->sweep_once(parsed->created + 600s);
    EXPECT_EQ(at_retention.listed, 1u);
    EXPECT_EQ(at_retention.candidates, 0u);
    EXPECT_EQ(cloud_.count(ResourceKind::Server), 1u);

    auto past_retention = gc->sweep_once(parsed->created + 601s);
    EXPECT_EQ(past_retention.deleted, 1u);
    EXPECT_EQ(cloud_.count(ResourceKind::Server), 0u);
    ASSERT_EQ(cloud_.deleted().size(), 1u);
    EXPECT_EQ(cloud_.deleted().front().name, leftovers.front().name);
}

TEST(GarbageCollectorOptionsTest, FromConfig) {
    auto config = default_config();
    config.gc.interval = 30s;
    config.gc.retention = 900s;
    config.probes.request_timeout = 45s;

    auto options = GarbageCollector::options_from(config);
    EXPECT_EQ(options.interval, 30s);
    EXPECT_EQ(options.retention, 900s);
    EXPECT_EQ(options.sweep_timeout, 45s);
}
