/**
 * @file test_deadline.cpp
 * @brief Unit tests for Deadline.
 */

#include "executor/deadline.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <thread>

using namespace openstack_exporter;
using namespace std::chrono_literals;

TEST(DeadlineTest, FreshDeadlineIsLive) {
    auto d = Deadline::after(5s);
    EXPECT_FALSE(d.expired());
    EXPECT_GT(d.remaining(), 4s);
    EXPECT_LE(d.remaining(), 5s);
}

TEST(DeadlineTest, ZeroTimeoutIsExpired) {
    auto d = Deadline::after(0ms);
    EXPECT_TRUE(d.expired());
    EXPECT_EQ(d.remaining(), Duration{0});
}

TEST(DeadlineTest, UnboundedNeverExpiresOnItsOwn) {
    auto d = Deadline::unbounded();
    EXPECT_FALSE(d.expired());
    EXPECT_EQ(d.remaining(), Duration::max());
}

TEST(DeadlineTest, HugeTimeoutSaturatesInsteadOfWrapping) {
    // Roughly INT64_MAX nanoseconds; now + timeout would overflow.
    auto d = Deadline::after(std::chrono::hours{2562047} + 47min + 16s);
    EXPECT_FALSE(d.expired());
    EXPECT_EQ(d.expires_at(), SteadyTime::max());
    EXPECT_EQ(d.remaining(), Duration::max());

    auto max = Deadline::after(Duration::max());
    EXPECT_FALSE(max.expired());
    EXPECT_TRUE(max.sleep_for(1ms));
}

TEST(DeadlineTest, ChildWithHugeLimitKeepsParentBound) {
    auto parent = Deadline::after(100ms);
    auto child = parent.child(Duration::max());
    EXPECT_EQ(child.expires_at(), parent.expires_at());

    auto unbounded_child = Deadline::unbounded().child(Duration::max());
    EXPECT_FALSE(unbounded_child.expired());
}

TEST(DeadlineTest, StopRequestExpiresImmediately) {
    std::stop_source source;
    auto d = Deadline::after(60s, source.get_token());
    EXPECT_FALSE(d.expired());

    source.request_stop();
    EXPECT_TRUE(d.expired());
    EXPECT_TRUE(d.stop_requested());
    EXPECT_EQ(d.remaining(), Duration{0});
}

TEST(DeadlineTest, ChildIsNoLaterThanParent) {
    auto parent = Deadline::after(100ms);
    auto shorter = parent.child(20ms);
    auto longer = parent.child(10s);

    EXPECT_LT(shorter.expires_at(), parent.expires_at());
    EXPECT_EQ(longer.expires_at(), parent.expires_at());
}

TEST(DeadlineTest, ChildSharesStopToken) {
    std::stop_source source;
    auto parent = Deadline::unbounded(source.get_token());
    auto child = parent.child(10s);

    source.request_stop();
    EXPECT_TRUE(child.expired());
}

TEST(DeadlineTest, SleepForCompletesWhenLive) {
    auto d = Deadline::after(5s);
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(d.sleep_for(20ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
}

TEST(DeadlineTest, SleepForStopsAtExpiry) {
    auto d = Deadline::after(30ms);
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(d.sleep_for(5s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST(DeadlineTest, SleepForWakesOnStop) {
    std::stop_source source;
    auto d = Deadline::unbounded(source.get_token());

    std::jthread stopper([&source] {
        std::this_thread::sleep_for(30ms);
        source.request_stop();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(d.sleep_for(10s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}
