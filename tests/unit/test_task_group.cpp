/**
 * @file test_task_group.cpp
 * @brief Unit tests for TaskGroup fan-out under a shared Deadline.
 */

#include "executor/task_group.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

using namespace openstack_exporter;
using namespace std::chrono_literals;

TEST(TaskGroupTest, ResultsInSpawnOrder) {
    TaskGroup<int> group(5s);

    group.spawn("slow", [](const Deadline&) -> Result<int> {
        std::this_thread::sleep_for(30ms);
        return 1;
    });
    group.spawn("fast", [](const Deadline&) -> Result<int> { return 2; });

    auto results = group.wait();
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(*results[0], 1);
    EXPECT_EQ(*results[1], 2);
}

TEST(TaskGroupTest, UnitsRunConcurrently) {
    TaskGroup<int> group(5s);

    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 2; ++i) {
        group.spawn("sleeper", [i](const Deadline&) -> Result<int> {
            std::this_thread::sleep_for(200ms);
            return i;
        });
    }
    auto results = group.wait();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(results.size(), 2u);
    EXPECT_LT(elapsed, 390ms);
}

TEST(TaskGroupTest, MoreUnitsThanCoresStillOverlap) {
    TaskGroup<int> group(5s);

    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 4; ++i) {
        group.spawn("sleeper", [i](const Deadline&) -> Result<int> {
            std::this_thread::sleep_for(200ms);
            return i;
        });
    }
    auto results = group.wait();

    EXPECT_EQ(results.size(), 4u);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 390ms);
}

TEST(TaskGroupTest, ConcurrentGroupsDoNotQueueBehindEachOther) {
    auto run_group = [] {
        TaskGroup<Duration> group(300ms);
        for (int i = 0; i < 2; ++i) {
            group.spawn("holder", [](const Deadline& d) -> Result<Duration> {
                auto at_entry = d.remaining();
                d.sleep_for(150ms);
                return at_entry;
            });
        }
        return group.wait();
    };

    auto first = std::async(std::launch::async, run_group);
    std::this_thread::sleep_for(10ms);
    auto second = std::async(std::launch::async, run_group);

    for (auto* future : {&first, &second}) {
        for (const auto& remaining : future->get()) {
            ASSERT_TRUE(remaining);
            EXPECT_GT(*remaining, 250ms);
        }
    }
}

TEST(TaskGroupTest, ThrowingUnitIsIsolated) {
    TaskGroup<int> group(5s);

    group.spawn("broken", [](const Deadline&) -> Result<int> {
        throw std::runtime_error("boom");
    });
    group.spawn("healthy", [](const Deadline&) -> Result<int> { return 7; });

    auto results = group.wait();
    ASSERT_EQ(results.size(), 2u);
    ASSERT_FALSE(results[0]);
    EXPECT_TRUE(results[0].error().is(ErrorKind::Internal));
    EXPECT_NE(results[0].error().message.find("broken"), std::string::npos);
    EXPECT_NE(results[0].error().message.find("boom"), std::string::npos);
    ASSERT_TRUE(results[1]);
    EXPECT_EQ(*results[1], 7);
}

TEST(TaskGroupTest, UnitsShareTheGroupDeadline) {
    TaskGroup<int> group(50ms);

    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 2; ++i) {
        group.spawn("waiter", [](const Deadline& d) -> Result<int> {
            if (!d.sleep_for(10s)) return Error{ErrorKind::Timeout, "deadline exceeded"};
            return 0;
        });
    }
    auto results = group.wait();

    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    for (const auto& r : results) {
        ASSERT_FALSE(r);
        EXPECT_TRUE(r.error().is(ErrorKind::Timeout));
    }
}

TEST(TaskGroupTest, ParentStopCancelsUnits) {
    std::stop_source parent;
    TaskGroup<int> group(10s, parent.get_token());

    std::atomic<bool> started{false};
    group.spawn("waiter", [&started](const Deadline& d) -> Result<int> {
        started = true;
        if (!d.sleep_for(10s)) return Error{ErrorKind::Timeout, "cancelled"};
        return 0;
    });

    while (!started) std::this_thread::sleep_for(1ms);
    parent.request_stop();

    auto results = group.wait();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0]);
    EXPECT_TRUE(group.deadline().stop_requested());
}

TEST(TaskGroupTest, CancelStopsOutstandingUnits) {
    TaskGroup<int> group(10s);

    group.spawn("waiter", [](const Deadline& d) -> Result<int> {
        if (!d.sleep_for(10s)) return Error{ErrorKind::Timeout, "cancelled"};
        return 0;
    });
    group.cancel();

    auto results = group.wait();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].error().is(ErrorKind::Timeout));
    EXPECT_EQ(group.size(), 0u);
}
