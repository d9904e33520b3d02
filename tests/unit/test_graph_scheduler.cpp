#include <gtest/gtest.h>
#include "curio/scheduler/graph_scheduler.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

using namespace curio;

namespace {

// Holds a build inside the build function until opened
class Gate {
public:
    void pass() {
        std::unique_lock lock(mutex_);
        entered_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this] { return open_; });
    }

    void wait_entered() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return entered_; });
    }

    void open() {
        std::lock_guard lock(mutex_);
        open_ = true;
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool entered_ = false;
    bool open_ = false;
};

GraphBuildSummary summary_with(int concept_edges) {
    GraphBuildSummary summary;
    summary.concept_relationships.relationships_created = concept_edges;
    return summary;
}

template <typename Predicate>
bool wait_until(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

} // anonymous namespace

// ==========================================
// Build Guard Tests
// ==========================================

TEST(BuildGuardTest, SingleHolder) {
    BuildGuard guard;
    EXPECT_TRUE(guard.try_acquire());
    EXPECT_TRUE(guard.is_held());
    EXPECT_FALSE(guard.try_acquire());

    guard.release();
    EXPECT_FALSE(guard.is_held());
    EXPECT_TRUE(guard.try_acquire());
}

TEST(BuildGuardTest, LeaseReleasesOnScopeExit) {
    BuildGuard guard;
    {
        BuildLease lease(guard);
        EXPECT_TRUE(lease.acquired());

        BuildLease second(guard);
        EXPECT_FALSE(second.acquired());
    }
    EXPECT_FALSE(guard.is_held());
}

TEST(BuildGuardTest, LeaseReleasesOnException) {
    BuildGuard guard;
    try {
        BuildLease lease(guard);
        throw std::runtime_error("build failed");
    } catch (const std::runtime_error&) {
    }
    EXPECT_FALSE(guard.is_held());
}

// ==========================================
// Manual Trigger Tests
// ==========================================

TEST(GraphSchedulerTest, ManualBuildSucceeds) {
    GraphScheduler scheduler([] { return summary_with(7); });

    ManualBuildResult result = scheduler.trigger_manual_build();
    EXPECT_TRUE(result.success);
    ASSERT_TRUE(result.results.has_value());
    EXPECT_EQ(result.results->concept_relationships.relationships_created, 7);
    EXPECT_TRUE(result.error.empty());
    EXPECT_FALSE(scheduler.status().is_running);

    auto j = result.to_json();
    EXPECT_EQ(j["success"], true);
    EXPECT_EQ(j["results"]["conceptRelationships"]["relationshipsCreated"], 7);
}

TEST(GraphSchedulerTest, ManualBuildFailureIsReported) {
    GraphScheduler scheduler([]() -> GraphBuildSummary {
        throw std::runtime_error("vector store unreachable");
    });

    ManualBuildResult result;
    EXPECT_NO_THROW(result = scheduler.trigger_manual_build());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "vector store unreachable");
    EXPECT_FALSE(result.results.has_value());
    EXPECT_FALSE(scheduler.status().is_running);
}

TEST(GraphSchedulerTest, ManualTriggerRejectedWhileRunning) {
    Gate gate;
    std::atomic<int> builds{0};
    GraphScheduler scheduler([&] {
        builds++;
        gate.pass();
        return summary_with(1);
    });

    std::thread first([&] { scheduler.trigger_manual_build(); });
    gate.wait_entered();
    EXPECT_TRUE(scheduler.status().is_running);

    ManualBuildResult rejected = scheduler.trigger_manual_build();
    EXPECT_FALSE(rejected.success);
    EXPECT_EQ(rejected.message, "Graph build already in progress");
    EXPECT_FALSE(rejected.results.has_value());

    EXPECT_FALSE(scheduler.run_pending_tick());
    EXPECT_EQ(builds.load(), 1);

    gate.open();
    first.join();
    EXPECT_FALSE(scheduler.status().is_running);
}

// ==========================================
// Scheduled Tick Tests
// ==========================================

TEST(GraphSchedulerTest, TickRunsBuild) {
    std::atomic<int> builds{0};
    GraphScheduler scheduler([&] {
        builds++;
        return summary_with(0);
    });

    EXPECT_TRUE(scheduler.run_pending_tick());
    EXPECT_EQ(builds.load(), 1);
}

TEST(GraphSchedulerTest, FailedTickLeavesSchedulerIdle) {
    GraphScheduler scheduler([]() -> GraphBuildSummary {
        throw std::runtime_error("graph store down");
    });

    EXPECT_NO_THROW(EXPECT_TRUE(scheduler.run_pending_tick()));
    EXPECT_FALSE(scheduler.status().is_running);
}

TEST(GraphSchedulerTest, NonStandardThrowIsContained) {
    std::atomic<int> builds{0};
    GraphScheduler scheduler([&]() -> GraphBuildSummary {
        builds++;
        throw 42;
    });

    ManualBuildResult result;
    EXPECT_NO_THROW(result = scheduler.trigger_manual_build());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "unknown error");
    EXPECT_EQ(result.to_json()["error"], "unknown error");

    EXPECT_NO_THROW(EXPECT_TRUE(scheduler.run_pending_tick()));
    EXPECT_FALSE(scheduler.status().is_running);
    EXPECT_EQ(builds.load(), 2);
}

TEST(GraphSchedulerTest, TimerSurvivesNonStandardThrow) {
    std::atomic<int> builds{0};
    GraphScheduler scheduler([&]() -> GraphBuildSummary {
        builds++;
        throw std::string("not an exception type");
    });

    scheduler.start(5);
    EXPECT_TRUE(wait_until([&] { return builds.load() >= 2; }));
    scheduler.stop();
    EXPECT_FALSE(scheduler.status().is_scheduled);
}

TEST(GraphSchedulerTest, StartAndStopToggleScheduled) {
    GraphScheduler scheduler([] { return summary_with(0); });
    EXPECT_FALSE(scheduler.status().is_scheduled);

    scheduler.start(60000);
    EXPECT_TRUE(scheduler.status().is_scheduled);

    // Second start is ignored
    EXPECT_NO_THROW(scheduler.start(60000));
    EXPECT_TRUE(scheduler.status().is_scheduled);

    scheduler.stop();
    EXPECT_FALSE(scheduler.status().is_scheduled);

    // Stopping twice is harmless
    EXPECT_NO_THROW(scheduler.stop());
}

TEST(GraphSchedulerTest, StartRejectsNonPositiveInterval) {
    GraphScheduler scheduler([] { return summary_with(0); });
    EXPECT_THROW(scheduler.start(0), std::invalid_argument);
    EXPECT_THROW(scheduler.start(-5), std::invalid_argument);
    EXPECT_FALSE(scheduler.status().is_scheduled);
}

TEST(GraphSchedulerTest, TimerFiresRepeatedly) {
    std::atomic<int> builds{0};
    GraphScheduler scheduler([&] {
        builds++;
        return summary_with(0);
    });

    scheduler.start(5);
    EXPECT_TRUE(wait_until([&] { return builds.load() >= 2; }));
    scheduler.stop();

    int after_stop = builds.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_EQ(builds.load(), after_stop);
}

TEST(GraphSchedulerTest, StopLetsInFlightBuildFinish) {
    Gate gate;
    std::atomic<int> completed{0};
    GraphScheduler scheduler([&] {
        gate.pass();
        completed++;
        return summary_with(0);
    });

    scheduler.start(5);
    gate.wait_entered();

    std::atomic<bool> stopped{false};
    std::thread stopper([&] {
        scheduler.stop();
        stopped = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_FALSE(stopped.load());

    gate.open();
    stopper.join();
    EXPECT_TRUE(stopped.load());
    EXPECT_GE(completed.load(), 1);
    EXPECT_FALSE(scheduler.status().is_running);
    EXPECT_FALSE(scheduler.status().is_scheduled);
}

TEST(SchedulerStatusTest, Json) {
    SchedulerStatus status;
    status.is_running = true;
    auto j = status.to_json();
    EXPECT_EQ(j["isRunning"], true);
    EXPECT_EQ(j["isScheduled"], false);
}
