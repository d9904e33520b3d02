#pragma once

#include "curio/builder/knowledge_graph_builder.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

namespace curio {

constexpr int64_t kDefaultGraphUpdateIntervalMs = 1800000;   // 30 minutes

/**
 * @brief A build was requested while another one holds the guard
 */
class BuildInProgress : public std::runtime_error {
public:
    BuildInProgress() : std::runtime_error("Graph build already in progress") {}
};

// ============================================================================
// Single-flight guard
// ============================================================================

/**
 * @brief At most one holder at a time; a second acquirer is refused, not queued
 */
class BuildGuard {
public:
    BuildGuard() = default;
    BuildGuard(const BuildGuard&) = delete;
    BuildGuard& operator=(const BuildGuard&) = delete;

    /**
     * @return true if the caller now holds the guard
     */
    bool try_acquire();

    void release();

    bool is_held() const;

private:
    mutable std::mutex mutex_;
    bool held_ = false;
};

/**
 * @brief Scoped acquisition of a BuildGuard
 *
 * Check acquired() before doing any work; the guard is released when the
 * lease goes out of scope, whichever way the scope is left.
 */
class BuildLease {
public:
    explicit BuildLease(BuildGuard& guard)
        : guard_(guard), acquired_(guard.try_acquire()) {}

    ~BuildLease() {
        if (acquired_) guard_.release();
    }

    BuildLease(const BuildLease&) = delete;
    BuildLease& operator=(const BuildLease&) = delete;

    bool acquired() const { return acquired_; }

private:
    BuildGuard& guard_;
    bool acquired_;
};

// ============================================================================
// Results
// ============================================================================

struct SchedulerStatus {
    bool is_running = false;        ///< A build holds the guard
    bool is_scheduled = false;      ///< The periodic timer exists

    nlohmann::json to_json() const;
};

/**
 * @brief Outcome of trigger_manual_build()
 *
 * Refused: success=false with message. Failed: success=false with error.
 * Completed: success=true with results.
 */
struct ManualBuildResult {
    bool success = false;
    std::string message;
    std::optional<GraphBuildSummary> results;
    std::string error;

    nlohmann::json to_json() const;
};

// ============================================================================
// Graph Scheduler
// ============================================================================

/**
 * @brief Runs full builds periodically or on demand, one at a time
 *
 * State is Idle or Running (the guard), with Scheduled as an independent
 * flag for whether the timer thread exists. A scheduled tick that finds a
 * build running is skipped; a failed scheduled build is logged and the next
 * tick is the retry. There is no cancellation of a running build.
 */
class GraphScheduler {
public:
    using BuildFunction = std::function<GraphBuildSummary()>;

    explicit GraphScheduler(BuildFunction build);
    ~GraphScheduler();

    GraphScheduler(const GraphScheduler&) = delete;
    GraphScheduler& operator=(const GraphScheduler&) = delete;

    /**
     * @brief Start the periodic timer; the first tick fires after one interval
     *
     * Does nothing (with a warning) if the timer is already running.
     *
     * @throws std::invalid_argument if interval_ms <= 0
     */
    void start(int64_t interval_ms = kDefaultGraphUpdateIntervalMs);

    /**
     * @brief Stop the timer and join its thread
     *
     * A build in flight is allowed to finish first.
     */
    void stop();

    /**
     * @brief Run a build now unless one is already running
     */
    ManualBuildResult trigger_manual_build();

    /**
     * @brief Perform one scheduled tick synchronously
     * @return true if a build ran (successfully or not), false if skipped
     */
    bool run_pending_tick();

    SchedulerStatus status() const;

    BuildGuard& guard() { return guard_; }

private:
    BuildFunction build_;
    BuildGuard guard_;

    std::mutex control_mutex_;              // serializes start()/stop()
    std::thread timer_thread_;
    std::mutex timer_mutex_;
    std::condition_variable timer_cv_;
    bool stop_requested_ = false;
    std::atomic<bool> scheduled_{false};

    void timer_loop(std::chrono::milliseconds interval);
};

} // namespace curio
