#include "curio/scheduler/graph_scheduler.hpp"
#include <utility>
#include <spdlog/spdlog.h>

namespace curio {

// ==========================================
// BuildGuard
// ==========================================

bool BuildGuard::try_acquire() {
    std::lock_guard lock(mutex_);
    if (held_) return false;
    held_ = true;
    return true;
}

void BuildGuard::release() {
    std::lock_guard lock(mutex_);
    held_ = false;
}

bool BuildGuard::is_held() const {
    std::lock_guard lock(mutex_);
    return held_;
}

// ==========================================
// Results
// ==========================================

nlohmann::json SchedulerStatus::to_json() const {
    return {{"isRunning", is_running}, {"isScheduled", is_scheduled}};
}

nlohmann::json ManualBuildResult::to_json() const {
    nlohmann::json j;
    j["success"] = success;
    if (!message.empty()) j["message"] = message;
    if (results) j["results"] = results->to_json();
    if (!error.empty()) j["error"] = error;
    return j;
}

// ==========================================
// GraphScheduler
// ==========================================

GraphScheduler::GraphScheduler(BuildFunction build)
    : build_(std::move(build)) {}

GraphScheduler::~GraphScheduler() {
    stop();
}

void GraphScheduler::start(int64_t interval_ms) {
    if (interval_ms <= 0) {
        throw std::invalid_argument("Graph update interval must be positive, got " +
                                    std::to_string(interval_ms));
    }

    std::lock_guard control(control_mutex_);
    if (timer_thread_.joinable()) {
        spdlog::warn("Graph scheduler already started");
        return;
    }

    {
        std::lock_guard lock(timer_mutex_);
        stop_requested_ = false;
    }

    spdlog::info("Starting graph scheduler with interval: {} minutes ({} ms)",
                 interval_ms / 60000, interval_ms);
    timer_thread_ = std::thread(&GraphScheduler::timer_loop, this,
                                std::chrono::milliseconds(interval_ms));
    scheduled_ = true;
}

void GraphScheduler::stop() {
    std::lock_guard control(control_mutex_);
    if (!timer_thread_.joinable()) {
        return;
    }

    {
        std::lock_guard lock(timer_mutex_);
        stop_requested_ = true;
    }
    timer_cv_.notify_all();
    timer_thread_.join();

    scheduled_ = false;
    spdlog::info("Graph scheduler stopped");
}

ManualBuildResult GraphScheduler::trigger_manual_build() {
    ManualBuildResult result;

    BuildLease lease(guard_);
    if (!lease.acquired()) {
        spdlog::warn("Graph build already in progress");
        result.message = "Graph build already in progress";
        return result;
    }

    try {
        spdlog::info("Triggering manual graph build...");
        result.results = build_();
        result.success = true;
        spdlog::info("Manual graph build completed");
    } catch (const std::exception& e) {
        spdlog::error("Error in manual graph build: {}", e.what());
        result.error = e.what();
    } catch (...) {
        spdlog::error("Error in manual graph build: unknown error");
        result.error = "unknown error";
    }
    return result;
}

bool GraphScheduler::run_pending_tick() {
    BuildLease lease(guard_);
    if (!lease.acquired()) {
        spdlog::debug("Graph build already in progress, skipping...");
        return false;
    }

    try {
        spdlog::info("Starting scheduled graph build...");
        build_();
        spdlog::info("Scheduled graph build completed");
    } catch (const std::exception& e) {
        spdlog::error("Error in scheduled graph build: {}", e.what());
    } catch (...) {
        spdlog::error("Error in scheduled graph build: unknown error");
    }
    return true;
}

SchedulerStatus GraphScheduler::status() const {
    SchedulerStatus s;
    s.is_running = guard_.is_held();
    s.is_scheduled = scheduled_;
    return s;
}

void GraphScheduler::timer_loop(std::chrono::milliseconds interval) {
    std::unique_lock lock(timer_mutex_);
    while (!stop_requested_) {
        if (timer_cv_.wait_for(lock, interval, [this] { return stop_requested_; })) {
            break;
        }

        lock.unlock();
        run_pending_tick();
        lock.lock();
    }
}

} // namespace curio
