#include "rolling_planner/planning_runtime.hpp"

#include <chrono>
#include <stdexcept>

#include "rolling_planner/logging.hpp"

namespace rolling_planner {

PlanningRuntime::PlanningRuntime(Configuration configuration,
                                 PlatformRegistry& platform_registry,
                                 const PositionOracle& position_oracle,
                                 SessionRegistry& session_registry,
                                 Clock& clock,
                                 ReportSinkPtr report_sink)
    : configuration_(std::move(configuration)),
      clock_(clock),
      event_bus_(),
      cycle_manager_(configuration_.planning,
                     platform_registry,
                     position_oracle,
                     session_registry,
                     clock_,
                     event_bus_,
                     std::move(report_sink)),
      logger_(get_logger()) {
    if (configuration_.update_hz <= 0.0) {
        throw std::invalid_argument("PlanningRuntime update rate must be positive");
    }
}

PlanningRuntime::~PlanningRuntime() {
    shutdown();
}

/**
 * @brief Enable the cycle manager and start the update thread.
 */
void PlanningRuntime::run() {
    if (flag_running_.exchange(true)) {
        return;
    }
    logger_->info("Starting planning runtime at {} Hz", configuration_.update_hz);
    cycle_manager_.start_rolling_planning();
    update_thread_ = std::thread(&PlanningRuntime::update_loop, this);
}

/**
 * @brief Stop planning first so a blocked discussion wait returns, then join.
 */
void PlanningRuntime::shutdown() {
    if (!flag_running_.exchange(false)) {
        return;
    }
    logger_->info("Shutting down planning runtime");
    cycle_manager_.stop_rolling_planning();
    if (update_thread_.joinable()) {
        update_thread_.join();
    }
    flush_logger();
}

void PlanningRuntime::submit_detections(const TargetList& targets) {
    std::scoped_lock lock(mutex_);
    for (const Target& target : targets) {
        map_pending_[target.identifier] = target;
    }
}

std::size_t PlanningRuntime::pending_detections() const {
    std::scoped_lock lock(mutex_);
    return map_pending_.size();
}

std::size_t PlanningRuntime::tracked_target_count() const {
    std::scoped_lock lock(mutex_);
    return map_tracked_.size();
}

std::optional<CycleInfo> PlanningRuntime::tick() {
    const TargetList targets = refresh_tracked_targets();
    if (targets.empty()) {
        return std::nullopt;
    }
    return cycle_manager_.check_and_execute_cycle(targets);
}

PlanningEventBus& PlanningRuntime::event_bus() noexcept {
    return event_bus_;
}

RollingPlanningCycleManager& PlanningRuntime::cycle_manager() noexcept {
    return cycle_manager_;
}

bool PlanningRuntime::is_running() const noexcept {
    return flag_running_.load();
}

/**
 * @brief Fixed-timestep loop; a cycle may block a tick for the length of its discussion wait.
 */
void PlanningRuntime::update_loop() {
    const Duration tick_interval{1.0 / configuration_.update_hz};
    const SteadyClock::duration steady_tick_interval = std::chrono::duration_cast<SteadyClock::duration>(tick_interval);
    auto next_tick = SteadyClock::now();
    while (flag_running_.load()) {
        const TimePoint now = SteadyClock::now();
        if (now < next_tick) {
            std::this_thread::sleep_for(next_tick - now);
            continue;
        }
        try {
            const std::optional<CycleInfo> optional_cycle = tick();
            if (optional_cycle.has_value()) {
                logger_->info(R"({{"component":"runtime","cycle":{},"state":"{}","force_completed":{}}})",
                              optional_cycle->cycle_number,
                              to_string(optional_cycle->state),
                              optional_cycle->metadata.force_completed ? "true" : "false");
            }
        } catch (const std::exception& exc) {
            logger_->error("Update loop error: {}", exc.what());
        }
        next_tick = now + steady_tick_interval;
    }
}

TargetList PlanningRuntime::refresh_tracked_targets() {
    const SimTimePoint simulation_now = clock_.simulation_time();
    TargetList targets;
    std::scoped_lock lock(mutex_);
    for (auto& [target_id, target] : map_pending_) {
        map_tracked_[target_id] = std::move(target);
    }
    map_pending_.clear();

    for (auto iterator_target = map_tracked_.begin(); iterator_target != map_tracked_.end();) {
        if (iterator_target->second.impact_time() <= simulation_now) {
            logger_->info("Target {} passed predicted impact; no longer tracked", iterator_target->first);
            iterator_target = map_tracked_.erase(iterator_target);
            continue;
        }
        targets.push_back(iterator_target->second);
        ++iterator_target;
    }
    return targets;
}

}  // namespace rolling_planner
