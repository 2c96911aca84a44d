// === Planning Runtime ========================================================
//
// Owns the planning worker thread. The detection feed submits targets from
// any thread; the update loop merges them into the tracked set, drops targets
// whose predicted impact has passed and asks the cycle manager to run a cycle
// at the configured cadence.

#pragma once

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "rolling_planner/clock.hpp"
#include "rolling_planner/configuration.hpp"
#include "rolling_planner/planning_cycle_manager.hpp"
#include "rolling_planner/planning_event_bus.hpp"

namespace rolling_planner {

/** @brief Drives rolling planning on a background update thread. */
class PlanningRuntime final {
  public:
    PlanningRuntime(Configuration configuration,
                    PlatformRegistry& platform_registry,
                    const PositionOracle& position_oracle,
                    SessionRegistry& session_registry,
                    Clock& clock,
                    ReportSinkPtr report_sink);
    ~PlanningRuntime();

    PlanningRuntime(const PlanningRuntime&) = delete;
    PlanningRuntime& operator=(const PlanningRuntime&) = delete;

    /** @brief Start rolling planning and the update loop. */
    void run();
    /** @brief Stop planning, then join the update thread. */
    void shutdown();

    /** @brief Queue detections; a later detection replaces an earlier one with the same id. */
    void submit_detections(const TargetList& targets);
    [[nodiscard]] std::size_t pending_detections() const;
    [[nodiscard]] std::size_t tracked_target_count() const;

    /** @brief Merge queued detections, prune impacted targets and try one cycle. */
    std::optional<CycleInfo> tick();

    [[nodiscard]] PlanningEventBus& event_bus() noexcept;
    [[nodiscard]] RollingPlanningCycleManager& cycle_manager() noexcept;
    [[nodiscard]] bool is_running() const noexcept;

  private:
    /** @brief Fixed-cadence loop calling tick(). */
    void update_loop();
    TargetList refresh_tracked_targets();

    Configuration configuration_;
    Clock& clock_;
    PlanningEventBus event_bus_;
    RollingPlanningCycleManager cycle_manager_;
    mutable std::mutex mutex_;
    std::map<std::string, Target> map_pending_;
    std::map<std::string, Target> map_tracked_;
    std::atomic<bool> flag_running_{false};
    std::thread update_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace rolling_planner
