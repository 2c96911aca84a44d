// === Rolling Planning Cycle Manager ==========================================
//
// Top-level coordinator of the rolling planner. Each call to
// `check_and_execute_cycle` may start a new cycle and drive it through target
// collection, task distribution, collaborative discussion, result gathering
// and report generation. At most one cycle is live at a time: starting a new
// one force-completes the previous cycle and cleans up its sessions first.

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "rolling_planner/clock.hpp"
#include "rolling_planner/discussion_monitor.hpp"
#include "rolling_planner/gdop_calculator.hpp"
#include "rolling_planner/logging.hpp"
#include "rolling_planner/meta_task_planner.hpp"
#include "rolling_planner/planning_cycle.hpp"
#include "rolling_planner/planning_event_bus.hpp"
#include "rolling_planner/platform.hpp"
#include "rolling_planner/report_sink.hpp"
#include "rolling_planner/session_registry.hpp"
#include "rolling_planner/task_distributor.hpp"

namespace rolling_planner {

/**
 * @brief Tunables for the cycle manager and the components it owns.
 *
 * Populated at startup by the configuration loader and treated as immutable
 * while planning runs.
 */
struct PlanningCycleConfig final {
    std::uint64_t max_planning_cycles{100};
    Duration planning_interval{0.0};  /**< Minimum spacing between cycle starts. */
    WaitPolicy wait_policy{};
    DistributorConfig distributor{};
    DiscussionMonitorConfig monitor{};
    MetaTaskConfig meta_task{};
};

class RollingPlanningCycleManager final {
  public:
    /**
     * @param report_sink Optional artifact destination; report generation is skipped when null.
     */
    RollingPlanningCycleManager(PlanningCycleConfig config,
                                PlatformRegistry& platform_registry,
                                const PositionOracle& position_oracle,
                                SessionRegistry& session_registry,
                                Clock& clock,
                                PlanningEventBus& event_bus,
                                ReportSinkPtr report_sink = nullptr);

    RollingPlanningCycleManager(const RollingPlanningCycleManager&) = delete;
    RollingPlanningCycleManager& operator=(const RollingPlanningCycleManager&) = delete;

    [[nodiscard]] const PlanningCycleConfig& config() const noexcept;

    /** @brief Allow cycles to run. Returns false if planning was already running. */
    bool start_rolling_planning();

    /**
     * @brief Block new cycles, force-complete the live cycle and clean every active session.
     *
     * An in-flight cycle observes the stop at its next phase boundary.
     */
    void stop_rolling_planning();

    /**
     * @brief Run one cycle over @p targets if planning is running and the interval has elapsed.
     *
     * Returns the finished cycle, or std::nullopt when no cycle was started.
     * Reaching the maximum cycle count stops planning.
     */
    std::optional<CycleInfo> check_and_execute_cycle(const TargetList& targets);

    [[nodiscard]] bool is_running() const noexcept;
    [[nodiscard]] std::optional<CycleInfo> current_cycle() const;
    [[nodiscard]] std::uint64_t cycle_counter() const;
    /** @brief Copy of every archived cycle, oldest first. */
    [[nodiscard]] std::vector<CycleInfo> cycle_history() const;

  private:
    using CyclePtr = std::shared_ptr<CycleInfo>;

    /** @brief Create the next live cycle. Caller holds the lock. */
    CyclePtr begin_cycle_locked(const TargetList& targets);
    /** @brief Run the phases of @p cycle and archive it. */
    CycleInfo execute_cycle(const CyclePtr& cycle, const CyclePtr& forced_cycle);
    void run_phases(const CyclePtr& cycle);

    /** @brief Returns false when the targets list is empty and the cycle has nothing left to do. */
    bool collect_targets(const CyclePtr& cycle);
    void distribute_tasks(const CyclePtr& cycle, const PlatformMap& platforms);
    MonitorReport wait_for_discussions(const CyclePtr& cycle);
    void gather_results(const CyclePtr& cycle, const PlatformMap& platforms, const MonitorReport& monitor_report);
    void generate_reports(const CyclePtr& cycle);

    void generate_meta_task_set(const CyclePtr& cycle);
    /** @brief Fill the GDOP and geometry spread averages of @p metrics over every target. */
    void evaluate_geometry(const TargetList& targets, const PlatformMap& platforms, OptimizationMetrics& metrics) const;
    [[nodiscard]] GanttChartData make_gantt_data(const CycleInfo& cycle) const;
    void ensure_report_session(const CycleInfo& cycle);

    /** @brief Move @p cycle into @p state unless it was already terminated elsewhere. */
    bool enter_phase(const CyclePtr& cycle, CycleState state);
    /** @brief Apply @p mutation under the lock; false if the cycle is already terminal. */
    bool update_cycle(const CyclePtr& cycle, const std::function<void(CycleInfo&)>& mutation);
    /** @brief Terminate and archive @p cycle; returns the archived copy. */
    CycleInfo finish_cycle(const CyclePtr& cycle, CycleState state, std::optional<std::string> error_message);
    /** @brief Force the live cycle to Completed. Caller holds the lock. Returns the forced cycle, if any. */
    CyclePtr force_complete_locked();
    void cleanup_active_sessions();
    void purge_closed_sessions(std::uint64_t cycle_number);
    void publish(PlanningEventKind kind, std::uint64_t cycle_number, CycleState state, std::string detail);

    PlanningCycleConfig config_;
    PlatformRegistry& platform_registry_;
    const PositionOracle& position_oracle_;
    SessionRegistry& session_registry_;
    Clock& clock_;
    PlanningEventBus& event_bus_;
    ReportSinkPtr report_sink_;
    TaskDistributor distributor_;
    DiscussionMonitor monitor_;
    MetaTaskPlanner meta_task_planner_;
    GdopCalculator gdop_calculator_;

    mutable std::mutex mutex_;
    CyclePtr current_cycle_;
    std::vector<CycleInfo> list_history_;
    std::uint64_t cycle_counter_{};
    std::optional<TimePoint> optional_last_cycle_start_;
    std::atomic<bool> flag_running_{false};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace rolling_planner
