// === Planning Cycle ==========================================================
//
// Data carried by one rolling planning cycle: its state, the target snapshot
// and assignment it produced, the aggregated results and the structured
// metadata attached along the way. Only the cycle manager mutates a
// CycleInfo; everyone else sees copies.

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "rolling_planner/target.hpp"
#include "rolling_planner/task_distributor.hpp"
#include "rolling_planner/types.hpp"

namespace rolling_planner {

enum class CycleState {
    Idle,
    Initializing,
    CollectingTargets,
    DistributingTasks,
    Discussing,
    GatheringResults,
    GeneratingReports,
    Completed,
    Error
};

[[nodiscard]] std::string_view to_string(CycleState state) noexcept;

/** @brief True for Completed and Error. */
[[nodiscard]] bool is_terminal(CycleState state) noexcept;

/** @brief Condensed view of the meta-task set generated for a cycle. */
struct MetaTaskSummary final {
    std::size_t window_count{};
    std::size_t target_count{};
    SimTimePoint interval_start{};
    SimTimePoint interval_end{};
};

struct CycleMetadata final {
    std::optional<MetaTaskSummary> meta_task{};
    std::map<std::string, std::string> report_files{};  /**< Artifact path keyed by kind. */
    bool force_completed{};
    std::map<std::string, std::string> extras{};
};

/** @brief Discussion outcome for one platform with assigned targets. */
struct PlatformSummary final {
    std::string platform_id{};
    IdList assigned_targets{};
    bool discussion_completed{};  /**< No session with this participant is still active. */
    bool consensus_reached{};     /**< At least one of its sessions ended completed or dissolved. */
};

struct OptimizationMetrics final {
    double coverage_ratio{};        /**< Assigned targets over detected targets. */
    double resource_utilization{};  /**< Platforms with tasks over registered platforms. */
    std::optional<double> mean_gdop{};
    std::optional<double> mean_geometry_uniformity{};  /**< Averaged over targets with a usable geometry. */
    std::optional<double> mean_elevation_spread_deg{};
};

struct CycleResults final {
    std::map<std::string, PlatformSummary> platform_summaries{};
    OptimizationMetrics metrics{};
    std::size_t sessions_tracked{};
    std::size_t sessions_force_cleaned{};
    std::size_t dispatch_failures{};
    IdList unassigned_targets{};
};

struct CycleInfo final {
    std::string cycle_id{};
    std::uint64_t cycle_number{};
    SimTimePoint start_time{};
    std::optional<SimTimePoint> end_time{};
    CycleState state{CycleState::Idle};
    TargetList targets{};
    Assignment assignment{};
    CycleResults results{};
    std::optional<std::string> error_message{};
    CycleMetadata metadata{};
};

}  // namespace rolling_planner
