// === Target ==================================================================
//
// Detected moving target with its sampled trajectory. Targets are created by
// the detection feed and treated as immutable snapshots once a planning cycle
// has captured them.

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "rolling_planner/types.hpp"

namespace rolling_planner {

/** @brief Threat classification assigned by the detection feed. */
enum class ThreatLevel {
    Low,
    Medium,
    High,
    Critical
};

[[nodiscard]] std::string_view to_string(ThreatLevel level) noexcept;

/** @brief One time-stamped position along a target trajectory. */
struct TrajectorySample final {
    GeodeticCoordinate position{};
    SimTimePoint time{};
};

using Trajectory = std::vector<TrajectorySample>;

/**
 * @brief Snapshot of a detected target.
 *
 * `trajectory` is ordered by time. `flight_duration` is measured from
 * `launch_time`; their sum is the predicted impact time.
 */
struct Target final {
    std::string identifier{};                   /**< Unique target identifier. */
    GeodeticCoordinate launch_position{};       /**< Launch site. */
    GeodeticCoordinate aim_position{};          /**< Predicted impact point. */
    SimTimePoint launch_time{};                 /**< Launch timestamp. */
    Duration flight_duration{};                 /**< Predicted flight time. */
    Trajectory trajectory{};                    /**< Time-ordered trajectory samples. */
    double priority{};                          /**< Scheduling priority, higher is more urgent. */
    ThreatLevel threat_level{ThreatLevel::Medium};

    /** @brief Launch time plus flight duration. */
    [[nodiscard]] SimTimePoint impact_time() const;
};

using TargetList = std::vector<Target>;

}  // namespace rolling_planner
