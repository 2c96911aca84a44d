// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs used throughout the
// planner (time primitives, geodetic and cartesian coordinates).

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace rolling_planner {

/**
 * @brief Alias for the steady clock used for wait budgets and poll cadence.
 */
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Alias for timestamps captured from the steady clock.
 */
using TimePoint = std::chrono::time_point<SteadyClock>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Wall-calendar clock used for simulation time (trajectories, cycle stamps).
 */
using SystemClock = std::chrono::system_clock;

/**
 * @brief Simulation timestamp. Rendered as ISO-8601 in reports.
 */
using SimTimePoint = std::chrono::time_point<SystemClock>;

/**
 * @brief Represents a latitude/longitude/altitude triplet in degrees/kilometres.
 */
struct GeodeticCoordinate final {
    double latitude_deg{};   /**< Latitude in decimal degrees. */
    double longitude_deg{};  /**< Longitude in decimal degrees. */
    double altitude_km{};    /**< Altitude in kilometres above mean sea level. */
};

/**
 * @brief Earth-centred cartesian position in kilometres.
 */
struct CartesianPosition final {
    double x_km{};
    double y_km{};
    double z_km{};
};

using IdList = std::vector<std::string>;

}  // namespace rolling_planner
