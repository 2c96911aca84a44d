// === Geometry Engine =========================================================
//
// Stateless numeric primitives used by the task distributor: great-circle
// distance with altitude correction, visibility-window detection along a
// trajectory, and the confidence score attached to each distance result.
// None of these functions throw; malformed input degrades to +inf or 0.

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

#include "rolling_planner/target.hpp"
#include "rolling_planner/types.hpp"

namespace rolling_planner {

inline constexpr double k_default_earth_radius_km{6'371.0};

/** @brief Contiguous run of trajectory samples within the visibility threshold. */
struct VisibilityWindow final {
    std::size_t start_index{};
    std::size_t end_index{};
    double duration_s{};
    double min_distance_km{};
};

using VisibilityWindowList = std::vector<VisibilityWindow>;

/**
 * @brief Supplies the observer position for a given trajectory sample.
 *
 * Returning std::nullopt marks the sample as unobservable.
 */
using PositionFunction = std::function<std::optional<GeodeticCoordinate>(const TrajectorySample&)>;

/**
 * @brief Haversine ground distance combined with altitude difference.
 *
 * Returns `sqrt(ground^2 + dalt^2)` in kilometres, or +inf when either point
 * carries a non-finite component or a latitude outside [-90, 90].
 */
[[nodiscard]] double spherical_distance_km(const GeodeticCoordinate& from,
                                           const GeodeticCoordinate& to,
                                           double earth_radius_km = k_default_earth_radius_km) noexcept;

/**
 * @brief Scan @p trajectory for runs of samples within @p threshold_km.
 *
 * A window still open at the end of the scan is closed at the final index.
 * Window duration is the time spanned between its first and last sample.
 */
[[nodiscard]] VisibilityWindowList find_visibility_windows(const Trajectory& trajectory,
                                                           const PositionFunction& position_fn,
                                                           double threshold_km,
                                                           double earth_radius_km = k_default_earth_radius_km);

/**
 * @brief Confidence in [0, 1] derived from distance stability and window coverage.
 */
[[nodiscard]] double distance_confidence(const std::vector<double>& distances_km,
                                         const VisibilityWindowList& windows) noexcept;

/** @brief Convert a geodetic coordinate to earth-centred cartesian on a spherical earth. */
[[nodiscard]] CartesianPosition to_cartesian(const GeodeticCoordinate& coordinate,
                                             double earth_radius_km = k_default_earth_radius_km) noexcept;

}  // namespace rolling_planner
