#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include "rolling_planner/target.hpp"

namespace rolling_planner::test {

/** @brief Target flying through @p points, one sample every @p spacing starting at @p launch_time. */
inline Target make_target(std::string identifier,
                          const std::vector<GeodeticCoordinate>& points,
                          SimTimePoint launch_time,
                          Duration spacing = Duration{60.0}) {
    Target target{};
    target.identifier = std::move(identifier);
    target.launch_time = launch_time;
    target.priority = 1.0;
    if (!points.empty()) {
        target.launch_position = points.front();
        target.aim_position = points.back();
        target.flight_duration = spacing * static_cast<double>(points.size() - 1);
    }
    for (std::size_t index = 0; index < points.size(); ++index) {
        TrajectorySample sample{};
        sample.position = points[index];
        sample.time = launch_time + std::chrono::duration_cast<SystemClock::duration>(spacing * static_cast<double>(index));
        target.trajectory.push_back(sample);
    }
    return target;
}

/** @brief Short equatorial track centred on @p longitude_deg. */
inline Target make_equatorial_target(std::string identifier, double longitude_deg, SimTimePoint launch_time) {
    return make_target(std::move(identifier),
                       {GeodeticCoordinate{0.0, longitude_deg - 1.0, 0.0},
                        GeodeticCoordinate{0.0, longitude_deg, 100.0},
                        GeodeticCoordinate{0.0, longitude_deg + 1.0, 0.0}},
                       launch_time);
}

}  // namespace rolling_planner::test
