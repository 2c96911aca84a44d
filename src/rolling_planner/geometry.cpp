#include "rolling_planner/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <numeric>

namespace rolling_planner {

namespace {

constexpr double k_variance_normalizer_km2{1'000'000.0}; /**< Variance at which stability reaches zero. */
constexpr double k_full_coverage_windows{3.0};           /**< Window count that saturates coverage. */
constexpr double k_max_latitude_deg{90.0};

constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

bool is_well_formed(const GeodeticCoordinate& coordinate) {
    return std::isfinite(coordinate.latitude_deg)
        && std::isfinite(coordinate.longitude_deg)
        && std::isfinite(coordinate.altitude_km)
        && std::abs(coordinate.latitude_deg) <= k_max_latitude_deg;
}

}  // namespace

double spherical_distance_km(const GeodeticCoordinate& from, const GeodeticCoordinate& to, double earth_radius_km) noexcept {
    if (!is_well_formed(from) || !is_well_formed(to) || !std::isfinite(earth_radius_km)) {
        return std::numeric_limits<double>::infinity();
    }

    const double lat1 = degrees_to_radians(from.latitude_deg);
    const double lat2 = degrees_to_radians(to.latitude_deg);
    const double delta_lat = lat2 - lat1;
    const double delta_lon = degrees_to_radians(to.longitude_deg - from.longitude_deg);

    const double a = std::pow(std::sin(delta_lat / 2.0), 2)
        + std::cos(lat1) * std::cos(lat2) * std::pow(std::sin(delta_lon / 2.0), 2);
    const double c = 2.0 * std::asin(std::sqrt(std::clamp(a, 0.0, 1.0)));
    const double ground_km = earth_radius_km * c;
    const double height_km = std::abs(to.altitude_km - from.altitude_km);
    return std::sqrt(ground_km * ground_km + height_km * height_km);
}

VisibilityWindowList find_visibility_windows(const Trajectory& trajectory,
                                             const PositionFunction& position_fn,
                                             double threshold_km,
                                             double earth_radius_km) {
    VisibilityWindowList windows;
    std::optional<VisibilityWindow> optional_open;

    const auto close_window = [&](std::size_t end_index) {
        VisibilityWindow window = optional_open.value();
        window.end_index = end_index;
        const Duration span = trajectory[end_index].time - trajectory[window.start_index].time;
        window.duration_s = std::max(0.0, span.count());
        windows.push_back(window);
        optional_open.reset();
    };

    for (std::size_t index = 0; index < trajectory.size(); ++index) {
        const TrajectorySample& sample = trajectory[index];
        double distance_km = std::numeric_limits<double>::infinity();
        if (position_fn) {
            const std::optional<GeodeticCoordinate> optional_observer = position_fn(sample);
            if (optional_observer.has_value()) {
                distance_km = spherical_distance_km(sample.position, optional_observer.value(), earth_radius_km);
            }
        }

        if (distance_km <= threshold_km) {
            if (!optional_open.has_value()) {
                optional_open = VisibilityWindow{index, index, 0.0, distance_km};
            } else {
                optional_open->min_distance_km = std::min(optional_open->min_distance_km, distance_km);
            }
        } else if (optional_open.has_value()) {
            close_window(index - 1);
        }
    }

    if (optional_open.has_value()) {
        close_window(trajectory.size() - 1);
    }
    return windows;
}

double distance_confidence(const std::vector<double>& distances_km, const VisibilityWindowList& windows) noexcept {
    if (distances_km.empty()) {
        return 0.0;
    }
    const bool all_finite = std::all_of(distances_km.begin(), distances_km.end(), [](double value) {
        return std::isfinite(value);
    });
    if (!all_finite) {
        return 0.0;
    }

    const double count = static_cast<double>(distances_km.size());
    const double mean = std::accumulate(distances_km.begin(), distances_km.end(), 0.0) / count;
    double variance = 0.0;
    for (const double value : distances_km) {
        variance += (value - mean) * (value - mean);
    }
    variance /= count;

    const double stability_score = std::max(0.0, 1.0 - variance / k_variance_normalizer_km2);
    const double coverage_score = std::min(1.0, static_cast<double>(windows.size()) / k_full_coverage_windows);
    const double confidence = (stability_score + coverage_score) / 2.0;
    if (!std::isfinite(confidence)) {
        return 0.0;
    }
    return std::clamp(confidence, 0.0, 1.0);
}

CartesianPosition to_cartesian(const GeodeticCoordinate& coordinate, double earth_radius_km) noexcept {
    const double lat = degrees_to_radians(coordinate.latitude_deg);
    const double lon = degrees_to_radians(coordinate.longitude_deg);
    const double radius = earth_radius_km + coordinate.altitude_km;
    return CartesianPosition{
        radius * std::cos(lat) * std::cos(lon),
        radius * std::cos(lat) * std::sin(lon),
        radius * std::sin(lat)
    };
}

}  // namespace rolling_planner
