#include "rolling_planner/gdop_calculator.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

#include <fmt/format.h>

namespace rolling_planner {

namespace {
constexpr double k_coincident_distance_km{1e-9}; /**< Below this range a platform has no usable line of sight. */

bool diagonal_is_valid(const Eigen::Matrix4d& weights) {
    for (Eigen::Index index = 0; index < 4; ++index) {
        const double value = weights(index, index);
        if (!std::isfinite(value) || value < 0.0) {
            return false;
        }
    }
    return true;
}

constexpr double k_radians_to_degrees{180.0 / 3.14159265358979323846};

Eigen::Vector3d line_of_sight(const CartesianPosition& platform, const CartesianPosition& observer) {
    return Eigen::Vector3d{platform.x_km - observer.x_km, platform.y_km - observer.y_km, platform.z_km - observer.z_km};
}

double population_stddev(const std::vector<double>& values) {
    const double mean = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
    double squared_total = 0.0;
    for (const double value : values) {
        squared_total += (value - mean) * (value - mean);
    }
    return std::sqrt(squared_total / static_cast<double>(values.size()));
}

double safe_root(double sum) noexcept {
    if (!std::isfinite(sum) || sum < 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    return std::sqrt(sum);
}
}  // namespace

std::string_view to_string(GeometryQuality quality) noexcept {
    switch (quality) {
        case GeometryQuality::Excellent:
            return "excellent";
        case GeometryQuality::Good:
            return "good";
        case GeometryQuality::Fair:
            return "fair";
        case GeometryQuality::Poor:
            return "poor";
        case GeometryQuality::Bad:
            return "bad";
    }
    return "bad";
}

GeometryQuality evaluate_geometry_quality(double gdop) noexcept {
    if (gdop <= 1.0) {
        return GeometryQuality::Excellent;
    }
    if (gdop <= 2.0) {
        return GeometryQuality::Good;
    }
    if (gdop <= 5.0) {
        return GeometryQuality::Fair;
    }
    if (gdop <= 10.0) {
        return GeometryQuality::Poor;
    }
    return GeometryQuality::Bad;
}

GdopCalculator::GdopCalculator()
    : logger_(get_logger()) {}

GdopResult GdopCalculator::calculate(const std::vector<CartesianPosition>& platform_positions,
                                     const CartesianPosition& observer) const {
    GdopResult result{};
    result.platform_count = platform_positions.size();

    if (platform_positions.size() < k_min_platforms) {
        result.error = fmt::format("Insufficient platforms: {} < {}", platform_positions.size(), k_min_platforms);
        logger_->warn(R"({{"component":"gdop","error":"{}"}})", result.error);
        return result;
    }

    const Eigen::MatrixX4d design_matrix = build_design_matrix(platform_positions, observer);
    if (design_matrix.col(3).sum() == 0.0) {
        result.error = "No usable line-of-sight vectors";
        logger_->warn(R"({{"component":"gdop","error":"{}"}})", result.error);
        return result;
    }

    const std::optional<Eigen::Matrix4d> optional_weights =
        weight_matrix(design_matrix, result.used_pseudo_inverse, result.condition_number);
    if (!optional_weights.has_value()) {
        result.error = "Weight matrix inversion failed";
        logger_->error(R"({{"component":"gdop","error":"{}"}})", result.error);
        return result;
    }

    const Eigen::Matrix4d& weights = optional_weights.value();
    if (!diagonal_is_valid(weights)) {
        result.error = fmt::format("Invalid weight diagonal q11={} q22={} q33={} q44={}",
                                   weights(0, 0), weights(1, 1), weights(2, 2), weights(3, 3));
        logger_->warn(R"({{"component":"gdop","error":"{}"}})", result.error);
        return result;
    }

    result.gdop = gdop_value(weights);
    if (!std::isfinite(result.gdop)) {
        result.error = "GDOP sum under root is negative";
        logger_->warn(R"({{"component":"gdop","error":"{}"}})", result.error);
        return result;
    }

    result.pdop = pdop_value(weights);
    result.hdop = hdop_value(weights);
    result.vdop = vdop_value(weights);
    result.tdop = tdop_value(weights);
    result.quality = evaluate_geometry_quality(result.gdop);
    result.success = true;

    logger_->debug(R"({{"component":"gdop","platforms":{},"gdop":{:.3f},"quality":"{}"}})",
                   result.platform_count,
                   result.gdop,
                   to_string(result.quality));
    return result;
}

GeometryMetrics GdopCalculator::geometry_metrics(const std::vector<CartesianPosition>& platform_positions,
                                                 const CartesianPosition& observer) const {
    GeometryMetrics metrics{};
    if (platform_positions.size() < k_min_platforms) {
        metrics.error = fmt::format("Insufficient platforms: {} < {}", platform_positions.size(), k_min_platforms);
        logger_->warn(R"({{"component":"gdop","metric":"geometry","error":"{}"}})", metrics.error);
        return metrics;
    }

    std::vector<Eigen::Vector3d> list_sight;
    list_sight.reserve(platform_positions.size());
    for (const CartesianPosition& platform : platform_positions) {
        list_sight.push_back(line_of_sight(platform, observer));
    }

    for (std::size_t first = 0; first < list_sight.size(); ++first) {
        for (std::size_t second = first + 1; second < list_sight.size(); ++second) {
            const double norms = list_sight[first].norm() * list_sight[second].norm();
            if (norms < k_coincident_distance_km * k_coincident_distance_km) {
                metrics.separation_angles_deg.push_back(0.0);
                continue;
            }
            const double cosine = std::clamp(list_sight[first].dot(list_sight[second]) / norms, -1.0, 1.0);
            metrics.separation_angles_deg.push_back(std::acos(cosine) * k_radians_to_degrees);
        }
    }

    for (const Eigen::Vector3d& sight : list_sight) {
        const double horizontal = std::hypot(sight.x(), sight.y());
        metrics.elevation_angles_deg.push_back(std::atan2(sight.z(), horizontal) * k_radians_to_degrees);
        double azimuth = std::atan2(sight.y(), sight.x()) * k_radians_to_degrees;
        if (azimuth < 0.0) {
            azimuth += 360.0;
        }
        metrics.azimuth_angles_deg.push_back(azimuth);
    }

    const auto [iterator_min, iterator_max] =
        std::minmax_element(metrics.elevation_angles_deg.begin(), metrics.elevation_angles_deg.end());
    metrics.min_elevation_deg = *iterator_min;
    metrics.max_elevation_deg = *iterator_max;
    metrics.elevation_spread_deg = metrics.max_elevation_deg - metrics.min_elevation_deg;

    const double azimuth_uniformity = std::max(0.0, 1.0 - population_stddev(metrics.azimuth_angles_deg) / 180.0);
    const double elevation_uniformity = std::min(1.0, metrics.elevation_spread_deg / 90.0);
    metrics.uniformity_score = (azimuth_uniformity + elevation_uniformity) / 2.0;
    metrics.success = true;
    return metrics;
}

Eigen::MatrixX4d GdopCalculator::build_design_matrix(const std::vector<CartesianPosition>& platform_positions,
                                                     const CartesianPosition& observer) {
    Eigen::MatrixX4d design_matrix = Eigen::MatrixX4d::Zero(static_cast<Eigen::Index>(platform_positions.size()), 4);
    for (std::size_t index = 0; index < platform_positions.size(); ++index) {
        const CartesianPosition& platform = platform_positions[index];
        const double dx = platform.x_km - observer.x_km;
        const double dy = platform.y_km - observer.y_km;
        const double dz = platform.z_km - observer.z_km;
        const double range = std::sqrt(dx * dx + dy * dy + dz * dz);
        if (!std::isfinite(range) || range < k_coincident_distance_km) {
            continue;
        }
        const auto row = static_cast<Eigen::Index>(index);
        design_matrix(row, 0) = dx / range;
        design_matrix(row, 1) = dy / range;
        design_matrix(row, 2) = dz / range;
        design_matrix(row, 3) = 1.0;
    }
    return design_matrix;
}

std::optional<Eigen::Matrix4d> GdopCalculator::weight_matrix(const Eigen::MatrixX4d& design_matrix,
                                                             bool& used_pseudo_inverse,
                                                             double& condition_number) const {
    const Eigen::Matrix4d normal_matrix = design_matrix.transpose() * design_matrix;

    const Eigen::JacobiSVD<Eigen::Matrix4d> svd(normal_matrix);
    const auto& singular_values = svd.singularValues();
    const double smallest = singular_values(singular_values.size() - 1);
    condition_number = smallest > 0.0 ? singular_values(0) / smallest : std::numeric_limits<double>::infinity();

    const auto pseudo_inverse = [&]() -> std::optional<Eigen::Matrix4d> {
        used_pseudo_inverse = true;
        const Eigen::Matrix4d inverse = normal_matrix.completeOrthogonalDecomposition().pseudoInverse();
        if (!inverse.allFinite()) {
            return std::nullopt;
        }
        return inverse;
    };

    if (!std::isfinite(condition_number) || condition_number > k_max_condition_number) {
        logger_->warn(R"({{"component":"gdop","condition_number":{:.3e},"fallback":"pseudo_inverse"}})", condition_number);
        return pseudo_inverse();
    }

    const Eigen::FullPivLU<Eigen::Matrix4d> lu(normal_matrix);
    if (!lu.isInvertible()) {
        logger_->warn(R"({{"component":"gdop","fallback":"pseudo_inverse","reason":"singular"}})");
        return pseudo_inverse();
    }
    used_pseudo_inverse = false;
    const Eigen::Matrix4d inverse = lu.inverse();
    if (!inverse.allFinite()) {
        return pseudo_inverse();
    }
    return inverse;
}

double GdopCalculator::gdop_value(const Eigen::Matrix4d& weights) noexcept {
    return safe_root(weights(0, 0) + weights(1, 1) + weights(2, 2) + weights(3, 3));
}

double GdopCalculator::pdop_value(const Eigen::Matrix4d& weights) noexcept {
    return safe_root(weights(0, 0) + weights(1, 1) + weights(2, 2));
}

double GdopCalculator::hdop_value(const Eigen::Matrix4d& weights) noexcept {
    return safe_root(weights(0, 0) + weights(1, 1));
}

double GdopCalculator::vdop_value(const Eigen::Matrix4d& weights) noexcept {
    return safe_root(weights(2, 2));
}

double GdopCalculator::tdop_value(const Eigen::Matrix4d& weights) noexcept {
    return safe_root(weights(3, 3));
}

}  // namespace rolling_planner
