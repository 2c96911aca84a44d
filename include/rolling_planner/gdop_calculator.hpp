// === GDOP Calculator =========================================================
//
// Geometric dilution of precision for a set of platform positions seen from an
// observer. The normal matrix is inverted with Eigen, falling back to a
// pseudo-inverse when the matrix is ill-conditioned. Failures are reported
// through `GdopResult::success` rather than exceptions.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <Eigen/Dense>

#include "rolling_planner/logging.hpp"
#include "rolling_planner/types.hpp"

namespace rolling_planner {

/** @brief Qualitative band for a GDOP value. */
enum class GeometryQuality {
    Excellent,  /**< GDOP <= 1 */
    Good,       /**< GDOP <= 2 */
    Fair,       /**< GDOP <= 5 */
    Poor,       /**< GDOP <= 10 */
    Bad         /**< GDOP > 10 */
};

[[nodiscard]] std::string_view to_string(GeometryQuality quality) noexcept;

/** @brief Map a GDOP value onto its quality band. */
[[nodiscard]] GeometryQuality evaluate_geometry_quality(double gdop) noexcept;

/** @brief Outcome of a dilution-of-precision computation. */
struct GdopResult final {
    bool success{};
    std::string error{};
    std::size_t platform_count{};
    double gdop{};
    double pdop{};
    double hdop{};
    double vdop{};
    double tdop{};
    GeometryQuality quality{GeometryQuality::Bad};
    bool used_pseudo_inverse{};
    double condition_number{};
};

/**
 * @brief Angular spread of platforms around an observer.
 *
 * Elevation and azimuth are measured in the observer-centred Cartesian frame:
 * elevation from the x-y plane, azimuth counter-clockwise from +x in [0, 360).
 */
struct GeometryMetrics final {
    bool success{};
    std::string error{};
    std::vector<double> separation_angles_deg{};  /**< One entry per platform pair. */
    std::vector<double> elevation_angles_deg{};
    std::vector<double> azimuth_angles_deg{};
    double min_elevation_deg{};
    double max_elevation_deg{};
    double elevation_spread_deg{};
    /** Mean of `max(0, 1 - stddev(azimuth) / 180)` and `min(1, elevation_spread / 90)`. */
    double uniformity_score{};
};

/** @brief Computes GDOP and its sub-factors from a line-of-sight design matrix. */
class GdopCalculator final {
  public:
    static constexpr std::size_t k_min_platforms{4};
    static constexpr double k_max_condition_number{1e12};

    GdopCalculator();

    /**
     * @brief Compute all dilution factors for @p platform_positions seen from @p observer.
     *
     * Requires at least four platforms. Platforms coincident with the observer
     * contribute a zero row. Returns a failure result when the count is too
     * small or when the weight matrix diagonal is negative or non-finite.
     */
    [[nodiscard]] GdopResult calculate(const std::vector<CartesianPosition>& platform_positions,
                                       const CartesianPosition& observer) const;

    /** @brief Separation, elevation and azimuth angles of @p platform_positions; needs four platforms. */
    [[nodiscard]] GeometryMetrics geometry_metrics(const std::vector<CartesianPosition>& platform_positions,
                                                   const CartesianPosition& observer) const;

    /** @brief Weight matrix `Q = (A^T A)^-1`, or std::nullopt if both inversions fail. */
    [[nodiscard]] std::optional<Eigen::Matrix4d> weight_matrix(const Eigen::MatrixX4d& design_matrix,
                                                               bool& used_pseudo_inverse,
                                                               double& condition_number) const;

    [[nodiscard]] static Eigen::MatrixX4d build_design_matrix(const std::vector<CartesianPosition>& platform_positions,
                                                              const CartesianPosition& observer);
    [[nodiscard]] static double gdop_value(const Eigen::Matrix4d& weights) noexcept;
    [[nodiscard]] static double pdop_value(const Eigen::Matrix4d& weights) noexcept;
    [[nodiscard]] static double hdop_value(const Eigen::Matrix4d& weights) noexcept;
    [[nodiscard]] static double vdop_value(const Eigen::Matrix4d& weights) noexcept;
    [[nodiscard]] static double tdop_value(const Eigen::Matrix4d& weights) noexcept;

  private:
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace rolling_planner
