// === Task Distributor ========================================================
//
// Builds the target x platform distance matrix and assigns each target to the
// platform with the lowest confidence-weighted distance, then hands each
// assignment to its platform. Matrix rows are pure and are computed in
// parallel shards; dispatch is best-effort with no retry.

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "rolling_planner/clock.hpp"
#include "rolling_planner/geometry.hpp"
#include "rolling_planner/logging.hpp"
#include "rolling_planner/platform.hpp"
#include "rolling_planner/target.hpp"

namespace rolling_planner {

/** @brief Tunables for matrix construction. */
struct DistributorConfig final {
    double visibility_threshold_km{2'000.0};
    double earth_radius_km{k_default_earth_radius_km};
    std::size_t max_matrix_pairs{250'000};  /**< Upper bound on target x platform evaluations per cycle. */
    std::size_t worker_count{4};
};

/** @brief Distance summary for one (target, platform) pair. */
struct DistanceResult final {
    std::string target_id{};
    std::string platform_id{};
    double min_distance_km{};
    double avg_distance_km{};
    SimTimePoint closest_approach_time{};
    VisibilityWindowList visibility_windows{};
    double confidence{};

    /** @brief `min_distance_km * (2 - confidence)`; low confidence inflates up to 2x. */
    [[nodiscard]] double weighted_score() const noexcept;
};

/** @brief Row of results for one target, keyed by platform id. */
using DistanceRow = std::map<std::string, DistanceResult>;
/** @brief Rows keyed by target id. */
using DistanceMatrix = std::map<std::string, DistanceRow>;
/** @brief Platform id to the target ids assigned to it. */
using Assignment = std::map<std::string, IdList>;

/** @brief Everything produced by one distribution pass. */
struct DistributionResult final {
    Assignment assignment{};
    DistanceMatrix matrix{};
    IdList unassigned_targets{};
    std::size_t dispatched{};
    std::size_t dispatch_failures{};
};

class TaskDistributor final {
  public:
    /**
     * @param config Matrix construction limits.
     * @param oracle Platform position source; must tolerate concurrent const calls.
     * @param clock Supplies the simulation time positions are sampled at.
     */
    TaskDistributor(DistributorConfig config, const PositionOracle& oracle, const Clock& clock);

    [[nodiscard]] const DistributorConfig& config() const noexcept;

    /** @brief Compute, assign, log and dispatch in one pass. */
    DistributionResult distribute(const TargetList& targets, const PlatformMap& platforms);

    [[nodiscard]] DistanceMatrix build_distance_matrix(const TargetList& targets, const PlatformMap& platforms) const;

    [[nodiscard]] DistanceResult compute_distance(const Target& target,
                                                  const std::string& platform_id,
                                                  SimTimePoint time) const;

    /**
     * @brief Nearest-platform selection over a prepared matrix.
     *
     * Platforms are visited in ascending id order and only a strictly lower
     * score replaces the incumbent, so ties resolve to the lowest id. Targets
     * without a row or with only infinite scores are appended to
     * @p unassigned_targets.
     */
    [[nodiscard]] static Assignment select_assignments(const TargetList& targets,
                                                       const DistanceMatrix& matrix,
                                                       IdList& unassigned_targets);

    /** @brief Send each assigned target to its platform; returns the failure count. */
    std::size_t dispatch(const Assignment& assignment, const TargetList& targets, const PlatformMap& platforms);

  private:
    void log_distribution(const Assignment& assignment) const;

    DistributorConfig config_;
    const PositionOracle& oracle_;
    const Clock& clock_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace rolling_planner
