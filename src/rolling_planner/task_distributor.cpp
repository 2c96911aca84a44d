#include "rolling_planner/task_distributor.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <limits>
#include <numeric>
#include <set>
#include <stdexcept>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace rolling_planner {

namespace {
constexpr double k_infinity{std::numeric_limits<double>::infinity()};

using RowEntry = std::pair<std::string, DistanceRow>;

std::string make_task_id(const std::string& target_id, const std::string& platform_id) {
    return fmt::format("track_{}_{}", target_id, platform_id);
}
}  // namespace

double DistanceResult::weighted_score() const noexcept {
    if (!std::isfinite(min_distance_km)) {
        return k_infinity;
    }
    return min_distance_km * (2.0 - std::clamp(confidence, 0.0, 1.0));
}

TaskDistributor::TaskDistributor(DistributorConfig config, const PositionOracle& oracle, const Clock& clock)
    : config_(config),
      oracle_(oracle),
      clock_(clock),
      logger_(get_logger()) {
    if (config_.visibility_threshold_km <= 0.0) {
        throw std::invalid_argument("TaskDistributor visibility threshold must be positive");
    }
    if (config_.earth_radius_km <= 0.0) {
        throw std::invalid_argument("TaskDistributor earth radius must be positive");
    }
    config_.worker_count = std::max<std::size_t>(1, config_.worker_count);
}

const DistributorConfig& TaskDistributor::config() const noexcept {
    return config_;
}

DistributionResult TaskDistributor::distribute(const TargetList& targets, const PlatformMap& platforms) {
    DistributionResult result{};
    if (targets.empty() || platforms.empty()) {
        logger_->warn("Distribution skipped: {} targets, {} platforms", targets.size(), platforms.size());
        for (const Target& target : targets) {
            result.unassigned_targets.push_back(target.identifier);
        }
        return result;
    }

    logger_->info("Distributing {} targets across {} platforms", targets.size(), platforms.size());
    result.matrix = build_distance_matrix(targets, platforms);
    result.assignment = select_assignments(targets, result.matrix, result.unassigned_targets);
    log_distribution(result.assignment);

    result.dispatch_failures = dispatch(result.assignment, targets, platforms);
    const std::size_t assigned_count = std::accumulate(
        result.assignment.begin(), result.assignment.end(), std::size_t{0},
        [](std::size_t total, const auto& entry) { return total + entry.second.size(); });
    result.dispatched = assigned_count - result.dispatch_failures;
    return result;
}

DistanceMatrix TaskDistributor::build_distance_matrix(const TargetList& targets, const PlatformMap& platforms) const {
    DistanceMatrix matrix;
    if (targets.empty() || platforms.empty()) {
        return matrix;
    }

    std::size_t target_budget = targets.size();
    if (targets.size() * platforms.size() > config_.max_matrix_pairs) {
        target_budget = config_.max_matrix_pairs / platforms.size();
        logger_->warn(
            R"({{"component":"distributor","event":"matrix_capped","pairs":{},"cap":{},"targets_evaluated":{}}})",
            targets.size() * platforms.size(),
            config_.max_matrix_pairs,
            target_budget
        );
    }

    const SimTimePoint now = clock_.simulation_time();
    const std::size_t shard_count = std::min(config_.worker_count, std::max<std::size_t>(1, target_budget));
    const std::size_t shard_size = (target_budget + shard_count - 1) / std::max<std::size_t>(1, shard_count);

    std::vector<std::thread> list_threads;
    std::vector<std::vector<RowEntry>> list_shard_rows(shard_count);
    std::vector<std::exception_ptr> list_shard_errors(shard_count);
    for (std::size_t shard = 0; shard < shard_count; ++shard) {
        const std::size_t begin = shard * shard_size;
        const std::size_t end = std::min(target_budget, begin + shard_size);
        if (begin >= end) {
            break;
        }
        list_threads.emplace_back([this, &targets, &platforms, &list_shard_rows, &list_shard_errors, shard, begin, end, now]() {
            try {
                std::vector<RowEntry>& rows = list_shard_rows[shard];
                rows.reserve(end - begin);
                for (std::size_t index = begin; index < end; ++index) {
                    const Target& target = targets[index];
                    DistanceRow row;
                    for (const auto& [platform_id, platform] : platforms) {
                        row.emplace(platform_id, compute_distance(target, platform_id, now));
                    }
                    rows.emplace_back(target.identifier, std::move(row));
                }
            } catch (const std::exception&) {
                list_shard_errors[shard] = std::current_exception();
            }
        });
    }
    for (std::thread& thread : list_threads) {
        thread.join();
    }

    for (std::size_t shard = 0; shard < shard_count; ++shard) {
        if (list_shard_errors[shard] != nullptr) {
            std::rethrow_exception(list_shard_errors[shard]);
        }
        for (RowEntry& entry : list_shard_rows[shard]) {
            matrix.insert_or_assign(std::move(entry.first), std::move(entry.second));
        }
    }

    for (std::size_t index = target_budget; index < targets.size(); ++index) {
        logger_->warn("Target {} skipped by matrix cap", targets[index].identifier);
    }

    logger_->info("Distance matrix computed: {}x{}", matrix.size(), platforms.size());
    return matrix;
}

DistanceResult TaskDistributor::compute_distance(const Target& target,
                                                 const std::string& platform_id,
                                                 SimTimePoint time) const {
    DistanceResult result{};
    result.target_id = target.identifier;
    result.platform_id = platform_id;
    result.min_distance_km = k_infinity;
    result.avg_distance_km = k_infinity;
    result.closest_approach_time = time;

    const std::optional<GeodeticCoordinate> optional_position = oracle_.position_of(platform_id, time);
    if (!optional_position.has_value()) {
        logger_->warn("No position for platform {}; distance to {} is unbounded", platform_id, target.identifier);
        return result;
    }
    const GeodeticCoordinate platform_position = optional_position.value();

    std::vector<double> distances_km;
    distances_km.reserve(target.trajectory.size());
    for (const TrajectorySample& sample : target.trajectory) {
        const double distance_km = spherical_distance_km(sample.position, platform_position, config_.earth_radius_km);
        distances_km.push_back(distance_km);
        if (distance_km < result.min_distance_km) {
            result.min_distance_km = distance_km;
            result.closest_approach_time = sample.time;
        }
    }
    if (!distances_km.empty()) {
        result.avg_distance_km = std::accumulate(distances_km.begin(), distances_km.end(), 0.0)
            / static_cast<double>(distances_km.size());
    }

    result.visibility_windows = find_visibility_windows(
        target.trajectory,
        [&platform_position](const TrajectorySample&) -> std::optional<GeodeticCoordinate> { return platform_position; },
        config_.visibility_threshold_km,
        config_.earth_radius_km
    );
    result.confidence = distance_confidence(distances_km, result.visibility_windows);
    return result;
}

Assignment TaskDistributor::select_assignments(const TargetList& targets,
                                               const DistanceMatrix& matrix,
                                               IdList& unassigned_targets) {
    auto logger = get_logger();
    Assignment assignment;
    std::set<std::string> set_seen;
    for (const Target& target : targets) {
        if (!set_seen.insert(target.identifier).second) {
            logger->warn("Target {} listed more than once; duplicate ignored", target.identifier);
            continue;
        }
        const auto iterator_row = matrix.find(target.identifier);
        if (iterator_row == matrix.end() || iterator_row->second.empty()) {
            logger->warn("Target {} has no distance results; not assigned", target.identifier);
            unassigned_targets.push_back(target.identifier);
            continue;
        }

        const DistanceResult* best_result = nullptr;
        double best_score = k_infinity;
        for (const auto& [platform_id, distance_result] : iterator_row->second) {
            const double score = distance_result.weighted_score();
            if (score < best_score) {
                best_score = score;
                best_result = &distance_result;
            }
        }

        if (best_result == nullptr) {
            logger->warn("Target {} has no platform within reach; not assigned", target.identifier);
            unassigned_targets.push_back(target.identifier);
            continue;
        }

        assignment[best_result->platform_id].push_back(target.identifier);
        logger->info("Target {} assigned to platform {} (score {:.2f} km, confidence {:.2f})",
                     target.identifier,
                     best_result->platform_id,
                     best_score,
                     best_result->confidence);
    }
    return assignment;
}

std::size_t TaskDistributor::dispatch(const Assignment& assignment, const TargetList& targets, const PlatformMap& platforms) {
    std::map<std::string, const Target*> map_targets;
    for (const Target& target : targets) {
        map_targets.emplace(target.identifier, &target);
    }

    std::size_t failure_count = 0;
    for (const auto& [platform_id, target_ids] : assignment) {
        const auto iterator_platform = platforms.find(platform_id);
        if (iterator_platform == platforms.end() || iterator_platform->second == nullptr) {
            logger_->warn("Platform {} not found; {} tasks dropped", platform_id, target_ids.size());
            failure_count += target_ids.size();
            continue;
        }
        PlatformHandle& platform = *iterator_platform->second;

        for (const std::string& target_id : target_ids) {
            const auto iterator_target = map_targets.find(target_id);
            if (iterator_target == map_targets.end()) {
                logger_->warn("Target {} not found for dispatch", target_id);
                ++failure_count;
                continue;
            }
            const Target& target = *iterator_target->second;

            TrackingTask task{};
            task.task_id = make_task_id(target_id, platform_id);
            task.target_id = target_id;
            task.priority = target.priority;
            task.window = TaskWindow{target.launch_time, target.impact_time()};

            try {
                logger_->info("Dispatching task {} to platform {}", task.task_id, platform_id);
                if (!platform.receive_task(task, target)) {
                    logger_->error(R"({{"component":"distributor","task":"{}","platform":"{}","error":"rejected"}})",
                                   task.task_id,
                                   platform_id);
                    ++failure_count;
                }
            } catch (const std::exception& exc) {
                logger_->error(R"({{"component":"distributor","task":"{}","platform":"{}","error":"{}"}})",
                               task.task_id,
                               platform_id,
                               exc.what());
                ++failure_count;
            }
        }
    }
    return failure_count;
}

void TaskDistributor::log_distribution(const Assignment& assignment) const {
    std::size_t total_targets = 0;
    for (const auto& [platform_id, target_ids] : assignment) {
        total_targets += target_ids.size();
        logger_->info("  platform {}: {} targets [{}]", platform_id, target_ids.size(), fmt::join(target_ids, ", "));
    }
    logger_->info("Distribution summary: {} targets over {} platforms", total_targets, assignment.size());
}

}  // namespace rolling_planner
