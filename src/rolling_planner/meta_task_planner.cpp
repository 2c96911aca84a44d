#include "rolling_planner/meta_task_planner.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

namespace rolling_planner {

namespace {
SystemClock::duration to_system_duration(Duration duration) {
    return std::chrono::duration_cast<SystemClock::duration>(duration);
}
}  // namespace

Duration MetaTaskWindow::duration() const {
    return end - start;
}

MetaTaskPlanner::MetaTaskPlanner(MetaTaskConfig config)
    : config_(config),
      logger_(get_logger()) {
    if (config_.fixed_duration.count() <= 0.0) {
        throw std::invalid_argument("MetaTaskPlanner window duration must be positive");
    }
    if (config_.overlap.count() < 0.0 || config_.overlap >= config_.fixed_duration) {
        throw std::invalid_argument("MetaTaskPlanner overlap must be shorter than the window");
    }
}

const MetaTaskConfig& MetaTaskPlanner::config() const noexcept {
    return config_;
}

std::optional<MetaTaskSet> MetaTaskPlanner::create_meta_task_set(SimTimePoint collection_time, const TargetList& targets) const {
    if (targets.empty()) {
        logger_->warn("No targets in flight; meta-task set not created");
        return std::nullopt;
    }

    MetaTaskSet meta_task_set{};
    meta_task_set.collection_time = collection_time;
    meta_task_set.interval_start = collection_time;

    SimTimePoint latest_end = collection_time;
    for (const Target& target : targets) {
        meta_task_set.target_ids.push_back(target.identifier);
        latest_end = std::max(latest_end, target.impact_time());
    }
    if (latest_end == collection_time) {
        latest_end = collection_time + to_system_duration(config_.max_extension);
        logger_->warn("No impact time beyond collection time; extending interval by {:.0f}s", config_.max_extension.count());
    }
    meta_task_set.interval_end = latest_end;

    const SystemClock::duration window_length = to_system_duration(config_.fixed_duration);
    const SystemClock::duration window_step = to_system_duration(config_.fixed_duration - config_.overlap);

    SimTimePoint window_start = meta_task_set.interval_start;
    while (window_start < meta_task_set.interval_end) {
        if (meta_task_set.windows.size() >= config_.max_windows) {
            logger_->warn("Meta-task window limit {} reached; remaining interval dropped", config_.max_windows);
            break;
        }
        MetaTaskWindow window{};
        window.window_id = fmt::format("MetaWindow_{:03d}", meta_task_set.windows.size());
        window.start = window_start;
        window.end = std::min(window_start + window_length, meta_task_set.interval_end);
        for (const Target& target : targets) {
            if (target.launch_time < window.end && target.impact_time() > window.start) {
                window.target_ids.push_back(target.identifier);
            }
        }
        meta_task_set.windows.push_back(std::move(window));
        window_start += window_step;
    }

    logger_->info("Meta-task set created: {} windows over {:.0f}s for {} targets",
                  meta_task_set.windows.size(),
                  Duration{meta_task_set.interval_end - meta_task_set.interval_start}.count(),
                  meta_task_set.target_ids.size());
    return meta_task_set;
}

}  // namespace rolling_planner
