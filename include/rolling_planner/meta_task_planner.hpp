// === Meta-Task Planner =======================================================
//
// Groups the targets of one planning cycle into fixed-length, overlapping time
// windows. The interval runs from the collection time to the latest predicted
// impact among the targets; each window lists the targets in flight during it.

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rolling_planner/logging.hpp"
#include "rolling_planner/target.hpp"
#include "rolling_planner/types.hpp"

namespace rolling_planner {

struct MetaTaskConfig final {
    Duration fixed_duration{300.0};  /**< Length of each window. */
    Duration overlap{60.0};          /**< Overlap between consecutive windows. */
    Duration max_extension{600.0};   /**< Interval length used when no impact time is known. */
    std::size_t max_windows{100};
};

struct MetaTaskWindow final {
    std::string window_id{};
    SimTimePoint start{};
    SimTimePoint end{};
    IdList target_ids{};

    [[nodiscard]] Duration duration() const;
};

struct MetaTaskSet final {
    SimTimePoint collection_time{};
    SimTimePoint interval_start{};
    SimTimePoint interval_end{};
    std::vector<MetaTaskWindow> windows{};
    IdList target_ids{};
};

class MetaTaskPlanner final {
  public:
    explicit MetaTaskPlanner(MetaTaskConfig config);

    [[nodiscard]] const MetaTaskConfig& config() const noexcept;

    /** @brief Build the window set for @p targets, or std::nullopt when there is nothing to plan. */
    [[nodiscard]] std::optional<MetaTaskSet> create_meta_task_set(SimTimePoint collection_time,
                                                                  const TargetList& targets) const;

  private:
    MetaTaskConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace rolling_planner
