// === Platform Contracts ======================================================
//
// Narrow interfaces through which the planner reaches tracking platforms it
// does not own: the registry that enumerates them, the oracle that reports
// their positions, and the per-platform task intake.

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "rolling_planner/target.hpp"
#include "rolling_planner/types.hpp"

namespace rolling_planner {

/** @brief Observation window attached to a dispatched task. */
struct TaskWindow final {
    SimTimePoint start{};
    SimTimePoint end{};
};

/** @brief Unit of work handed to a platform for one target. */
struct TrackingTask final {
    std::string task_id{};
    std::string target_id{};
    double priority{};
    TaskWindow window{};
};

/** @brief Address of a tracking platform. */
class PlatformHandle {
  public:
    virtual ~PlatformHandle() = default;

    /** @brief Stable platform identifier. */
    [[nodiscard]] virtual const std::string& identifier() const noexcept = 0;

    /**
     * @brief Accept a tracking task.
     *
     * Returns false (or throws) when the platform rejects the task. Accepting
     * a task typically opens a collaborative session in the session registry.
     */
    virtual bool receive_task(const TrackingTask& task, const Target& target) = 0;
};

using PlatformHandlePtr = std::shared_ptr<PlatformHandle>;

/** @brief Platforms keyed by identifier; iteration is in ascending id order. */
using PlatformMap = std::map<std::string, PlatformHandlePtr>;

/** @brief Enumerates the platforms currently available for assignment. */
class PlatformRegistry {
  public:
    virtual ~PlatformRegistry() = default;

    [[nodiscard]] virtual PlatformMap all_platforms() const = 0;
};

/** @brief Black-box source of platform positions. */
class PositionOracle {
  public:
    virtual ~PositionOracle() = default;

    /** @brief Position of @p platform_id at @p time, or std::nullopt if unknown. */
    [[nodiscard]] virtual std::optional<GeodeticCoordinate> position_of(const std::string& platform_id,
                                                                         SimTimePoint time) const = 0;
};

}  // namespace rolling_planner
