// === Clock ===================================================================
//
// Time source shared by the cycle manager, distributor and discussion monitor.
// Steady time drives wait budgets and poll cadence; simulation time stamps
// cycles and feeds the platform position oracle. Injected so that bounded
// waits can be exercised against virtual time.

#pragma once

#include "rolling_planner/types.hpp"

namespace rolling_planner {

/** @brief Abstract time source with a blocking sleep primitive. */
class Clock {
  public:
    virtual ~Clock() = default;

    /** @brief Monotonic time used to measure elapsed waits. */
    [[nodiscard]] virtual TimePoint now() const = 0;
    /** @brief Current simulation time. */
    [[nodiscard]] virtual SimTimePoint simulation_time() const = 0;
    /** @brief Suspend the calling thread for @p duration. */
    virtual void sleep_for(Duration duration) = 0;
};

/** @brief Clock backed by the process steady clock and the system calendar. */
class RealClock final : public Clock {
  public:
    [[nodiscard]] TimePoint now() const override;
    [[nodiscard]] SimTimePoint simulation_time() const override;
    void sleep_for(Duration duration) override;
};

}  // namespace rolling_planner
