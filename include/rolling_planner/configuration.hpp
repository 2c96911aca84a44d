// === Configuration ===========================================================
//
// Exposes the strongly-typed configuration consumed by the planner runtime.
// `ConfigurationLoader` translates `ROLLING_PLANNER_*` environment variables
// into these structures so downstream modules never touch `std::getenv`
// directly.

#pragma once

#include <string>

#include "rolling_planner/planning_cycle_manager.hpp"
#include "rolling_planner/types.hpp"

namespace rolling_planner {

/**
 * @brief Immutable bundle of runtime knobs for the rolling planner.
 *
 * Every field is populated by ConfigurationLoader; consumers treat the values
 * as authoritative.
 */
struct Configuration final {
    std::string log_directory{};     /**< Destination directory for structured logs. */
    std::string report_directory{};  /**< Root directory for per-session report artifacts. */
    PlanningCycleConfig planning{};  /**< Cycle, distributor, monitor and meta-task settings. */
    double update_hz{};              /**< Runtime tick rate in Hertz. */
};

/** @brief Hydrates Configuration from environment variables. */
class ConfigurationLoader final {
  public:
    /** @brief Initializes the shared logger as a side effect. */
    static Configuration load();

  private:
    static double load_update_hz();
};

}  // namespace rolling_planner
