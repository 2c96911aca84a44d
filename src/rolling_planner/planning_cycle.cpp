#include "rolling_planner/planning_cycle.hpp"

namespace rolling_planner {

std::string_view to_string(CycleState state) noexcept {
    switch (state) {
        case CycleState::Idle:
            return "idle";
        case CycleState::Initializing:
            return "initializing";
        case CycleState::CollectingTargets:
            return "collecting_targets";
        case CycleState::DistributingTasks:
            return "distributing_tasks";
        case CycleState::Discussing:
            return "discussing";
        case CycleState::GatheringResults:
            return "gathering_results";
        case CycleState::GeneratingReports:
            return "generating_reports";
        case CycleState::Completed:
            return "completed";
        case CycleState::Error:
            return "error";
    }
    return "unknown";
}

bool is_terminal(CycleState state) noexcept {
    return state == CycleState::Completed || state == CycleState::Error;
}

}  // namespace rolling_planner
