#include "rolling_planner/planning_event_bus.hpp"

namespace rolling_planner {

std::string_view to_string(PlanningEventKind kind) noexcept {
    switch (kind) {
        case PlanningEventKind::CycleStarted:
            return "cycle_started";
        case PlanningEventKind::PhaseChanged:
            return "phase_changed";
        case PlanningEventKind::DiscussionProgress:
            return "discussion_progress";
        case PlanningEventKind::CycleCompleted:
            return "cycle_completed";
        case PlanningEventKind::CycleFailed:
            return "cycle_failed";
        case PlanningEventKind::CycleForceCompleted:
            return "cycle_force_completed";
    }
    return "unknown";
}

void PlanningEventBus::publish(PlanningEvent event) {
    std::scoped_lock lock(mutex_);
    queue_events_.push(std::move(event));
}

std::optional<PlanningEvent> PlanningEventBus::try_consume() {
    std::scoped_lock lock(mutex_);
    if (queue_events_.empty()) {
        return std::nullopt;
    }
    PlanningEvent event = std::move(queue_events_.front());
    queue_events_.pop();
    return event;
}

std::size_t PlanningEventBus::pending() const {
    std::scoped_lock lock(mutex_);
    return queue_events_.size();
}

}  // namespace rolling_planner
