// === Planning Event Bus ======================================================
//
// Provides a minimal thread-safe queue for distributing cycle and discussion
// progress events from the planner to observers (the runtime, the app, tests).

#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <string_view>

#include "rolling_planner/types.hpp"

namespace rolling_planner {

enum class PlanningEventKind {
    CycleStarted,
    PhaseChanged,
    DiscussionProgress,
    CycleCompleted,
    CycleFailed,
    CycleForceCompleted
};

[[nodiscard]] std::string_view to_string(PlanningEventKind kind) noexcept;

/** @brief Wrapper representing a single progress publication. */
struct PlanningEvent final {
    PlanningEventKind kind{PlanningEventKind::PhaseChanged};
    std::uint64_t cycle_number{};
    std::string state{};                   /**< Cycle state name at publication time. */
    std::string detail{};
    TimePoint emitted_at{SteadyClock::now()};
};

/** @brief Thread-safe FIFO used to exchange planning events. */
class PlanningEventBus final {
  public:
    /** @brief Publish an event to all consumers. */
    void publish(PlanningEvent event);
    /** @brief Attempt to consume a pending event without blocking. */
    [[nodiscard]] std::optional<PlanningEvent> try_consume();
    /** @brief Number of events waiting to be consumed. */
    [[nodiscard]] std::size_t pending() const;

  private:
    mutable std::mutex mutex_;
    std::queue<PlanningEvent> queue_events_;
};

}  // namespace rolling_planner
