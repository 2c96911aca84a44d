// === Discussion Monitor ======================================================
//
// Observes the collaborative sessions opened during a planning cycle and
// blocks the Discussing phase until they converge or the bounded wait runs
// out. Sessions judged complete are dissolved through the registry; sessions
// still open at the deadline are force-cleaned.

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "rolling_planner/clock.hpp"
#include "rolling_planner/logging.hpp"
#include "rolling_planner/planning_event_bus.hpp"
#include "rolling_planner/session_registry.hpp"

namespace rolling_planner {

/**
 * @brief Derives the maximum wait for a discussion phase.
 *
 * `max_wait = min(base_time_per_iteration * max_iterations * safety_margin, absolute_cap)`.
 */
struct WaitPolicy final {
    Duration base_time_per_iteration{60.0};
    int max_iterations{5};
    double safety_margin{1.5};
    Duration absolute_cap{600.0};

    [[nodiscard]] Duration max_wait() const;
};

/** @brief Completion heuristics and poll cadence. */
struct DiscussionMonitorConfig final {
    Duration poll_interval{5.0};
    double quality_threshold{0.85};
    Duration soft_timeout{600.0};        /**< Elapsed time after which partial progress is accepted. */
    int soft_timeout_min_iterations{3};  /**< Iterations required to accept a soft timeout. */
    Duration hard_timeout{900.0};        /**< Elapsed time after which a session is done unconditionally. */
};

/** @brief Why a session stopped being tracked. */
enum class CompletionReason {
    ExplicitlyCompleted,
    MaxIterationsReached,
    QualityThreshold,
    TerminalStatus,
    SoftTimeout,
    HardTimeout,
    ProgressUnavailable,
    ForceCleaned
};

[[nodiscard]] std::string_view to_string(CompletionReason reason) noexcept;

/** @brief Final observation of one tracked session. */
struct SessionOutcome final {
    std::string session_id{};
    CompletionReason reason{CompletionReason::ProgressUnavailable};
    SessionStatus final_status{SessionStatus::Active};
    std::set<std::string> participants{};
    int iteration{};
    double quality{};
    bool dissolved{};  /**< The registry accepted the completion or cleanup call. */
};

/** @brief Summary returned when the wait finishes. */
struct MonitorReport final {
    std::vector<SessionOutcome> outcomes{};
    Duration elapsed{};
    std::size_t force_cleaned_count{};
    bool stop_observed{};
};

class DiscussionMonitor final {
  public:
    DiscussionMonitor(DiscussionMonitorConfig config,
                      SessionRegistry& registry,
                      Clock& clock,
                      PlanningEventBus& event_bus);

    [[nodiscard]] const DiscussionMonitorConfig& config() const noexcept;

    /**
     * @brief Poll @p session_ids until all complete or @p max_wait elapses.
     *
     * Returns early once nothing is left active. Sessions still active when the
     * wait ends, or when a stop is requested, are force-cleaned.
     */
    MonitorReport await_completion(const IdList& session_ids,
                                   Duration max_wait,
                                   Duration poll_interval,
                                   std::uint64_t cycle_number = 0);

    /** @brief Apply the completion heuristics to one progress snapshot. */
    [[nodiscard]] std::optional<CompletionReason> classify(const SessionProgress& progress, TimePoint now) const;

    /** @brief Force every listed session to `force_cleaned` and drop it from the registry. */
    std::vector<SessionOutcome> force_cleanup(const IdList& session_ids);

    /** @brief Ask an in-flight wait to stop at its next tick. */
    void request_stop() noexcept;
    void clear_stop() noexcept;
    [[nodiscard]] bool stop_requested() const noexcept;

  private:
    std::optional<SessionProgress> query_progress(const std::string& session_id) const;
    bool dissolve(const std::string& session_id);
    std::string summarize(const IdList& session_ids) const;

    DiscussionMonitorConfig config_;
    SessionRegistry& registry_;
    Clock& clock_;
    PlanningEventBus& event_bus_;
    std::atomic<bool> flag_stop_{false};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace rolling_planner
