#include "rolling_planner/discussion_monitor.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace rolling_planner {

namespace {
constexpr std::size_t k_summary_id_length{8};
}  // namespace

Duration WaitPolicy::max_wait() const {
    const Duration estimated = base_time_per_iteration * (static_cast<double>(max_iterations) * safety_margin);
    return std::min(estimated, absolute_cap);
}

std::string_view to_string(CompletionReason reason) noexcept {
    switch (reason) {
        case CompletionReason::ExplicitlyCompleted:
            return "explicitly_completed";
        case CompletionReason::MaxIterationsReached:
            return "max_iterations_reached";
        case CompletionReason::QualityThreshold:
            return "quality_threshold";
        case CompletionReason::TerminalStatus:
            return "terminal_status";
        case CompletionReason::SoftTimeout:
            return "soft_timeout";
        case CompletionReason::HardTimeout:
            return "hard_timeout";
        case CompletionReason::ProgressUnavailable:
            return "progress_unavailable";
        case CompletionReason::ForceCleaned:
            return "force_cleaned";
    }
    return "unknown";
}

DiscussionMonitor::DiscussionMonitor(DiscussionMonitorConfig config,
                                     SessionRegistry& registry,
                                     Clock& clock,
                                     PlanningEventBus& event_bus)
    : config_(config),
      registry_(registry),
      clock_(clock),
      event_bus_(event_bus),
      logger_(get_logger()) {
    if (config_.poll_interval.count() <= 0.0) {
        throw std::invalid_argument("DiscussionMonitor poll interval must be positive");
    }
    if (config_.hard_timeout < config_.soft_timeout) {
        throw std::invalid_argument("DiscussionMonitor hard timeout must not precede soft timeout");
    }
}

const DiscussionMonitorConfig& DiscussionMonitor::config() const noexcept {
    return config_;
}

MonitorReport DiscussionMonitor::await_completion(const IdList& session_ids,
                                                  Duration max_wait,
                                                  Duration poll_interval,
                                                  std::uint64_t cycle_number) {
    MonitorReport report{};
    const TimePoint start_time = clock_.now();

    IdList list_pending;
    for (const std::string& session_id : session_ids) {
        if (std::find(list_pending.begin(), list_pending.end(), session_id) == list_pending.end()) {
            list_pending.push_back(session_id);
        }
    }
    if (list_pending.empty()) {
        logger_->info("No active discussions to wait for");
        return report;
    }
    if (poll_interval.count() <= 0.0) {
        poll_interval = config_.poll_interval;
    }

    logger_->info("Waiting on {} discussions, max wait {:.1f}s, poll {:.1f}s",
                  list_pending.size(),
                  max_wait.count(),
                  poll_interval.count());

    while (true) {
        const TimePoint now = clock_.now();
        const Duration elapsed = now - start_time;
        if (elapsed >= max_wait) {
            break;
        }
        if (flag_stop_.load()) {
            logger_->warn("Stop requested; abandoning wait after {:.1f}s", elapsed.count());
            report.stop_observed = true;
            break;
        }

        IdList list_remaining;
        for (const std::string& session_id : list_pending) {
            const std::optional<SessionProgress> optional_progress = query_progress(session_id);
            std::optional<CompletionReason> optional_reason;
            if (!optional_progress.has_value()) {
                logger_->warn("Progress unavailable for discussion {}; treating as completed", session_id);
                optional_reason = CompletionReason::ProgressUnavailable;
            } else {
                optional_reason = classify(optional_progress.value(), now);
            }

            if (!optional_reason.has_value()) {
                list_remaining.push_back(session_id);
                continue;
            }

            SessionOutcome outcome{};
            outcome.session_id = session_id;
            outcome.reason = optional_reason.value();
            if (optional_progress.has_value()) {
                outcome.participants = optional_progress->participants;
                outcome.iteration = optional_progress->iteration;
                outcome.quality = optional_progress->quality;
            }
            logger_->info(R"({{"component":"discussion_monitor","session":"{}","reason":"{}","iteration":{},"quality":{:.3f}}})",
                          session_id,
                          to_string(outcome.reason),
                          outcome.iteration,
                          outcome.quality);
            outcome.dissolved = dissolve(session_id);
            const std::optional<SessionProgress> optional_final = query_progress(session_id);
            outcome.final_status = optional_final.has_value() ? optional_final->status : SessionStatus::Dissolved;
            report.outcomes.push_back(std::move(outcome));
        }
        list_pending = std::move(list_remaining);

        if (list_pending.empty()) {
            logger_->info("All discussions completed and dissolved");
            break;
        }

        const Duration waited = clock_.now() - start_time;
        const std::string str_summary = summarize(list_pending);
        logger_->info("Waiting... {} discussions remaining, elapsed {:.1f}s", list_pending.size(), waited.count());
        logger_->info("Iteration progress: {}", str_summary);
        event_bus_.publish(PlanningEvent{
            PlanningEventKind::DiscussionProgress,
            cycle_number,
            "discussing",
            fmt::format("remaining={} elapsed={:.1f}s {}", list_pending.size(), waited.count(), str_summary),
            SteadyClock::now()
        });

        clock_.sleep_for(poll_interval);
    }

    if (!list_pending.empty()) {
        logger_->warn("Wait ended with {} discussions still active; forcing cleanup", list_pending.size());
        std::vector<SessionOutcome> list_cleaned = force_cleanup(list_pending);
        report.force_cleaned_count = list_cleaned.size();
        for (SessionOutcome& outcome : list_cleaned) {
            report.outcomes.push_back(std::move(outcome));
        }
    }

    report.elapsed = clock_.now() - start_time;
    logger_->info("Discussion wait finished in {:.1f}s", report.elapsed.count());
    return report;
}

std::optional<CompletionReason> DiscussionMonitor::classify(const SessionProgress& progress, TimePoint now) const {
    if (progress.status == SessionStatus::Completed) {
        return CompletionReason::ExplicitlyCompleted;
    }
    if (progress.iteration >= progress.max_iterations) {
        return CompletionReason::MaxIterationsReached;
    }
    if (progress.quality >= config_.quality_threshold) {
        return CompletionReason::QualityThreshold;
    }
    if (progress.status == SessionStatus::Dissolved
        || progress.status == SessionStatus::Failed
        || progress.status == SessionStatus::ForceCleaned) {
        return CompletionReason::TerminalStatus;
    }

    const Duration elapsed = now - progress.created_at;
    if (elapsed > config_.soft_timeout && progress.iteration >= config_.soft_timeout_min_iterations) {
        logger_->warn("Discussion {} timed out after {} iterations; accepting partial result",
                      progress.session_id,
                      progress.iteration);
        return CompletionReason::SoftTimeout;
    }
    if (elapsed > config_.hard_timeout) {
        logger_->warn("Discussion {} exceeded hard timeout of {:.0f}s", progress.session_id, config_.hard_timeout.count());
        return CompletionReason::HardTimeout;
    }
    return std::nullopt;
}

std::vector<SessionOutcome> DiscussionMonitor::force_cleanup(const IdList& session_ids) {
    std::vector<SessionOutcome> list_outcomes;
    if (session_ids.empty()) {
        return list_outcomes;
    }
    logger_->warn("Force cleaning {} discussions", session_ids.size());

    for (const std::string& session_id : session_ids) {
        SessionOutcome outcome{};
        outcome.session_id = session_id;
        outcome.reason = CompletionReason::ForceCleaned;
        outcome.final_status = SessionStatus::ForceCleaned;
        const std::optional<SessionProgress> optional_progress = query_progress(session_id);
        if (optional_progress.has_value()) {
            outcome.participants = optional_progress->participants;
            outcome.iteration = optional_progress->iteration;
            outcome.quality = optional_progress->quality;
        }
        try {
            registry_.force_update_status(session_id, SessionStatus::ForceCleaned);
            registry_.remove_session(session_id);
            outcome.dissolved = true;
            logger_->info(R"({{"component":"discussion_monitor","session":"{}","action":"force_cleaned"}})", session_id);
        } catch (const std::exception& exc) {
            logger_->warn("Failed to clean discussion {}: {}", session_id, exc.what());
        }
        list_outcomes.push_back(std::move(outcome));
    }
    return list_outcomes;
}

void DiscussionMonitor::request_stop() noexcept {
    flag_stop_.store(true);
}

void DiscussionMonitor::clear_stop() noexcept {
    flag_stop_.store(false);
}

bool DiscussionMonitor::stop_requested() const noexcept {
    return flag_stop_.load();
}

std::optional<SessionProgress> DiscussionMonitor::query_progress(const std::string& session_id) const {
    try {
        return registry_.progress(session_id);
    } catch (const std::exception& exc) {
        logger_->warn("Failed to query discussion {}: {}", session_id, exc.what());
        return std::nullopt;
    }
}

bool DiscussionMonitor::dissolve(const std::string& session_id) {
    try {
        if (registry_.complete_session(session_id)) {
            logger_->info("Discussion {} dissolved", session_id);
            return true;
        }
        logger_->warn("Discussion {} could not be dissolved", session_id);
    } catch (const std::exception& exc) {
        logger_->error("Error dissolving discussion {}: {}", session_id, exc.what());
    }
    return false;
}

std::string DiscussionMonitor::summarize(const IdList& session_ids) const {
    std::vector<std::string> list_parts;
    list_parts.reserve(session_ids.size());
    for (const std::string& session_id : session_ids) {
        const std::optional<SessionProgress> optional_progress = query_progress(session_id);
        const std::string str_short_id = session_id.substr(0, k_summary_id_length);
        if (!optional_progress.has_value()) {
            list_parts.push_back(fmt::format("{}(unknown)", str_short_id));
            continue;
        }
        list_parts.push_back(fmt::format("{}({}/{}, Q:{:.2f})",
                                         str_short_id,
                                         optional_progress->iteration,
                                         optional_progress->max_iterations,
                                         optional_progress->quality));
    }
    return fmt::format("{}", fmt::join(list_parts, ", "));
}

}  // namespace rolling_planner
