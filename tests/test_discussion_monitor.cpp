#include <stdexcept>
#include <string>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "manual_clock.hpp"
#include "rolling_planner/discussion_monitor.hpp"
#include "rolling_planner/simulated_collaboration.hpp"

using namespace rolling_planner;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    rolling_planner::test::ensure_logger_initialized();
    return true;
}();

const Duration k_max_wait{30.0};
const Duration k_poll{5.0};

/** @brief Registry, clock, bus and monitor wired together for one test. */
struct MonitorHarness final {
    rolling_planner::test::ManualClock clock;
    InMemorySessionRegistry registry;
    PlanningEventBus event_bus;
    DiscussionMonitor monitor{DiscussionMonitorConfig{}, registry, clock, event_bus};

    void open(const std::string& session_id, int iteration = 0, double quality = 0.0, int max_iterations = 5) {
        SessionProgress progress{};
        progress.session_id = session_id;
        progress.participants = {"platform-a"};
        progress.max_iterations = max_iterations;
        progress.created_at = clock.now();
        registry.open_session(progress);
        if (iteration > 0 || quality > 0.0) {
            registry.record_iteration(session_id, iteration, quality);
        }
    }
};
}  // namespace

TEST_CASE("Wait policy bounds the discussion wait") {
    WaitPolicy policy{};
    REQUIRE(policy.max_wait().count() == Approx(450.0));

    policy.absolute_cap = Duration{300.0};
    REQUIRE(policy.max_wait().count() == Approx(300.0));
}

TEST_CASE("A session at its iteration limit completes on the next poll") {
    MonitorHarness harness;
    harness.open("session-max", 5, 0.1);

    const MonitorReport report = harness.monitor.await_completion({"session-max"}, k_max_wait, k_poll);

    REQUIRE(report.outcomes.size() == 1);
    REQUIRE(report.outcomes.front().reason == CompletionReason::MaxIterationsReached);
    REQUIRE(report.outcomes.front().final_status == SessionStatus::Dissolved);
    REQUIRE(report.outcomes.front().dissolved);
    REQUIRE(report.force_cleaned_count == 0);
    REQUIRE(harness.clock.sleep_count() == 0);
    REQUIRE(harness.registry.list_active_sessions().empty());
}

TEST_CASE("A session without iteration budget completes on the first poll") {
    MonitorHarness harness;
    harness.open("session-zero", 0, 0.0, 0);

    REQUIRE(harness.monitor.classify(harness.registry.progress("session-zero").value(), harness.clock.now())
            == CompletionReason::MaxIterationsReached);

    const MonitorReport report = harness.monitor.await_completion({"session-zero"}, k_max_wait, k_poll);

    REQUIRE(report.outcomes.size() == 1);
    REQUIRE(report.outcomes.front().reason == CompletionReason::MaxIterationsReached);
    REQUIRE(report.force_cleaned_count == 0);
    REQUIRE(report.elapsed.count() == Approx(0.0));
    REQUIRE(harness.clock.sleep_count() == 0);
}

TEST_CASE("A session above the quality threshold completes at iteration zero") {
    MonitorHarness harness;
    harness.open("session-quality", 0, 0.9);

    const MonitorReport report = harness.monitor.await_completion({"session-quality"}, k_max_wait, k_poll);

    REQUIRE(report.outcomes.size() == 1);
    REQUIRE(report.outcomes.front().reason == CompletionReason::QualityThreshold);
    REQUIRE(report.outcomes.front().iteration == 0);
}

TEST_CASE("A non-converging session is force-cleaned when the wait expires") {
    MonitorHarness harness;
    harness.open("session-stuck");

    const MonitorReport report = harness.monitor.await_completion({"session-stuck"}, k_max_wait, k_poll);

    REQUIRE(report.elapsed.count() >= 25.0);
    REQUIRE(report.elapsed.count() <= 35.0);
    REQUIRE(report.force_cleaned_count == 1);
    REQUIRE(report.outcomes.front().reason == CompletionReason::ForceCleaned);
    REQUIRE(harness.registry.progress("session-stuck")->status == SessionStatus::ForceCleaned);
    REQUIRE(harness.registry.list_active_sessions().empty());
    REQUIRE(harness.registry.record_count() == 1);
}

TEST_CASE("Sessions converging under collaboration finish before the deadline") {
    MonitorHarness harness;
    SimulatedCollaboration collaboration{harness.registry, 0.3};
    harness.clock.set_sleep_hook([&collaboration]() { collaboration.step(); });
    harness.open("session-a");
    harness.open("session-b", 0, 0.0, 2);

    const MonitorReport report = harness.monitor.await_completion({"session-a", "session-b", "session-a"}, k_max_wait, k_poll);

    REQUIRE(report.outcomes.size() == 2);
    REQUIRE(report.force_cleaned_count == 0);
    REQUIRE(report.elapsed.count() == Approx(15.0));
    REQUIRE(report.outcomes[0].session_id == "session-b");
    REQUIRE(report.outcomes[0].reason == CompletionReason::MaxIterationsReached);
    REQUIRE(report.outcomes[1].session_id == "session-a");
    REQUIRE(report.outcomes[1].reason == CompletionReason::QualityThreshold);
}

TEST_CASE("Unknown sessions are treated as completed") {
    MonitorHarness harness;

    const MonitorReport report = harness.monitor.await_completion({"session-ghost"}, k_max_wait, k_poll);

    REQUIRE(report.outcomes.size() == 1);
    REQUIRE(report.outcomes.front().reason == CompletionReason::ProgressUnavailable);
    REQUIRE_FALSE(report.outcomes.front().dissolved);
}

TEST_CASE("Terminal statuses complete a session") {
    MonitorHarness harness;
    harness.open("session-failed");
    harness.registry.force_update_status("session-failed", SessionStatus::Failed);

    const std::optional<SessionProgress> optional_progress = harness.registry.progress("session-failed");
    REQUIRE(harness.monitor.classify(optional_progress.value(), harness.clock.now()) == CompletionReason::TerminalStatus);

    harness.registry.force_update_status("session-failed", SessionStatus::Completed);
    REQUIRE(harness.monitor.classify(harness.registry.progress("session-failed").value(), harness.clock.now())
            == CompletionReason::ExplicitlyCompleted);
}

TEST_CASE("Soft and hard timeouts apply to long-running sessions") {
    MonitorHarness harness;
    harness.open("session-slow", 3, 0.2);
    harness.open("session-stalled", 1, 0.2);

    harness.clock.advance(Duration{601.0});
    const TimePoint after_soft = harness.clock.now();
    REQUIRE(harness.monitor.classify(harness.registry.progress("session-slow").value(), after_soft) == CompletionReason::SoftTimeout);
    REQUIRE_FALSE(harness.monitor.classify(harness.registry.progress("session-stalled").value(), after_soft).has_value());

    harness.clock.advance(Duration{300.0});
    REQUIRE(harness.monitor.classify(harness.registry.progress("session-stalled").value(), harness.clock.now())
            == CompletionReason::HardTimeout);
}

TEST_CASE("A stop request ends the wait and cleans remaining sessions") {
    MonitorHarness harness;
    harness.open("session-stop");
    harness.clock.set_sleep_hook([&harness]() { harness.monitor.request_stop(); });

    const MonitorReport report = harness.monitor.await_completion({"session-stop"}, Duration{600.0}, k_poll);

    REQUIRE(report.stop_observed);
    REQUIRE(report.elapsed.count() == Approx(5.0));
    REQUIRE(harness.registry.progress("session-stop")->status == SessionStatus::ForceCleaned);
    REQUIRE(harness.monitor.stop_requested());

    harness.monitor.clear_stop();
    REQUIRE_FALSE(harness.monitor.stop_requested());
}

TEST_CASE("Each poll publishes aggregate progress") {
    MonitorHarness harness;
    harness.open("session-progress");

    const MonitorReport report = harness.monitor.await_completion({"session-progress"}, Duration{10.0}, k_poll, 7);

    REQUIRE(report.force_cleaned_count == 1);
    REQUIRE(harness.event_bus.pending() == 2);
    const std::optional<PlanningEvent> optional_event = harness.event_bus.try_consume();
    REQUIRE(optional_event.has_value());
    REQUIRE(optional_event->kind == PlanningEventKind::DiscussionProgress);
    REQUIRE(optional_event->cycle_number == 7);
    REQUIRE(optional_event->detail.find("session-(0/5, Q:0.00)") != std::string::npos);
}

TEST_CASE("Monitor rejects invalid configuration") {
    rolling_planner::test::ManualClock clock;
    InMemorySessionRegistry registry;
    PlanningEventBus event_bus;

    DiscussionMonitorConfig config{};
    config.poll_interval = Duration{0.0};
    REQUIRE_THROWS_AS(DiscussionMonitor(config, registry, clock, event_bus), std::invalid_argument);

    config = DiscussionMonitorConfig{};
    config.hard_timeout = Duration{100.0};
    REQUIRE_THROWS_AS(DiscussionMonitor(config, registry, clock, event_bus), std::invalid_argument);
}
