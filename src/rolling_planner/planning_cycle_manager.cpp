#include "rolling_planner/planning_cycle_manager.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "rolling_planner/geometry.hpp"

namespace rolling_planner {

namespace {
std::string make_cycle_id(std::uint64_t cycle_number, SimTimePoint start_time) {
    return fmt::format("planning_cycle_{}_{:%Y%m%d_%H%M%S}", cycle_number, fmt::gmtime(SystemClock::to_time_t(start_time)));
}

bool reached_consensus(const SessionOutcome& outcome, const std::string& platform_id) {
    if (outcome.participants.count(platform_id) == 0) {
        return false;
    }
    return outcome.final_status == SessionStatus::Completed || outcome.final_status == SessionStatus::Dissolved;
}
}  // namespace

RollingPlanningCycleManager::RollingPlanningCycleManager(PlanningCycleConfig config,
                                                         PlatformRegistry& platform_registry,
                                                         const PositionOracle& position_oracle,
                                                         SessionRegistry& session_registry,
                                                         Clock& clock,
                                                         PlanningEventBus& event_bus,
                                                         ReportSinkPtr report_sink)
    : config_(config),
      platform_registry_(platform_registry),
      position_oracle_(position_oracle),
      session_registry_(session_registry),
      clock_(clock),
      event_bus_(event_bus),
      report_sink_(std::move(report_sink)),
      distributor_(config_.distributor, position_oracle_, clock_),
      monitor_(config_.monitor, session_registry_, clock_, event_bus_),
      meta_task_planner_(config_.meta_task),
      gdop_calculator_(),
      logger_(get_logger()) {
    if (config_.max_planning_cycles == 0) {
        throw std::invalid_argument("RollingPlanningCycleManager requires at least one planning cycle");
    }
    if (config_.planning_interval.count() < 0.0) {
        throw std::invalid_argument("RollingPlanningCycleManager planning interval must not be negative");
    }
    logger_->info("Cycle manager ready: max_cycles={} interval={:.0f}s max_wait={:.0f}s",
                  config_.max_planning_cycles,
                  config_.planning_interval.count(),
                  config_.wait_policy.max_wait().count());
}

const PlanningCycleConfig& RollingPlanningCycleManager::config() const noexcept {
    return config_;
}

bool RollingPlanningCycleManager::start_rolling_planning() {
    if (flag_running_.exchange(true)) {
        logger_->warn("Rolling planning already running");
        return false;
    }
    monitor_.clear_stop();
    logger_->info("Rolling planning started");
    return true;
}

void RollingPlanningCycleManager::stop_rolling_planning() {
    if (!flag_running_.exchange(false)) {
        logger_->debug("Rolling planning not running; stop ignored");
        return;
    }
    logger_->info("Stopping rolling planning");
    monitor_.request_stop();

    CyclePtr forced_cycle;
    std::size_t total_count = 0;
    std::size_t completed_count = 0;
    std::size_t failed_count = 0;
    {
        std::scoped_lock lock(mutex_);
        forced_cycle = force_complete_locked();
        total_count = list_history_.size();
        for (const CycleInfo& cycle : list_history_) {
            if (cycle.state == CycleState::Completed) {
                ++completed_count;
            } else if (cycle.state == CycleState::Error) {
                ++failed_count;
            }
        }
    }
    if (forced_cycle != nullptr) {
        publish(PlanningEventKind::CycleForceCompleted, forced_cycle->cycle_number, CycleState::Completed, "stop requested");
    }
    cleanup_active_sessions();

    logger_->info(R"({{"component":"cycle_manager","action":"stopped","total_cycles":{},"completed":{},"failed":{}}})",
                  total_count,
                  completed_count,
                  failed_count);
}

std::optional<CycleInfo> RollingPlanningCycleManager::check_and_execute_cycle(const TargetList& targets) {
    CyclePtr cycle;
    CyclePtr forced_cycle;
    bool limit_reached = false;
    {
        // The running flag is re-read under the lock that creates the cycle, so a
        // stop that returns before this block leaves no cycle behind.
        std::scoped_lock lock(mutex_);
        if (!flag_running_.load()) {
            logger_->debug("Rolling planning not running; cycle skipped");
            return std::nullopt;
        }
        if (cycle_counter_ >= config_.max_planning_cycles) {
            limit_reached = true;
        } else if (optional_last_cycle_start_.has_value()
                   && Duration{clock_.now() - optional_last_cycle_start_.value()} < config_.planning_interval) {
            return std::nullopt;
        } else {
            forced_cycle = force_complete_locked();
            cycle = begin_cycle_locked(targets);
        }
    }
    if (limit_reached) {
        logger_->info("Maximum of {} planning cycles reached; stopping", config_.max_planning_cycles);
        stop_rolling_planning();
        return std::nullopt;
    }

    return execute_cycle(cycle, forced_cycle);
}

bool RollingPlanningCycleManager::is_running() const noexcept {
    return flag_running_.load();
}

std::optional<CycleInfo> RollingPlanningCycleManager::current_cycle() const {
    std::scoped_lock lock(mutex_);
    if (current_cycle_ == nullptr) {
        return std::nullopt;
    }
    return *current_cycle_;
}

std::uint64_t RollingPlanningCycleManager::cycle_counter() const {
    std::scoped_lock lock(mutex_);
    return cycle_counter_;
}

std::vector<CycleInfo> RollingPlanningCycleManager::cycle_history() const {
    std::scoped_lock lock(mutex_);
    return list_history_;
}

RollingPlanningCycleManager::CyclePtr RollingPlanningCycleManager::begin_cycle_locked(const TargetList& targets) {
    auto cycle = std::make_shared<CycleInfo>();
    cycle->cycle_number = ++cycle_counter_;
    cycle->start_time = clock_.simulation_time();
    cycle->cycle_id = make_cycle_id(cycle->cycle_number, cycle->start_time);
    cycle->state = CycleState::Initializing;
    cycle->targets = targets;
    current_cycle_ = cycle;
    optional_last_cycle_start_ = clock_.now();
    return cycle;
}

CycleInfo RollingPlanningCycleManager::execute_cycle(const CyclePtr& cycle, const CyclePtr& forced_cycle) {
    const TargetList& targets = cycle->targets;
    purge_closed_sessions(cycle->cycle_number);
    if (forced_cycle != nullptr) {
        publish(PlanningEventKind::CycleForceCompleted,
                forced_cycle->cycle_number,
                CycleState::Completed,
                fmt::format("superseded by cycle {}", cycle->cycle_number));
        cleanup_active_sessions();
    }

    logger_->info(R"({{"component":"cycle_manager","cycle":{},"cycle_id":"{}","action":"start","targets":{}}})",
                  cycle->cycle_number,
                  cycle->cycle_id,
                  targets.size());
    publish(PlanningEventKind::CycleStarted, cycle->cycle_number, CycleState::Initializing, fmt::format("targets={}", targets.size()));

    try {
        run_phases(cycle);
    } catch (const std::exception& exc) {
        logger_->error(R"({{"component":"cycle_manager","cycle":{},"action":"failed","error":"{}"}})",
                       cycle->cycle_number,
                       exc.what());
        return finish_cycle(cycle, CycleState::Error, std::string{exc.what()});
    }
    return finish_cycle(cycle, CycleState::Completed, std::nullopt);
}

void RollingPlanningCycleManager::run_phases(const CyclePtr& cycle) {
    if (!enter_phase(cycle, CycleState::CollectingTargets) || !collect_targets(cycle)) {
        return;
    }

    if (!enter_phase(cycle, CycleState::DistributingTasks)) {
        return;
    }
    const PlatformMap platforms = platform_registry_.all_platforms();
    if (platforms.empty()) {
        throw std::runtime_error("No platforms registered");
    }
    distribute_tasks(cycle, platforms);

    if (!enter_phase(cycle, CycleState::Discussing)) {
        return;
    }
    const MonitorReport monitor_report = wait_for_discussions(cycle);

    if (!enter_phase(cycle, CycleState::GatheringResults)) {
        return;
    }
    gather_results(cycle, platforms, monitor_report);

    if (!enter_phase(cycle, CycleState::GeneratingReports)) {
        return;
    }
    generate_reports(cycle);
}

bool RollingPlanningCycleManager::collect_targets(const CyclePtr& cycle) {
    if (cycle->targets.empty()) {
        logger_->info("Cycle {} detected no targets; completing without distribution", cycle->cycle_number);
        return false;
    }
    logger_->info("Cycle {} collected {} targets", cycle->cycle_number, cycle->targets.size());
    generate_meta_task_set(cycle);
    return true;
}

void RollingPlanningCycleManager::distribute_tasks(const CyclePtr& cycle, const PlatformMap& platforms) {
    DistributionResult distribution = distributor_.distribute(cycle->targets, platforms);
    if (distribution.dispatch_failures > 0) {
        logger_->warn("Cycle {} had {} failed dispatches", cycle->cycle_number, distribution.dispatch_failures);
    }
    update_cycle(cycle, [&distribution](CycleInfo& info) {
        info.assignment = std::move(distribution.assignment);
        info.results.unassigned_targets = std::move(distribution.unassigned_targets);
        info.results.dispatch_failures = distribution.dispatch_failures;
    });
}

MonitorReport RollingPlanningCycleManager::wait_for_discussions(const CyclePtr& cycle) {
    const IdList session_ids = session_registry_.list_active_sessions();
    const Duration max_wait = config_.wait_policy.max_wait();
    logger_->info("Cycle {} waiting on {} discussions, max wait {:.0f}s",
                  cycle->cycle_number,
                  session_ids.size(),
                  max_wait.count());

    MonitorReport monitor_report = monitor_.await_completion(session_ids,
                                                             max_wait,
                                                             config_.monitor.poll_interval,
                                                             cycle->cycle_number);
    update_cycle(cycle, [&monitor_report](CycleInfo& info) {
        info.results.sessions_tracked = monitor_report.outcomes.size();
        info.results.sessions_force_cleaned = monitor_report.force_cleaned_count;
    });
    return monitor_report;
}

void RollingPlanningCycleManager::gather_results(const CyclePtr& cycle,
                                                 const PlatformMap& platforms,
                                                 const MonitorReport& monitor_report) {
    std::set<std::string> set_active_participants;
    for (const std::string& session_id : session_registry_.list_active_sessions()) {
        const std::optional<SessionProgress> optional_progress = session_registry_.progress(session_id);
        if (optional_progress.has_value()) {
            set_active_participants.insert(optional_progress->participants.begin(), optional_progress->participants.end());
        }
    }

    std::map<std::string, PlatformSummary> map_summaries;
    std::size_t assigned_count = 0;
    for (const auto& [platform_id, target_ids] : cycle->assignment) {
        if (target_ids.empty()) {
            continue;
        }
        PlatformSummary summary{};
        summary.platform_id = platform_id;
        summary.assigned_targets = target_ids;
        summary.discussion_completed = set_active_participants.count(platform_id) == 0;
        summary.consensus_reached = std::any_of(
            monitor_report.outcomes.begin(),
            monitor_report.outcomes.end(),
            [&platform_id](const SessionOutcome& outcome) { return reached_consensus(outcome, platform_id); });
        assigned_count += target_ids.size();
        map_summaries.emplace(platform_id, std::move(summary));
    }

    OptimizationMetrics metrics{};
    if (!cycle->targets.empty()) {
        metrics.coverage_ratio = static_cast<double>(assigned_count) / static_cast<double>(cycle->targets.size());
    }
    if (!platforms.empty()) {
        metrics.resource_utilization = static_cast<double>(map_summaries.size()) / static_cast<double>(platforms.size());
    }
    evaluate_geometry(cycle->targets, platforms, metrics);

    const auto json_number = [](const std::optional<double>& optional_value) {
        return optional_value.has_value() ? fmt::format("{:.3f}", optional_value.value()) : std::string{"null"};
    };
    logger_->info(R"({{"component":"cycle_manager","cycle":{},"summaries":{},"coverage":{:.3f},"utilization":{:.3f},"mean_gdop":{},"uniformity":{}}})",
                  cycle->cycle_number,
                  map_summaries.size(),
                  metrics.coverage_ratio,
                  metrics.resource_utilization,
                  json_number(metrics.mean_gdop),
                  json_number(metrics.mean_geometry_uniformity));

    update_cycle(cycle, [&map_summaries, &metrics](CycleInfo& info) {
        info.results.platform_summaries = std::move(map_summaries);
        info.results.metrics = metrics;
    });
}

void RollingPlanningCycleManager::generate_reports(const CyclePtr& cycle) {
    if (report_sink_ == nullptr) {
        logger_->debug("No report sink configured; reports skipped");
        return;
    }

    std::map<std::string, std::string> map_files;
    try {
        const GanttChartData gantt_data = make_gantt_data(*cycle);
        if (gantt_data.tasks.empty()) {
            logger_->warn("Cycle {} has no assigned tasks; planning gantt skipped", cycle->cycle_number);
            return;
        }
        ensure_report_session(*cycle);
        const std::filesystem::path data_path =
            report_sink_->save_data(to_json(gantt_data), fmt::format("planning_cycle_{}", cycle->cycle_number));
        map_files["planning_data"] = data_path.string();

        try {
            const std::optional<std::filesystem::path> optional_chart = report_sink_->render_chart(gantt_data);
            if (optional_chart.has_value()) {
                map_files["planning_chart"] = optional_chart->string();
            }
        } catch (const std::exception& exc) {
            logger_->warn("Gantt chart rendering failed for cycle {}: {}", cycle->cycle_number, exc.what());
        }
    } catch (const std::exception& exc) {
        logger_->warn("Report generation failed for cycle {}: {}", cycle->cycle_number, exc.what());
    }

    if (!map_files.empty()) {
        update_cycle(cycle, [&map_files](CycleInfo& info) {
            info.metadata.report_files.insert(map_files.begin(), map_files.end());
        });
    }
}

void RollingPlanningCycleManager::generate_meta_task_set(const CyclePtr& cycle) {
    try {
        const std::optional<MetaTaskSet> optional_set =
            meta_task_planner_.create_meta_task_set(cycle->start_time, cycle->targets);
        if (!optional_set.has_value()) {
            logger_->warn("Cycle {} produced no meta-task set", cycle->cycle_number);
            return;
        }

        MetaTaskSummary summary{};
        summary.window_count = optional_set->windows.size();
        summary.target_count = optional_set->target_ids.size();
        summary.interval_start = optional_set->interval_start;
        summary.interval_end = optional_set->interval_end;

        std::optional<std::string> optional_path;
        if (report_sink_ != nullptr) {
            try {
                ensure_report_session(*cycle);
                optional_path = report_sink_
                                    ->save_data(to_json(optional_set.value(), cycle->cycle_number),
                                                fmt::format("meta_task_set_cycle_{}", cycle->cycle_number))
                                    .string();
            } catch (const std::exception& exc) {
                logger_->warn("Meta-task set export failed for cycle {}: {}", cycle->cycle_number, exc.what());
            }
        }

        update_cycle(cycle, [&summary, &optional_path](CycleInfo& info) {
            info.metadata.meta_task = summary;
            if (optional_path.has_value()) {
                info.metadata.report_files["meta_task_set"] = optional_path.value();
            }
        });
    } catch (const std::exception& exc) {
        logger_->warn("Meta-task set generation failed for cycle {}: {}", cycle->cycle_number, exc.what());
    }
}

void RollingPlanningCycleManager::evaluate_geometry(const TargetList& targets,
                                                    const PlatformMap& platforms,
                                                    OptimizationMetrics& metrics) const {
    const double earth_radius_km = distributor_.config().earth_radius_km;
    const SimTimePoint now = clock_.simulation_time();

    std::vector<CartesianPosition> list_positions;
    list_positions.reserve(platforms.size());
    for (const auto& [platform_id, handle] : platforms) {
        const std::optional<GeodeticCoordinate> optional_position = position_oracle_.position_of(platform_id, now);
        if (optional_position.has_value()) {
            list_positions.push_back(to_cartesian(optional_position.value(), earth_radius_km));
        }
    }
    if (list_positions.size() < GdopCalculator::k_min_platforms) {
        logger_->debug("GDOP skipped: {} platform positions available", list_positions.size());
        return;
    }

    double gdop_total = 0.0;
    std::size_t gdop_count = 0;
    double uniformity_total = 0.0;
    double spread_total = 0.0;
    std::size_t geometry_count = 0;
    for (const Target& target : targets) {
        const CartesianPosition observer = to_cartesian(target.launch_position, earth_radius_km);
        const GdopResult result = gdop_calculator_.calculate(list_positions, observer);
        if (result.success) {
            gdop_total += result.gdop;
            ++gdop_count;
        }
        const GeometryMetrics geometry = gdop_calculator_.geometry_metrics(list_positions, observer);
        if (geometry.success) {
            uniformity_total += geometry.uniformity_score;
            spread_total += geometry.elevation_spread_deg;
            ++geometry_count;
        }
    }
    if (gdop_count > 0) {
        metrics.mean_gdop = gdop_total / static_cast<double>(gdop_count);
    }
    if (geometry_count > 0) {
        metrics.mean_geometry_uniformity = uniformity_total / static_cast<double>(geometry_count);
        metrics.mean_elevation_spread_deg = spread_total / static_cast<double>(geometry_count);
    }
}

GanttChartData RollingPlanningCycleManager::make_gantt_data(const CycleInfo& cycle) const {
    GanttChartData gantt_data{};
    gantt_data.title = fmt::format("Planning cycle {} task assignment", cycle.cycle_number);
    gantt_data.cycle_id = cycle.cycle_id;
    gantt_data.cycle_number = cycle.cycle_number;
    gantt_data.cycle_start = cycle.start_time;
    gantt_data.total_targets = cycle.targets.size();
    gantt_data.total_platforms = cycle.assignment.size();

    for (const auto& [platform_id, target_ids] : cycle.assignment) {
        for (const std::string& target_id : target_ids) {
            const auto iterator_target = std::find_if(cycle.targets.begin(), cycle.targets.end(), [&target_id](const Target& target) {
                return target.identifier == target_id;
            });
            if (iterator_target == cycle.targets.end()) {
                continue;
            }
            GanttTask task{};
            task.task_id = fmt::format("{}_{}", platform_id, target_id);
            task.category = platform_id;
            task.target_id = target_id;
            task.start = iterator_target->launch_time;
            task.end = iterator_target->impact_time();
            task.priority = iterator_target->priority;
            task.threat_level = iterator_target->threat_level;
            gantt_data.tasks.push_back(std::move(task));
        }
    }
    return gantt_data;
}

void RollingPlanningCycleManager::ensure_report_session(const CycleInfo& cycle) {
    if (!report_sink_->has_session()) {
        report_sink_->create_session(cycle.cycle_id);
    }
}

bool RollingPlanningCycleManager::enter_phase(const CyclePtr& cycle, CycleState state) {
    {
        std::scoped_lock lock(mutex_);
        if (is_terminal(cycle->state)) {
            logger_->info("Cycle {} already terminated; skipping {}", cycle->cycle_number, to_string(state));
            return false;
        }
        cycle->state = state;
    }
    logger_->info(R"({{"component":"cycle_manager","cycle":{},"state":"{}"}})", cycle->cycle_number, to_string(state));
    publish(PlanningEventKind::PhaseChanged, cycle->cycle_number, state, "");
    return true;
}

bool RollingPlanningCycleManager::update_cycle(const CyclePtr& cycle, const std::function<void(CycleInfo&)>& mutation) {
    std::scoped_lock lock(mutex_);
    if (is_terminal(cycle->state)) {
        return false;
    }
    mutation(*cycle);
    return true;
}

CycleInfo RollingPlanningCycleManager::finish_cycle(const CyclePtr& cycle,
                                                    CycleState state,
                                                    std::optional<std::string> error_message) {
    CycleInfo archived_cycle;
    bool already_terminal = false;
    {
        std::scoped_lock lock(mutex_);
        already_terminal = is_terminal(cycle->state);
        if (!already_terminal) {
            cycle->state = state;
            cycle->end_time = clock_.simulation_time();
            cycle->error_message = std::move(error_message);
            list_history_.push_back(*cycle);
        }
        archived_cycle = *cycle;
    }

    if (already_terminal) {
        logger_->warn("Cycle {} was force-completed before its phases finished", archived_cycle.cycle_number);
        return archived_cycle;
    }

    const Duration wall_duration = archived_cycle.end_time.value() - archived_cycle.start_time;
    if (state == CycleState::Error) {
        publish(PlanningEventKind::CycleFailed, archived_cycle.cycle_number, state, archived_cycle.error_message.value_or(""));
    } else {
        logger_->info(R"({{"component":"cycle_manager","cycle":{},"action":"completed","duration_s":{:.1f},"assigned_platforms":{}}})",
                      archived_cycle.cycle_number,
                      wall_duration.count(),
                      archived_cycle.assignment.size());
        publish(PlanningEventKind::CycleCompleted, archived_cycle.cycle_number, state, "");
    }
    return archived_cycle;
}

RollingPlanningCycleManager::CyclePtr RollingPlanningCycleManager::force_complete_locked() {
    if (current_cycle_ == nullptr || is_terminal(current_cycle_->state)) {
        return nullptr;
    }
    logger_->warn(R"({{"component":"cycle_manager","cycle":{},"action":"force_complete","state":"{}"}})",
                  current_cycle_->cycle_number,
                  to_string(current_cycle_->state));
    current_cycle_->state = CycleState::Completed;
    current_cycle_->end_time = clock_.simulation_time();
    current_cycle_->metadata.force_completed = true;
    list_history_.push_back(*current_cycle_);
    return current_cycle_;
}

void RollingPlanningCycleManager::cleanup_active_sessions() {
    try {
        const IdList session_ids = session_registry_.list_active_sessions();
        if (session_ids.empty()) {
            return;
        }
        const std::vector<SessionOutcome> list_outcomes = monitor_.force_cleanup(session_ids);
        logger_->info("Force-closed {} active discussions", list_outcomes.size());
    } catch (const std::exception& exc) {
        logger_->error("Failed to clean active discussions: {}", exc.what());
    }
}

void RollingPlanningCycleManager::purge_closed_sessions(std::uint64_t cycle_number) {
    try {
        const std::size_t purged_count = session_registry_.purge_closed_sessions();
        if (purged_count > 0) {
            logger_->debug("Cycle {} purged {} closed discussion records", cycle_number, purged_count);
        }
    } catch (const std::exception& exc) {
        logger_->warn("Failed to purge closed discussions: {}", exc.what());
    }
}

void RollingPlanningCycleManager::publish(PlanningEventKind kind, std::uint64_t cycle_number, CycleState state, std::string detail) {
    event_bus_.publish(PlanningEvent{kind, cycle_number, std::string{to_string(state)}, std::move(detail), SteadyClock::now()});
}

}  // namespace rolling_planner
