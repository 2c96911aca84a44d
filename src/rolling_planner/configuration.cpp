// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of the environment-driven settings that
// feed the planner runtime.
//
// Responsibilities
// - Enforce defaults for cycle limits, wait policy, completion heuristics,
//   distance thresholds and meta-task windowing.
// - Surface diagnostics via the logging subsystem whenever a value cannot be
//   parsed or is not positive; the default is used instead.
// - Repair settings that contradict each other (window overlap, timeouts).
//
// Nothing is read from disk; callers populate the process environment ahead
// of time.

#include "rolling_planner/configuration.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include <fmt/format.h>

#include "rolling_planner/logging.hpp"

namespace rolling_planner {

namespace {
constexpr std::string_view k_env_prefix{"ROLLING_PLANNER_"};
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_report_directory{"reports"};
constexpr double k_default_update_hz{1.0};

const char* read_env(std::string_view suffix) {
    const std::string variable_name = fmt::format("{}{}", k_env_prefix, suffix);
    return std::getenv(variable_name.c_str());
}

double parse_double(std::string_view suffix, double fallback) {
    const char* raw_value = read_env(suffix);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        if (parsed_value <= 0.0) {
            get_logger()->warn("{}{}={} is not positive; using fallback {}", k_env_prefix, suffix, raw_value, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse double from {}{}; using fallback {}", k_env_prefix, suffix, fallback);
        return fallback;
    }
}

long long parse_int(std::string_view suffix, long long fallback) {
    const char* raw_value = read_env(suffix);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const long long parsed_value = std::stoll(raw_value);
        if (parsed_value <= 0) {
            get_logger()->warn("{}{}={} is not positive; using fallback {}", k_env_prefix, suffix, raw_value, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse integer from {}{}; using fallback {}", k_env_prefix, suffix, fallback);
        return fallback;
    }
}

Duration parse_seconds(std::string_view suffix, Duration fallback) {
    return Duration{parse_double(suffix, fallback.count())};
}

std::string parse_directory(std::string_view suffix, std::string_view fallback) {
    const char* raw_directory = read_env(suffix);
    if (raw_directory == nullptr || std::string_view{raw_directory}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_directory};
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_directory("LOG_DIR", k_default_log_directory);
    config.report_directory = parse_directory("REPORT_DIR", k_default_report_directory);

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.update_hz = load_update_hz();

    PlanningCycleConfig& planning = config.planning;
    planning.max_planning_cycles = static_cast<std::uint64_t>(
        parse_int("MAX_CYCLES", static_cast<long long>(planning.max_planning_cycles)));
    planning.planning_interval = parse_seconds("PLANNING_INTERVAL_S", planning.planning_interval);

    planning.wait_policy.base_time_per_iteration = parse_seconds("BASE_TIME_PER_ITERATION_S", planning.wait_policy.base_time_per_iteration);
    planning.wait_policy.max_iterations = static_cast<int>(parse_int("MAX_ITERATIONS", planning.wait_policy.max_iterations));
    planning.wait_policy.safety_margin = parse_double("SAFETY_MARGIN", planning.wait_policy.safety_margin);
    planning.wait_policy.absolute_cap = parse_seconds("WAIT_CAP_S", planning.wait_policy.absolute_cap);

    planning.monitor.poll_interval = parse_seconds("POLL_INTERVAL_S", planning.monitor.poll_interval);
    planning.monitor.quality_threshold = parse_double("QUALITY_THRESHOLD", planning.monitor.quality_threshold);
    planning.monitor.soft_timeout = parse_seconds("SOFT_TIMEOUT_S", planning.monitor.soft_timeout);
    planning.monitor.hard_timeout = parse_seconds("HARD_TIMEOUT_S", planning.monitor.hard_timeout);
    if (planning.monitor.hard_timeout < planning.monitor.soft_timeout) {
        logger->warn("Hard timeout {:.0f}s precedes soft timeout {:.0f}s; raising hard timeout",
                     planning.monitor.hard_timeout.count(),
                     planning.monitor.soft_timeout.count());
        planning.monitor.hard_timeout = planning.monitor.soft_timeout;
    }

    planning.distributor.visibility_threshold_km = parse_double("VISIBILITY_THRESHOLD_KM", planning.distributor.visibility_threshold_km);
    planning.distributor.earth_radius_km = parse_double("EARTH_RADIUS_KM", planning.distributor.earth_radius_km);
    planning.distributor.max_matrix_pairs = static_cast<std::size_t>(
        parse_int("MAX_MATRIX_PAIRS", static_cast<long long>(planning.distributor.max_matrix_pairs)));

    const MetaTaskConfig default_meta_task{};
    planning.meta_task.fixed_duration = parse_seconds("WINDOW_DURATION_S", default_meta_task.fixed_duration);
    planning.meta_task.overlap = parse_seconds("WINDOW_OVERLAP_S", default_meta_task.overlap);
    if (planning.meta_task.overlap >= planning.meta_task.fixed_duration) {
        logger->warn("Window overlap {:.0f}s must be shorter than window duration {:.0f}s; using defaults",
                     planning.meta_task.overlap.count(),
                     planning.meta_task.fixed_duration.count());
        planning.meta_task = default_meta_task;
    }

    logger->info("Configuration loaded: update_hz={} max_cycles={} interval_s={} poll_s={} max_wait_s={} report_dir={}",
                 config.update_hz,
                 planning.max_planning_cycles,
                 planning.planning_interval.count(),
                 planning.monitor.poll_interval.count(),
                 planning.wait_policy.max_wait().count(),
                 config.report_directory);

    return config;
}

double ConfigurationLoader::load_update_hz() {
    return parse_double("UPDATE_HZ", k_default_update_hz);
}

}  // namespace rolling_planner
