#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "rolling_planner/configuration.hpp"

using namespace rolling_planner;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    rolling_planner::test::ensure_logger_initialized();
    return true;
}();

/** @brief Sets ROLLING_PLANNER_* variables for one test and unsets them afterwards. */
class ScopedEnvironment final {
  public:
    ScopedEnvironment() {
        const auto log_dir = std::filesystem::temp_directory_path() / "rolling_planner_tests_logs";
        set("LOG_DIR", log_dir.string());
    }

    ~ScopedEnvironment() {
        for (const std::string& name : list_names_) {
            ::unsetenv(name.c_str());
        }
    }

    ScopedEnvironment(const ScopedEnvironment&) = delete;
    ScopedEnvironment& operator=(const ScopedEnvironment&) = delete;

    void set(const std::string& suffix, const std::string& value) {
        const std::string name = "ROLLING_PLANNER_" + suffix;
        ::setenv(name.c_str(), value.c_str(), 1);
        list_names_.push_back(name);
    }

  private:
    std::vector<std::string> list_names_;
};
}  // namespace

TEST_CASE("Configuration defaults apply when the environment is empty") {
    const ScopedEnvironment environment;
    const Configuration config = ConfigurationLoader::load();

    REQUIRE(config.report_directory == "reports");
    REQUIRE(config.update_hz == Approx(1.0));
    REQUIRE(config.planning.max_planning_cycles == 100);
    REQUIRE(config.planning.planning_interval.count() == Approx(0.0));
    REQUIRE(config.planning.wait_policy.max_wait().count() == Approx(450.0));
    REQUIRE(config.planning.monitor.poll_interval.count() == Approx(5.0));
    REQUIRE(config.planning.monitor.quality_threshold == Approx(0.85));
    REQUIRE(config.planning.distributor.visibility_threshold_km == Approx(2'000.0));
    REQUIRE(config.planning.meta_task.fixed_duration.count() == Approx(300.0));
    REQUIRE(config.planning.meta_task.overlap.count() == Approx(60.0));
}

TEST_CASE("Configuration reads overrides from the environment") {
    ScopedEnvironment environment;
    environment.set("REPORT_DIR", "/tmp/planner-reports");
    environment.set("UPDATE_HZ", "4");
    environment.set("MAX_CYCLES", "12");
    environment.set("PLANNING_INTERVAL_S", "30");
    environment.set("WAIT_CAP_S", "120");
    environment.set("POLL_INTERVAL_S", "2.5");
    environment.set("VISIBILITY_THRESHOLD_KM", "1500");
    environment.set("MAX_MATRIX_PAIRS", "64");

    const Configuration config = ConfigurationLoader::load();

    REQUIRE(config.report_directory == "/tmp/planner-reports");
    REQUIRE(config.update_hz == Approx(4.0));
    REQUIRE(config.planning.max_planning_cycles == 12);
    REQUIRE(config.planning.planning_interval.count() == Approx(30.0));
    REQUIRE(config.planning.wait_policy.max_wait().count() == Approx(120.0));
    REQUIRE(config.planning.monitor.poll_interval.count() == Approx(2.5));
    REQUIRE(config.planning.distributor.visibility_threshold_km == Approx(1'500.0));
    REQUIRE(config.planning.distributor.max_matrix_pairs == 64);
}

TEST_CASE("Unparseable or non-positive values fall back to defaults") {
    ScopedEnvironment environment;
    environment.set("UPDATE_HZ", "fast");
    environment.set("MAX_CYCLES", "-3");
    environment.set("QUALITY_THRESHOLD", "0");

    const Configuration config = ConfigurationLoader::load();

    REQUIRE(config.update_hz == Approx(1.0));
    REQUIRE(config.planning.max_planning_cycles == 100);
    REQUIRE(config.planning.monitor.quality_threshold == Approx(0.85));
}

TEST_CASE("Contradictory settings are repaired") {
    ScopedEnvironment environment;

    SECTION("hard timeout is raised to the soft timeout") {
        environment.set("SOFT_TIMEOUT_S", "700");
        environment.set("HARD_TIMEOUT_S", "500");

        const Configuration config = ConfigurationLoader::load();

        REQUIRE(config.planning.monitor.soft_timeout.count() == Approx(700.0));
        REQUIRE(config.planning.monitor.hard_timeout.count() == Approx(700.0));
    }

    SECTION("an overlap at least as long as the window restores the window defaults") {
        environment.set("WINDOW_DURATION_S", "120");
        environment.set("WINDOW_OVERLAP_S", "120");

        const Configuration config = ConfigurationLoader::load();

        REQUIRE(config.planning.meta_task.fixed_duration.count() == Approx(300.0));
        REQUIRE(config.planning.meta_task.overlap.count() == Approx(60.0));
    }
}

TEST_CASE("Log level names are validated") {
    REQUIRE(set_log_level("debug"));
    REQUIRE(get_logger()->level() == spdlog::level::debug);

    REQUIRE_FALSE(set_log_level("chatty"));
    REQUIRE(get_logger()->level() == spdlog::level::info);

    REQUIRE(set_log_level("info"));
}
