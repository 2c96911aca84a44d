#include <chrono>
#include <stdexcept>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "rolling_planner/meta_task_planner.hpp"

using namespace rolling_planner;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    rolling_planner::test::ensure_logger_initialized();
    return true;
}();

const SimTimePoint k_collection_time = SystemClock::from_time_t(1'700'000'000);

SimTimePoint at(double seconds) {
    return k_collection_time + std::chrono::duration_cast<SystemClock::duration>(Duration{seconds});
}

Target make_flight(const std::string& identifier, double launch_offset_s, double flight_s) {
    Target target{};
    target.identifier = identifier;
    target.launch_time = at(launch_offset_s);
    target.flight_duration = Duration{flight_s};
    return target;
}
}  // namespace

TEST_CASE("Meta-task windows overlap and cover the flight interval") {
    const MetaTaskPlanner planner{MetaTaskConfig{}};
    const TargetList targets{make_flight("t1", 0.0, 600.0), make_flight("t2", 300.0, 900.0)};

    const std::optional<MetaTaskSet> optional_set = planner.create_meta_task_set(k_collection_time, targets);

    REQUIRE(optional_set.has_value());
    const MetaTaskSet& meta_task_set = optional_set.value();
    REQUIRE(meta_task_set.interval_start == k_collection_time);
    REQUIRE(meta_task_set.interval_end == at(1'200.0));
    REQUIRE(meta_task_set.target_ids == IdList{"t1", "t2"});
    REQUIRE(meta_task_set.windows.size() == 5);

    REQUIRE(meta_task_set.windows[0].window_id == "MetaWindow_000");
    REQUIRE(meta_task_set.windows[4].window_id == "MetaWindow_004");
    REQUIRE(meta_task_set.windows[1].start == at(240.0));
    REQUIRE(meta_task_set.windows[1].end == at(540.0));
    REQUIRE(meta_task_set.windows[4].start == at(960.0));
    REQUIRE(meta_task_set.windows[4].end == at(1'200.0));
    REQUIRE(meta_task_set.windows[4].duration().count() == Approx(240.0));

    SECTION("each window lists the targets in flight during it") {
        REQUIRE(meta_task_set.windows[0].target_ids == IdList{"t1"});
        REQUIRE(meta_task_set.windows[1].target_ids == IdList{"t1", "t2"});
        REQUIRE(meta_task_set.windows[2].target_ids == IdList{"t1", "t2"});
        REQUIRE(meta_task_set.windows[3].target_ids == IdList{"t2"});
    }
}

TEST_CASE("Meta-task interval falls back to the maximum extension") {
    const MetaTaskPlanner planner{MetaTaskConfig{}};
    const TargetList targets{make_flight("landed", -1'000.0, 100.0)};

    const std::optional<MetaTaskSet> optional_set = planner.create_meta_task_set(k_collection_time, targets);

    REQUIRE(optional_set.has_value());
    REQUIRE(optional_set->interval_end == at(600.0));
    REQUIRE(optional_set->windows.size() == 3);
    REQUIRE(optional_set->windows.back().end == at(600.0));
    REQUIRE(optional_set->windows.front().target_ids.empty());
}

TEST_CASE("Meta-task window count is capped") {
    MetaTaskConfig config{};
    config.max_windows = 2;
    const MetaTaskPlanner planner{config};

    const std::optional<MetaTaskSet> optional_set =
        planner.create_meta_task_set(k_collection_time, TargetList{make_flight("long", 0.0, 3'600.0)});

    REQUIRE(optional_set.has_value());
    REQUIRE(optional_set->windows.size() == 2);
}

TEST_CASE("No meta-task set is produced without targets") {
    const MetaTaskPlanner planner{MetaTaskConfig{}};
    REQUIRE_FALSE(planner.create_meta_task_set(k_collection_time, TargetList{}).has_value());
}

TEST_CASE("Meta-task planner rejects overlap longer than the window") {
    MetaTaskConfig config{};
    config.overlap = Duration{300.0};
    REQUIRE_THROWS_AS(MetaTaskPlanner{config}, std::invalid_argument);
}
