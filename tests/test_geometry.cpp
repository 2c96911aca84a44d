#include <cmath>
#include <limits>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "scenario_builders.hpp"
#include "rolling_planner/geometry.hpp"

using namespace rolling_planner;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    rolling_planner::test::ensure_logger_initialized();
    return true;
}();

const SimTimePoint k_epoch = SystemClock::from_time_t(1'700'000'000);
constexpr double k_one_degree_km{6'371.0 * 3.14159265358979323846 / 180.0};
}  // namespace

TEST_CASE("Spherical distance is zero for identical points and symmetric") {
    const GeodeticCoordinate tokyo{35.68, 139.69, 0.0};
    const GeodeticCoordinate honolulu{21.31, -157.86, 12.0};

    REQUIRE(spherical_distance_km(tokyo, tokyo) == Approx(0.0).margin(1e-9));
    REQUIRE(spherical_distance_km(tokyo, honolulu) == Approx(spherical_distance_km(honolulu, tokyo)));
}

TEST_CASE("Spherical distance combines ground arc and altitude difference") {
    const GeodeticCoordinate origin{0.0, 0.0, 0.0};

    REQUIRE(spherical_distance_km(origin, GeodeticCoordinate{0.0, 1.0, 0.0}) == Approx(k_one_degree_km).epsilon(1e-6));
    REQUIRE(spherical_distance_km(origin, GeodeticCoordinate{0.0, 0.0, 300.0}) == Approx(300.0));

    const double combined = spherical_distance_km(origin, GeodeticCoordinate{0.0, 1.0, 300.0});
    REQUIRE(combined == Approx(std::hypot(k_one_degree_km, 300.0)).epsilon(1e-6));
}

TEST_CASE("Spherical distance of malformed coordinates is infinite") {
    const GeodeticCoordinate origin{0.0, 0.0, 0.0};
    const double nan = std::numeric_limits<double>::quiet_NaN();

    REQUIRE(std::isinf(spherical_distance_km(origin, GeodeticCoordinate{91.0, 0.0, 0.0})));
    REQUIRE(std::isinf(spherical_distance_km(GeodeticCoordinate{-90.5, 0.0, 0.0}, origin)));
    REQUIRE(std::isinf(spherical_distance_km(origin, GeodeticCoordinate{0.0, nan, 0.0})));
    REQUIRE(std::isinf(spherical_distance_km(origin, GeodeticCoordinate{0.0, 0.0, std::numeric_limits<double>::infinity()})));
}

TEST_CASE("Visibility windows follow contiguous runs under the threshold") {
    const Target target = rolling_planner::test::make_target("t-1",
                                                             {GeodeticCoordinate{0.0, 0.0, 0.0},
                                                              GeodeticCoordinate{0.0, 5.0, 0.0},
                                                              GeodeticCoordinate{0.0, 10.0, 0.0},
                                                              GeodeticCoordinate{0.0, 30.0, 0.0},
                                                              GeodeticCoordinate{0.0, 2.0, 0.0},
                                                              GeodeticCoordinate{0.0, 1.0, 0.0}},
                                                             k_epoch);
    const PositionFunction observer = [](const TrajectorySample&) -> std::optional<GeodeticCoordinate> {
        return GeodeticCoordinate{0.0, 0.0, 0.0};
    };

    const VisibilityWindowList windows = find_visibility_windows(target.trajectory, observer, 2'000.0);

    REQUIRE(windows.size() == 2);
    REQUIRE(windows[0].start_index == 0);
    REQUIRE(windows[0].end_index == 2);
    REQUIRE(windows[0].duration_s == Approx(120.0));
    REQUIRE(windows[0].min_distance_km == Approx(0.0).margin(1e-9));

    SECTION("a window still open at the end closes at the final sample") {
        REQUIRE(windows[1].start_index == 4);
        REQUIRE(windows[1].end_index == 5);
        REQUIRE(windows[1].duration_s == Approx(60.0));
        REQUIRE(windows[1].min_distance_km == Approx(k_one_degree_km).epsilon(1e-6));
    }
}

TEST_CASE("Samples without an observer position are never visible") {
    const Target target = rolling_planner::test::make_equatorial_target("t-2", 0.0, k_epoch);
    const PositionFunction unknown = [](const TrajectorySample&) -> std::optional<GeodeticCoordinate> {
        return std::nullopt;
    };

    REQUIRE(find_visibility_windows(target.trajectory, unknown, 2'000.0).empty());
    REQUIRE(find_visibility_windows(Trajectory{}, unknown, 2'000.0).empty());
}

TEST_CASE("Distance confidence averages stability and window coverage") {
    const VisibilityWindowList three_windows(3);

    REQUIRE(distance_confidence({100.0, 100.0, 100.0}, three_windows) == Approx(1.0));
    REQUIRE(distance_confidence({100.0, 100.0, 100.0}, {}) == Approx(0.5));

    SECTION("large variance drives stability to zero") {
        REQUIRE(distance_confidence({0.0, 4'000.0}, three_windows) == Approx(0.5));
    }

    SECTION("empty or non-finite input yields zero") {
        REQUIRE(distance_confidence({}, three_windows) == 0.0);
        REQUIRE(distance_confidence({100.0, std::numeric_limits<double>::infinity()}, three_windows) == 0.0);
    }
}
