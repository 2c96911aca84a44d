#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "manual_clock.hpp"
#include "scenario_builders.hpp"
#include "rolling_planner/simulated_collaboration.hpp"
#include "rolling_planner/task_distributor.hpp"

using namespace rolling_planner;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    rolling_planner::test::ensure_logger_initialized();
    return true;
}();

/** @brief Platform that records tasks and can be told to reject or throw. */
class RecordingPlatform final : public PlatformHandle {
  public:
    enum class Behaviour { Accept, Reject, Throw };

    explicit RecordingPlatform(std::string identifier, Behaviour behaviour = Behaviour::Accept)
        : str_identifier_(std::move(identifier)),
          behaviour_(behaviour) {}

    [[nodiscard]] const std::string& identifier() const noexcept override {
        return str_identifier_;
    }

    bool receive_task(const TrackingTask& task, const Target&) override {
        list_tasks.push_back(task);
        if (behaviour_ == Behaviour::Throw) {
            throw std::runtime_error("platform offline");
        }
        return behaviour_ == Behaviour::Accept;
    }

    std::vector<TrackingTask> list_tasks;

  private:
    std::string str_identifier_;
    Behaviour behaviour_;
};

DistanceResult make_result(const std::string& target_id, const std::string& platform_id, double min_distance_km, double confidence) {
    DistanceResult result{};
    result.target_id = target_id;
    result.platform_id = platform_id;
    result.min_distance_km = min_distance_km;
    result.avg_distance_km = min_distance_km;
    result.confidence = confidence;
    return result;
}

TargetList make_targets(const IdList& target_ids, SimTimePoint launch_time) {
    TargetList targets;
    for (const std::string& target_id : target_ids) {
        targets.push_back(rolling_planner::test::make_equatorial_target(target_id, 0.0, launch_time));
    }
    return targets;
}
}  // namespace

TEST_CASE("Weighted score inflates distance by low confidence") {
    REQUIRE(make_result("t", "p", 100.0, 1.0).weighted_score() == Approx(100.0));
    REQUIRE(make_result("t", "p", 100.0, 0.0).weighted_score() == Approx(200.0));
    REQUIRE(std::isinf(make_result("t", "p", std::numeric_limits<double>::infinity(), 1.0).weighted_score()));
}

TEST_CASE("Nearest-platform selection uses the confidence-weighted score") {
    rolling_planner::test::ManualClock clock;
    const TargetList targets = make_targets({"t1", "t2", "t3"}, clock.simulation_time());

    DistanceMatrix matrix;
    matrix["t1"]["A"] = make_result("t1", "A", 10.0, 1.0);
    matrix["t2"]["A"] = make_result("t2", "A", 50.0, 1.0);
    matrix["t3"]["A"] = make_result("t3", "A", 200.0, 1.0);
    matrix["t1"]["B"] = make_result("t1", "B", 5.0, 0.5);
    matrix["t2"]["B"] = make_result("t2", "B", 60.0, 0.5);
    matrix["t3"]["B"] = make_result("t3", "B", 190.0, 0.5);

    IdList unassigned;
    const Assignment assignment = TaskDistributor::select_assignments(targets, matrix, unassigned);

    REQUIRE(unassigned.empty());
    REQUIRE(assignment.at("B") == IdList{"t1"});
    REQUIRE(assignment.at("A") == IdList{"t2", "t3"});
}

TEST_CASE("Targets with only infinite scores are left unassigned") {
    rolling_planner::test::ManualClock clock;
    const TargetList targets = make_targets({"t1", "t2"}, clock.simulation_time());
    const double infinity = std::numeric_limits<double>::infinity();

    DistanceMatrix matrix;
    matrix["t1"]["A"] = make_result("t1", "A", infinity, 0.0);
    matrix["t1"]["B"] = make_result("t1", "B", infinity, 0.0);

    IdList unassigned;
    const Assignment assignment = TaskDistributor::select_assignments(targets, matrix, unassigned);

    REQUIRE(assignment.empty());
    REQUIRE(unassigned == IdList{"t1", "t2"});
}

TEST_CASE("Ties resolve to the lowest platform id") {
    rolling_planner::test::ManualClock clock;
    const TargetList targets = make_targets({"t1"}, clock.simulation_time());

    DistanceMatrix matrix;
    matrix["t1"]["bravo"] = make_result("t1", "bravo", 42.0, 1.0);
    matrix["t1"]["alpha"] = make_result("t1", "alpha", 42.0, 1.0);
    matrix["t1"]["charlie"] = make_result("t1", "charlie", 42.0, 1.0);

    IdList unassigned;
    const Assignment assignment = TaskDistributor::select_assignments(targets, matrix, unassigned);

    REQUIRE(assignment.size() == 1);
    REQUIRE(assignment.count("alpha") == 1);
}

TEST_CASE("Distribution assigns each reachable target to exactly one platform") {
    rolling_planner::test::ManualClock clock;
    StaticPlatformRegistry registry;
    auto west = std::make_shared<RecordingPlatform>("west");
    auto east = std::make_shared<RecordingPlatform>("east");
    auto lost = std::make_shared<RecordingPlatform>("lost");
    registry.add_platform(west, GeodeticCoordinate{0.0, -20.0, 500.0});
    registry.add_platform(east, GeodeticCoordinate{0.0, 20.0, 500.0});
    registry.add_platform(lost, std::nullopt);

    const TargetList targets{
        rolling_planner::test::make_equatorial_target("near-west", -18.0, clock.simulation_time()),
        rolling_planner::test::make_equatorial_target("near-east", 19.0, clock.simulation_time()),
        rolling_planner::test::make_equatorial_target("far-east", 25.0, clock.simulation_time()),
    };

    TaskDistributor distributor{DistributorConfig{}, registry, clock};
    const DistributionResult result = distributor.distribute(targets, registry.all_platforms());

    REQUIRE(result.unassigned_targets.empty());
    REQUIRE(result.assignment.at("west") == IdList{"near-west"});
    REQUIRE(result.assignment.at("east") == IdList{"near-east", "far-east"});
    REQUIRE(result.assignment.count("lost") == 0);
    REQUIRE(result.dispatched == 3);
    REQUIRE(result.dispatch_failures == 0);

    SECTION("a platform without a position yields unbounded results") {
        const DistanceResult& unbounded = result.matrix.at("near-west").at("lost");
        REQUIRE(std::isinf(unbounded.min_distance_km));
        REQUIRE(unbounded.confidence == 0.0);
    }

    SECTION("dispatched tasks carry the target window and id") {
        REQUIRE(west->list_tasks.size() == 1);
        const TrackingTask& task = west->list_tasks.front();
        REQUIRE(task.task_id == "track_near-west_west");
        REQUIRE(task.target_id == "near-west");
        REQUIRE(task.window.start == targets[0].launch_time);
        REQUIRE(task.window.end == targets[0].impact_time());
    }
}

TEST_CASE("A target listed twice is assigned and dispatched once") {
    rolling_planner::test::ManualClock clock;
    StaticPlatformRegistry registry;
    auto west = std::make_shared<RecordingPlatform>("west");
    registry.add_platform(west, GeodeticCoordinate{0.0, -20.0, 500.0});

    const TargetList targets{
        rolling_planner::test::make_equatorial_target("near-west", -18.0, clock.simulation_time()),
        rolling_planner::test::make_equatorial_target("near-west", -18.0, clock.simulation_time()),
    };

    TaskDistributor distributor{DistributorConfig{}, registry, clock};
    const DistributionResult result = distributor.distribute(targets, registry.all_platforms());

    REQUIRE(result.assignment.at("west") == IdList{"near-west"});
    REQUIRE(result.unassigned_targets.empty());
    REQUIRE(result.dispatched == 1);
    REQUIRE(west->list_tasks.size() == 1);
}

TEST_CASE("A target unreachable by every platform is omitted") {
    rolling_planner::test::ManualClock clock;
    StaticPlatformRegistry registry;
    registry.add_platform(std::make_shared<RecordingPlatform>("dark-1"), std::nullopt);
    registry.add_platform(std::make_shared<RecordingPlatform>("dark-2"), std::nullopt);

    TaskDistributor distributor{DistributorConfig{}, registry, clock};
    const DistributionResult result = distributor.distribute(make_targets({"t1"}, clock.simulation_time()), registry.all_platforms());

    REQUIRE(result.assignment.empty());
    REQUIRE(result.unassigned_targets == IdList{"t1"});
}

TEST_CASE("Dispatch failures are counted without aborting other dispatches") {
    rolling_planner::test::ManualClock clock;
    StaticPlatformRegistry registry;
    auto broken = std::make_shared<RecordingPlatform>("a-broken", RecordingPlatform::Behaviour::Throw);
    auto picky = std::make_shared<RecordingPlatform>("b-picky", RecordingPlatform::Behaviour::Reject);
    auto healthy = std::make_shared<RecordingPlatform>("c-healthy");
    registry.add_platform(broken, GeodeticCoordinate{0.0, -40.0, 500.0});
    registry.add_platform(picky, GeodeticCoordinate{0.0, 0.0, 500.0});
    registry.add_platform(healthy, GeodeticCoordinate{0.0, 40.0, 500.0});

    const TargetList targets{
        rolling_planner::test::make_equatorial_target("t-broken", -40.0, clock.simulation_time()),
        rolling_planner::test::make_equatorial_target("t-picky", 0.0, clock.simulation_time()),
        rolling_planner::test::make_equatorial_target("t-healthy", 40.0, clock.simulation_time()),
    };

    TaskDistributor distributor{DistributorConfig{}, registry, clock};
    const DistributionResult result = distributor.distribute(targets, registry.all_platforms());

    REQUIRE(result.dispatch_failures == 2);
    REQUIRE(result.dispatched == 1);
    REQUIRE(broken->list_tasks.size() == 1);
    REQUIRE(picky->list_tasks.size() == 1);
    REQUIRE(healthy->list_tasks.size() == 1);
}

TEST_CASE("The pair cap leaves excess targets without matrix rows") {
    rolling_planner::test::ManualClock clock;
    StaticPlatformRegistry registry;
    registry.add_platform(std::make_shared<RecordingPlatform>("p1"), GeodeticCoordinate{0.0, 0.0, 500.0});
    registry.add_platform(std::make_shared<RecordingPlatform>("p2"), GeodeticCoordinate{0.0, 5.0, 500.0});

    DistributorConfig config{};
    config.max_matrix_pairs = 4;
    TaskDistributor distributor{config, registry, clock};
    const TargetList targets = make_targets({"t1", "t2", "t3"}, clock.simulation_time());

    const DistanceMatrix matrix = distributor.build_distance_matrix(targets, registry.all_platforms());

    REQUIRE(matrix.size() == 2);
    REQUIRE(matrix.count("t3") == 0);
}

TEST_CASE("Distributor rejects invalid configuration") {
    rolling_planner::test::ManualClock clock;
    StaticPlatformRegistry registry;
    DistributorConfig config{};
    config.visibility_threshold_km = 0.0;

    REQUIRE_THROWS_AS(TaskDistributor(config, registry, clock), std::invalid_argument);
}
