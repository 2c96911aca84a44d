#include <array>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "rolling_planner/clock.hpp"
#include "rolling_planner/configuration.hpp"
#include "rolling_planner/logging.hpp"
#include "rolling_planner/planning_runtime.hpp"
#include "rolling_planner/report_sink.hpp"
#include "rolling_planner/session_registry.hpp"
#include "rolling_planner/simulated_collaboration.hpp"
#include "rolling_planner/version.hpp"

namespace {
std::atomic<bool> should_terminate{false};

void handle_signal(int) {
    should_terminate.store(true);
}

using namespace rolling_planner;

constexpr int k_platform_max_iterations{5};
constexpr double k_collaboration_quality_step{0.2};
constexpr Duration k_collaboration_period{5.0};
constexpr Duration k_detection_period{30.0};
constexpr Duration k_sample_spacing{30.0};
constexpr Duration k_demo_flight_duration{1'200.0};
constexpr double k_apogee_km{600.0};

struct DemoPlatform final {
    const char* identifier;
    GeodeticCoordinate position;
};

constexpr std::array<DemoPlatform, 6> k_demo_platforms{{
    {"platform-01", GeodeticCoordinate{35.0, 120.0, 1'200.0}},
    {"platform-02", GeodeticCoordinate{20.0, 140.0, 1'200.0}},
    {"platform-03", GeodeticCoordinate{45.0, 160.0, 1'200.0}},
    {"platform-04", GeodeticCoordinate{10.0, 170.0, 1'200.0}},
    {"platform-05", GeodeticCoordinate{30.0, -170.0, 1'200.0}},
    {"platform-06", GeodeticCoordinate{50.0, -150.0, 1'200.0}},
}}; /**< Fixed constellation used by the demo. */

struct DemoLaunch final {
    GeodeticCoordinate launch;
    GeodeticCoordinate aim;
};

constexpr std::array<DemoLaunch, 3> k_demo_launches{{
    {GeodeticCoordinate{40.0, 125.0, 0.0}, GeodeticCoordinate{21.3, -157.8, 0.0}},
    {GeodeticCoordinate{38.5, 127.5, 0.0}, GeodeticCoordinate{47.6, -122.3, 0.0}},
    {GeodeticCoordinate{41.0, 129.0, 0.0}, GeodeticCoordinate{13.4, 144.8, 0.0}},
}};

/**
 * @brief Ballistic-looking target: linear ground track with a parabolic altitude profile.
 */
Target make_demo_target(std::size_t sequence, const DemoLaunch& launch, SimTimePoint launch_time) {
    Target target{};
    target.identifier = fmt::format("target-{:03d}", sequence);
    target.launch_position = launch.launch;
    target.aim_position = launch.aim;
    target.launch_time = launch_time;
    target.flight_duration = k_demo_flight_duration;
    target.priority = 1.0 + static_cast<double>(sequence % 3);
    target.threat_level = sequence % 2 == 0 ? ThreatLevel::High : ThreatLevel::Medium;

    const auto sample_count = static_cast<std::size_t>(k_demo_flight_duration / k_sample_spacing);
    for (std::size_t index = 0; index <= sample_count; ++index) {
        const double fraction = static_cast<double>(index) / static_cast<double>(sample_count);
        TrajectorySample sample{};
        sample.position.latitude_deg = launch.launch.latitude_deg + (launch.aim.latitude_deg - launch.launch.latitude_deg) * fraction;
        sample.position.longitude_deg = launch.launch.longitude_deg + (launch.aim.longitude_deg - launch.launch.longitude_deg) * fraction;
        sample.position.altitude_km = 4.0 * k_apogee_km * fraction * (1.0 - fraction);
        sample.time = launch_time + std::chrono::duration_cast<SystemClock::duration>(k_sample_spacing * static_cast<double>(index));
        target.trajectory.push_back(sample);
    }
    return target;
}

void drain_events(PlanningEventBus& event_bus) {
    while (true) {
        std::optional<PlanningEvent> optional_event = event_bus.try_consume();
        if (!optional_event.has_value()) {
            break;
        }
        get_logger()->debug(R"({{"component":"events","kind":"{}","cycle":{},"state":"{}","detail":"{}"}})",
                            to_string(optional_event->kind),
                            optional_event->cycle_number,
                            optional_event->state,
                            optional_event->detail);
    }
}
}  // namespace

int main() {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        Configuration configuration = ConfigurationLoader::load();

        if (const char* desired_level = std::getenv("ROLLING_PLANNER_LOG_LEVEL"); desired_level != nullptr) {
            set_log_level(desired_level);
        }
        get_logger()->info("rolling_planner {} starting", k_version);

        RealClock clock;
        InMemorySessionRegistry session_registry;
        StaticPlatformRegistry platform_registry;
        for (const DemoPlatform& demo_platform : k_demo_platforms) {
            platform_registry.add_platform(
                std::make_shared<SimulatedPlatform>(demo_platform.identifier, session_registry, clock, k_platform_max_iterations),
                demo_platform.position);
        }

        SimulatedCollaboration collaboration{session_registry, k_collaboration_quality_step};
        collaboration.start(k_collaboration_period);

        auto report_sink = std::make_shared<FileReportSink>(configuration.report_directory);
        PlanningRuntime runtime{configuration, platform_registry, platform_registry, session_registry, clock, report_sink};
        runtime.run();

        std::size_t detection_sequence = 0;
        auto next_detection = SteadyClock::now();
        while (!should_terminate.load() && runtime.cycle_manager().is_running()) {
            if (SteadyClock::now() >= next_detection) {
                const DemoLaunch& launch = k_demo_launches[detection_sequence % k_demo_launches.size()];
                runtime.submit_detections({make_demo_target(++detection_sequence, launch, clock.simulation_time())});
                next_detection = SteadyClock::now() + std::chrono::duration_cast<SteadyClock::duration>(k_detection_period);
            }
            drain_events(runtime.event_bus());
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        runtime.shutdown();
        collaboration.stop();
        drain_events(runtime.event_bus());
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
            flush_logger();
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
