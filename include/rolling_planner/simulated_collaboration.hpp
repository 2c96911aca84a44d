// === Simulated Collaboration =================================================
//
// In-process stand-ins for the collaborators the planner talks to: a static
// platform registry that also answers position queries, platforms that open
// one discussion session per received task, and a collaboration driver that
// advances those sessions towards convergence. Used by the demo app and the
// tests.

#pragma once

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "rolling_planner/clock.hpp"
#include "rolling_planner/logging.hpp"
#include "rolling_planner/platform.hpp"
#include "rolling_planner/session_registry.hpp"

namespace rolling_planner {

/** @brief Fixed set of platforms with fixed positions. */
class StaticPlatformRegistry final : public PlatformRegistry, public PositionOracle {
  public:
    void add_platform(PlatformHandlePtr handle, std::optional<GeodeticCoordinate> optional_position);
    /** @brief Replace the position reported for @p platform_id; std::nullopt makes it unknown. */
    void set_position(const std::string& platform_id, std::optional<GeodeticCoordinate> optional_position);
    void remove_platform(const std::string& platform_id);

    [[nodiscard]] PlatformMap all_platforms() const override;
    [[nodiscard]] std::optional<GeodeticCoordinate> position_of(const std::string& platform_id,
                                                                 SimTimePoint time) const override;

  private:
    mutable std::mutex mutex_;
    PlatformMap map_platforms_;
    std::map<std::string, std::optional<GeodeticCoordinate>> map_positions_;
};

/** @brief Platform that opens a discussion session for every accepted task. */
class SimulatedPlatform final : public PlatformHandle {
  public:
    SimulatedPlatform(std::string identifier, InMemorySessionRegistry& registry, const Clock& clock, int max_iterations = 5);

    [[nodiscard]] const std::string& identifier() const noexcept override;
    bool receive_task(const TrackingTask& task, const Target& target) override;

    /** @brief When false, incoming tasks are rejected. */
    void set_accepting(bool accepting) noexcept;
    [[nodiscard]] std::vector<TrackingTask> received_tasks() const;

  private:
    std::string str_identifier_;
    InMemorySessionRegistry& registry_;
    const Clock& clock_;
    int max_iterations_;
    std::atomic<bool> flag_accepting_{true};
    std::size_t session_sequence_{};
    mutable std::mutex mutex_;
    std::vector<TrackingTask> list_tasks_;
    std::shared_ptr<spdlog::logger> logger_;
};

/** @brief Advances every active session by one iteration per step. */
class SimulatedCollaboration final {
  public:
    /**
     * @param quality_step Quality gained per iteration.
     */
    SimulatedCollaboration(InMemorySessionRegistry& registry, double quality_step);
    ~SimulatedCollaboration();

    SimulatedCollaboration(const SimulatedCollaboration&) = delete;
    SimulatedCollaboration& operator=(const SimulatedCollaboration&) = delete;

    /** @brief Advance all active sessions once; returns how many were advanced. */
    std::size_t step();

    /** @brief Step on a background thread every @p period until stop(). */
    void start(Duration period);
    void stop();

  private:
    void step_loop(Duration period);

    InMemorySessionRegistry& registry_;
    double quality_step_;
    std::atomic<bool> flag_running_{false};
    std::thread step_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace rolling_planner
