#include "rolling_planner/simulated_collaboration.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include <fmt/format.h>

namespace rolling_planner {

void StaticPlatformRegistry::add_platform(PlatformHandlePtr handle, std::optional<GeodeticCoordinate> optional_position) {
    if (handle == nullptr) {
        throw std::invalid_argument("Platform handle cannot be null");
    }
    const std::string platform_id = handle->identifier();
    std::scoped_lock lock(mutex_);
    if (map_platforms_.count(platform_id) != 0) {
        throw std::invalid_argument("Platform already registered: " + platform_id);
    }
    map_platforms_.emplace(platform_id, std::move(handle));
    map_positions_[platform_id] = optional_position;
}

void StaticPlatformRegistry::set_position(const std::string& platform_id, std::optional<GeodeticCoordinate> optional_position) {
    std::scoped_lock lock(mutex_);
    if (map_platforms_.count(platform_id) == 0) {
        throw std::invalid_argument("Unknown platform: " + platform_id);
    }
    map_positions_[platform_id] = optional_position;
}

void StaticPlatformRegistry::remove_platform(const std::string& platform_id) {
    std::scoped_lock lock(mutex_);
    map_platforms_.erase(platform_id);
    map_positions_.erase(platform_id);
}

PlatformMap StaticPlatformRegistry::all_platforms() const {
    std::scoped_lock lock(mutex_);
    return map_platforms_;
}

std::optional<GeodeticCoordinate> StaticPlatformRegistry::position_of(const std::string& platform_id, SimTimePoint) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_position = map_positions_.find(platform_id);
    if (iterator_position == map_positions_.end()) {
        return std::nullopt;
    }
    return iterator_position->second;
}

SimulatedPlatform::SimulatedPlatform(std::string identifier, InMemorySessionRegistry& registry, const Clock& clock, int max_iterations)
    : str_identifier_(std::move(identifier)),
      registry_(registry),
      clock_(clock),
      max_iterations_(max_iterations),
      logger_(get_logger()) {
    if (str_identifier_.empty()) {
        throw std::invalid_argument("SimulatedPlatform identifier cannot be empty");
    }
    if (max_iterations_ <= 0) {
        throw std::invalid_argument("SimulatedPlatform max iterations must be positive");
    }
}

const std::string& SimulatedPlatform::identifier() const noexcept {
    return str_identifier_;
}

bool SimulatedPlatform::receive_task(const TrackingTask& task, const Target& target) {
    if (!flag_accepting_.load()) {
        logger_->warn("Platform {} rejected task {}", str_identifier_, task.task_id);
        return false;
    }

    SessionProgress progress{};
    {
        std::scoped_lock lock(mutex_);
        progress.session_id = fmt::format("discussion_{}_{}", task.task_id, ++session_sequence_);
        list_tasks_.push_back(task);
    }
    progress.participants.insert(str_identifier_);
    progress.max_iterations = max_iterations_;
    progress.created_at = clock_.now();
    registry_.open_session(progress);

    logger_->info(R"({{"component":"platform","platform":"{}","task":"{}","target":"{}","session":"{}"}})",
                  str_identifier_,
                  task.task_id,
                  target.identifier,
                  progress.session_id);
    return true;
}

void SimulatedPlatform::set_accepting(bool accepting) noexcept {
    flag_accepting_.store(accepting);
}

std::vector<TrackingTask> SimulatedPlatform::received_tasks() const {
    std::scoped_lock lock(mutex_);
    return list_tasks_;
}

SimulatedCollaboration::SimulatedCollaboration(InMemorySessionRegistry& registry, double quality_step)
    : registry_(registry),
      quality_step_(quality_step),
      logger_(get_logger()) {
    if (quality_step_ < 0.0) {
        throw std::invalid_argument("SimulatedCollaboration quality step must not be negative");
    }
}

SimulatedCollaboration::~SimulatedCollaboration() {
    stop();
}

std::size_t SimulatedCollaboration::step() {
    std::size_t advanced_count = 0;
    for (const std::string& session_id : registry_.list_active_sessions()) {
        const std::optional<SessionProgress> optional_progress = registry_.progress(session_id);
        if (!optional_progress.has_value()) {
            continue;
        }
        registry_.record_iteration(session_id,
                                   optional_progress->iteration + 1,
                                   optional_progress->quality + quality_step_);
        ++advanced_count;
    }
    logger_->debug("Collaboration step advanced {} sessions", advanced_count);
    return advanced_count;
}

void SimulatedCollaboration::start(Duration period) {
    if (period.count() <= 0.0) {
        throw std::invalid_argument("SimulatedCollaboration period must be positive");
    }
    if (flag_running_.exchange(true)) {
        return;
    }
    step_thread_ = std::thread(&SimulatedCollaboration::step_loop, this, period);
}

void SimulatedCollaboration::stop() {
    if (!flag_running_.exchange(false)) {
        return;
    }
    if (step_thread_.joinable()) {
        step_thread_.join();
    }
}

void SimulatedCollaboration::step_loop(Duration period) {
    const auto step_interval = std::chrono::duration_cast<SteadyClock::duration>(period);
    auto next_step = SteadyClock::now() + step_interval;
    while (flag_running_.load()) {
        const TimePoint now = SteadyClock::now();
        if (now < next_step) {
            std::this_thread::sleep_for(std::min<SteadyClock::duration>(next_step - now, std::chrono::milliseconds(100)));
            continue;
        }
        try {
            step();
        } catch (const std::exception& exc) {
            logger_->error("Collaboration step error: {}", exc.what());
        }
        next_step = now + step_interval;
    }
}

}  // namespace rolling_planner
