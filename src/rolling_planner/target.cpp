#include "rolling_planner/target.hpp"

namespace rolling_planner {

std::string_view to_string(ThreatLevel level) noexcept {
    switch (level) {
        case ThreatLevel::Low:
            return "low";
        case ThreatLevel::Medium:
            return "medium";
        case ThreatLevel::High:
            return "high";
        case ThreatLevel::Critical:
            return "critical";
    }
    return "unknown";
}

SimTimePoint Target::impact_time() const {
    return launch_time + std::chrono::duration_cast<SystemClock::duration>(flight_duration);
}

}  // namespace rolling_planner
