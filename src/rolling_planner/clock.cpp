#include "rolling_planner/clock.hpp"

#include <thread>

namespace rolling_planner {

TimePoint RealClock::now() const {
    return SteadyClock::now();
}

SimTimePoint RealClock::simulation_time() const {
    return SystemClock::now();
}

void RealClock::sleep_for(Duration duration) {
    if (duration.count() <= 0.0) {
        return;
    }
    std::this_thread::sleep_for(std::chrono::duration_cast<SteadyClock::duration>(duration));
}

}  // namespace rolling_planner
