#include "fleet_sim/clock.hpp"

namespace fleet_sim {

TimePoint SystemClock::now() const {
    return SteadyClock::now();
}

WallTimePoint SystemClock::wall_now() const {
    return std::chrono::system_clock::now();
}

ManualClock::ManualClock(WallTimePoint wall_epoch)
    : wall_epoch_(wall_epoch) {}

TimePoint ManualClock::now() const {
    std::scoped_lock lock(mutex_);
    return steady_now_;
}

WallTimePoint ManualClock::wall_now() const {
    std::scoped_lock lock(mutex_);
    return wall_epoch_ + std::chrono::duration_cast<WallTimePoint::duration>(steady_now_.time_since_epoch());
}

void ManualClock::advance(Duration delta) {
    std::scoped_lock lock(mutex_);
    steady_now_ += delta;
}

}  // namespace fleet_sim
