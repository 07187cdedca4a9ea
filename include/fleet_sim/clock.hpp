// === Clock ===================================================================
//
// Time source abstraction shared by generators, flush timers, and the fleet.
// Production code reads the real clocks through `SystemClock`; tests step time
// explicitly with `ManualClock`.

#pragma once

#include <mutex>

#include "fleet_sim/types.hpp"

namespace fleet_sim {

/** @brief Injectable source of monotonic and wall-clock time. */
class Clock {
  public:
    virtual ~Clock() = default;

    /** @brief Monotonic time used for scheduling decisions. */
    [[nodiscard]] virtual TimePoint now() const = 0;
    /** @brief Wall-clock time stamped onto generated messages. */
    [[nodiscard]] virtual WallTimePoint wall_now() const = 0;
};

/** @brief Clock backed by std::chrono::steady_clock and system_clock. */
class SystemClock final : public Clock {
  public:
    [[nodiscard]] TimePoint now() const override;
    [[nodiscard]] WallTimePoint wall_now() const override;
};

/**
 * @brief Clock that only moves when told to.
 *
 * Wall time advances in lockstep with monotonic time from the configured
 * epoch, so message timestamps stay consistent with scheduling decisions.
 */
class ManualClock final : public Clock {
  public:
    explicit ManualClock(WallTimePoint wall_epoch = WallTimePoint{});

    [[nodiscard]] TimePoint now() const override;
    [[nodiscard]] WallTimePoint wall_now() const override;

    /** @brief Move both clocks forward by @p delta. */
    void advance(Duration delta);

  private:
    mutable std::mutex mutex_;
    TimePoint steady_now_{};
    WallTimePoint wall_epoch_;
};

}  // namespace fleet_sim
