#pragma once

#include "GameConfig.hpp"
#include "GameEvents.hpp"
#include "TimerService.hpp"

namespace reflex::core {

class ComboTracker {
public:
    /// Does not own the timer service or the event registry.
    ComboTracker(TimerService& timers, GameEvents& events,
                 Seconds window, ComboThresholds thresholds);

    ComboTracker(const ComboTracker&) = delete;
    ComboTracker& operator=(const ComboTracker&) = delete;
    ~ComboTracker();

    int count() const noexcept { return count_; }
    int multiplier() const noexcept { return multiplier_; }
    bool isDecayPending() const noexcept;

    // One more consecutive hit; restarts the decay window
    void registerHit();

    // Back to (0, x1). Always notifies, even if already reset.
    void reset();

    // Drop state and the pending decay without notifying anyone
    void clear() noexcept;

    // Highest tier whose threshold is <= count
    static int tierFor(int count, const ComboThresholds& thresholds) noexcept;

private:
    TimerService& timers_;
    GameEvents& events_;
    Seconds window_;
    ComboThresholds thresholds_;

    int count_{0};
    int multiplier_{1};
    TimerHandle decayTimer_{kInvalidTimer};

    void cancelDecay() noexcept;
};

} // namespace reflex::core
