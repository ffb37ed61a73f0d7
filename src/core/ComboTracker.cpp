#include "core/ComboTracker.hpp"

namespace reflex::core {

ComboTracker::ComboTracker(TimerService& timers, GameEvents& events,
                           Seconds window, ComboThresholds thresholds)
    : timers_{timers}
    , events_{events}
    , window_{window}
    , thresholds_{thresholds}
{
}

ComboTracker::~ComboTracker() {
    cancelDecay();
}

bool ComboTracker::isDecayPending() const noexcept {
    return decayTimer_ != kInvalidTimer && timers_.isPending(decayTimer_);
}

void ComboTracker::registerHit() {
    ++count_;
    multiplier_ = tierFor(count_, thresholds_);

    // Only one decay may be pending; a fresh hit replaces it.
    // Combo pace follows world speed, hence the scaled clock.
    cancelDecay();
    decayTimer_ = timers_.schedule(window_, ClockKind::Scaled, [this] {
        decayTimer_ = kInvalidTimer;
        reset();
    });

    events_.comboChanged(count_, multiplier_);
}

void ComboTracker::reset() {
    count_ = 0;
    multiplier_ = 1;
    cancelDecay();
    events_.comboChanged(count_, multiplier_);
}

void ComboTracker::clear() noexcept {
    count_ = 0;
    multiplier_ = 1;
    cancelDecay();
}

int ComboTracker::tierFor(int count, const ComboThresholds& thresholds) noexcept {
    if (count >= thresholds.x5) return 5;
    if (count >= thresholds.x3) return 3;
    if (count >= thresholds.x2) return 2;
    return 1;
}

void ComboTracker::cancelDecay() noexcept {
    if (decayTimer_ != kInvalidTimer) {
        timers_.cancel(decayTimer_);
        decayTimer_ = kInvalidTimer;
    }
}

} // namespace reflex::core
