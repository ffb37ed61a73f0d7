#pragma once

#include "Types.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>

namespace reflex::core {

using TimerHandle = std::uint64_t;
inline constexpr TimerHandle kInvalidTimer = 0;

/// Deferred callbacks on two clocks.
///
/// The scaled clock follows the world time scale (0.5 in slow motion,
/// 0 while time is frozen); the unscaled clock always follows real time.
/// Nothing runs until advance() is called, so a callback never fires
/// inside the schedule() call that created it.
class TimerService {
public:
    using Callback = std::function<void()>;

    /// Schedule `callback` to run once `delay` has elapsed on `clock`.
    /// Throws std::invalid_argument on a negative delay or empty callback.
    TimerHandle schedule(Seconds delay, ClockKind clock, Callback callback);

    /// Idempotent; unknown, fired or already cancelled handles are ignored.
    /// Takes effect immediately, even from inside a firing callback.
    void cancel(TimerHandle handle) noexcept;

    /// Advance both clocks by `realDelta` of real time and fire every
    /// timer that became due, earliest first (ties in scheduling order).
    /// The time scale in force at the start of the call applies to the
    /// whole step.
    void advance(Seconds realDelta);

    bool isPending(TimerHandle handle) const noexcept;
    std::size_t pendingCount() const noexcept { return timers_.size(); }

    Seconds scaledNow() const noexcept { return scaledNow_; }
    Seconds unscaledNow() const noexcept { return unscaledNow_; }

    double timeScale() const noexcept { return timeScale_; }
    /// Throws std::invalid_argument if `scale` is negative.
    void setTimeScale(double scale);

private:
    struct Entry {
        ClockKind clock;
        Seconds due;
        Callback callback;
    };

    // Ordered by handle, i.e. by scheduling order
    std::map<TimerHandle, Entry> timers_;
    TimerHandle nextHandle_{1};

    Seconds scaledNow_{0.0};
    Seconds unscaledNow_{0.0};
    double timeScale_{1.0};

    Seconds now(ClockKind clock) const noexcept {
        return clock == ClockKind::Scaled ? scaledNow_ : unscaledNow_;
    }
};

} // namespace reflex::core
