#pragma once

#include "GameEvents.hpp"
#include "TimerService.hpp"
#include "Types.hpp"
#include <array>

namespace reflex::core {

/// Slow motion, double score, shield and time freeze.
///
/// Timed effects expire on the unscaled clock so their own slowdown never
/// stretches them. This class is the only writer of the world time scale:
/// it is recomputed from the active effects (freeze beats slow motion),
/// so one effect expiring never cancels another one's time distortion.
class PowerUpController {
public:
    static constexpr double kSlowMotionScale = 0.5;
    static constexpr double kTimeFreezeScale = 0.0;
    static constexpr double kNormalScale = 1.0;

    PowerUpController(TimerService& timers, GameEvents& events);

    PowerUpController(const PowerUpController&) = delete;
    PowerUpController& operator=(const PowerUpController&) = delete;
    ~PowerUpController();

    /// Re-activating a running effect restarts its duration.
    /// `duration` is ignored for Shield; for the timed effects it must be
    /// positive (std::invalid_argument otherwise). None is ignored.
    void activate(PowerUpType type, Seconds duration);

    /// Consumes an active shield. Returns false if there was none.
    bool consumeShield();

    bool isActive(PowerUpType type) const noexcept;
    bool hasShield() const noexcept { return isActive(PowerUpType::Shield); }
    bool isDoubleScoreActive() const noexcept { return isActive(PowerUpType::DoubleScore); }

    double timeScale() const noexcept { return timers_.timeScale(); }

    // Deactivate everything silently and restore normal time
    void clear();

private:
    struct Effect {
        bool active{false};
        TimerHandle expiry{kInvalidTimer};
    };

    TimerService& timers_;
    GameEvents& events_;
    std::array<Effect, 5> effects_{}; // indexed by PowerUpType

    Effect& effect(PowerUpType type) noexcept;
    const Effect& effect(PowerUpType type) const noexcept;

    void activateTimed(PowerUpType type, Seconds duration);
    void expire(PowerUpType type);
    void applyTimeScale();
};

} // namespace reflex::core
