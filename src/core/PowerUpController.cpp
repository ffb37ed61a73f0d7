#include "core/PowerUpController.hpp"
#include <cstddef>
#include <stdexcept>

namespace reflex::core {

PowerUpController::PowerUpController(TimerService& timers, GameEvents& events)
    : timers_{timers}
    , events_{events}
{
}

PowerUpController::~PowerUpController() {
    for (auto& e : effects_) {
        timers_.cancel(e.expiry);
    }
}

void PowerUpController::activate(PowerUpType type, Seconds duration) {
    switch (type) {
    case PowerUpType::None:
        return;
    case PowerUpType::Shield:
        effect(type).active = true;
        events_.powerUpActivated(PowerUpType::Shield, 0.0);
        return;
    case PowerUpType::SlowMotion:
    case PowerUpType::DoubleScore:
    case PowerUpType::TimeFreeze:
        activateTimed(type, duration);
        return;
    }
}

void PowerUpController::activateTimed(PowerUpType type, Seconds duration) {
    if (duration <= Seconds{0.0}) {
        throw std::invalid_argument("PowerUpController::activate: duration must be positive");
    }

    Effect& e = effect(type);

    // No stacking: the new duration replaces whatever was left
    timers_.cancel(e.expiry);
    e.active = true;
    applyTimeScale();

    events_.powerUpActivated(type, duration.count());

    e.expiry = timers_.schedule(duration, ClockKind::Unscaled, [this, type] { expire(type); });
}

void PowerUpController::expire(PowerUpType type) {
    Effect& e = effect(type);
    e.expiry = kInvalidTimer;
    e.active = false;
    applyTimeScale();
    events_.powerUpDeactivated(type);
}

bool PowerUpController::consumeShield() {
    Effect& shield = effect(PowerUpType::Shield);
    if (!shield.active) return false;

    shield.active = false;
    events_.powerUpDeactivated(PowerUpType::Shield);
    return true;
}

bool PowerUpController::isActive(PowerUpType type) const noexcept {
    return effect(type).active;
}

void PowerUpController::clear() {
    for (auto& e : effects_) {
        timers_.cancel(e.expiry);
        e = Effect{};
    }
    applyTimeScale();
}

PowerUpController::Effect& PowerUpController::effect(PowerUpType type) noexcept {
    return effects_[static_cast<std::size_t>(type)];
}

const PowerUpController::Effect& PowerUpController::effect(PowerUpType type) const noexcept {
    return effects_[static_cast<std::size_t>(type)];
}

void PowerUpController::applyTimeScale() {
    if (isActive(PowerUpType::TimeFreeze)) {
        timers_.setTimeScale(kTimeFreezeScale);
    } else if (isActive(PowerUpType::SlowMotion)) {
        timers_.setTimeScale(kSlowMotionScale);
    } else {
        timers_.setTimeScale(kNormalScale);
    }
}

} // namespace reflex::core
