#include "controller/TargetController.hpp"

namespace reflex::controller {

using reflex::core::Seconds;
using reflex::core::Target;
using reflex::core::TargetKind;

TargetController::TargetController(reflex::core::GameState& game)
    : game_{game}
{
}

void TargetController::handleHit(const Target& target, const std::vector<Target>& caughtInBlast) {
    // Clicks after the session ended are ignored
    if (!game_.isActive()) {
        return;
    }

    const auto& cfg = game_.config();

    switch (target.kind) {
    case TargetKind::Good:
        game_.hitGood(target.pointValue);
        break;
    case TargetKind::Bad:
        game_.hitBad(target.pointValue);
        break;
    case TargetKind::PowerUpSlowMotion:
        game_.hitPowerUp(core::PowerUpType::SlowMotion, Seconds{cfg.powerUpDurations.slowMotion});
        break;
    case TargetKind::PowerUpDoubleScore:
        game_.hitPowerUp(core::PowerUpType::DoubleScore, Seconds{cfg.powerUpDurations.doubleScore});
        break;
    case TargetKind::PowerUpShield:
        game_.hitPowerUp(core::PowerUpType::Shield, Seconds{0.0});
        break;
    case TargetKind::PowerUpTimeFreeze:
        game_.hitPowerUp(core::PowerUpType::TimeFreeze, Seconds{cfg.powerUpDurations.timeFreeze});
        break;
    case TargetKind::Bomb: {
        std::vector<int> blasted;
        blasted.reserve(caughtInBlast.size());
        for (const auto& other : caughtInBlast) {
            if (core::isBombTarget(other.kind)) {
                blasted.push_back(other.pointValue);
            }
        }
        game_.hitBomb(target.pointValue, blasted);
        break;
    }
    case TargetKind::Moving:
        game_.hitSpecial(target.pointValue, cfg.specialMultipliers.moving);
        break;
    case TargetKind::Tiny:
        game_.hitSpecial(target.pointValue, cfg.specialMultipliers.tiny);
        break;
    case TargetKind::Giant:
        game_.hitSpecial(target.pointValue, cfg.specialMultipliers.giant);
        break;
    }
}

void TargetController::handleMiss(const Target& target) {
    if (target.kind == TargetKind::Good) {
        game_.missGood(target.pointValue);
    }
}

void TargetController::update(Duration elapsed) {
    game_.tick(elapsed);
}

} // namespace reflex::controller
