#pragma once

#include "Types.hpp"
#include <cstdint>

namespace reflex::core {

// Every kind of target the spawner can throw into the scene
enum class TargetKind : std::uint8_t {
    Good,
    Bad,
    PowerUpSlowMotion,
    PowerUpDoubleScore,
    PowerUpShield,
    PowerUpTimeFreeze,
    Bomb,
    Moving,
    Tiny,
    Giant
};

// Plain description of a target as seen by the interaction layer.
// The core never owns targets; it only hears what happened to them.
struct Target {
    TargetKind kind{TargetKind::Good};
    int pointValue{1};
};

// Power-up granted by a target kind, or PowerUpType::None
inline PowerUpType powerUpFor(TargetKind kind) {
    switch (kind) {
    case TargetKind::PowerUpSlowMotion:  return PowerUpType::SlowMotion;
    case TargetKind::PowerUpDoubleScore: return PowerUpType::DoubleScore;
    case TargetKind::PowerUpShield:      return PowerUpType::Shield;
    case TargetKind::PowerUpTimeFreeze:  return PowerUpType::TimeFreeze;
    default:                             return PowerUpType::None;
    }
}

// A bomb only takes scoring targets down with it
inline bool isBombTarget(TargetKind kind) {
    switch (kind) {
    case TargetKind::Good:
    case TargetKind::Moving:
    case TargetKind::Tiny:
    case TargetKind::Giant:
        return true;
    default:
        return false;
    }
}

inline const char* toString(TargetKind kind) {
    switch (kind) {
    case TargetKind::Good:               return "Good";
    case TargetKind::Bad:                return "Bad";
    case TargetKind::PowerUpSlowMotion:  return "PowerUp(SlowMotion)";
    case TargetKind::PowerUpDoubleScore: return "PowerUp(DoubleScore)";
    case TargetKind::PowerUpShield:      return "PowerUp(Shield)";
    case TargetKind::PowerUpTimeFreeze:  return "PowerUp(TimeFreeze)";
    case TargetKind::Bomb:               return "Bomb";
    case TargetKind::Moving:             return "Moving";
    case TargetKind::Tiny:               return "Tiny";
    case TargetKind::Giant:              return "Giant";
    }
    return "Unknown";
}

} // namespace reflex::core
