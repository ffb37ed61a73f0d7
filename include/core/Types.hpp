#pragma once // Include guard

#include <chrono> // For std::chrono::duration
#include <cstdint> // For fixed-width integer types

// Namespace for reflex core types
namespace reflex::core {

// Game time is measured in fractional seconds
using Seconds = std::chrono::duration<double>;

// Which clock a scheduled callback runs on.
// Scaled time follows the world time scale (slow motion, time freeze);
// unscaled time always follows real time.
enum class ClockKind : std::uint8_t {
    Scaled,
    Unscaled
};

// Power-up effect types
enum class PowerUpType : std::uint8_t {
    None,
    SlowMotion,
    DoubleScore,
    Shield,
    TimeFreeze
};

// Lifecycle of one play session
enum class GameStatus {
    NotStarted,
    Running,
    Stopped,
    GameOver
};

// Human-readable name, used by logs and the console host
inline const char* toString(PowerUpType type) {
    switch (type) {
    case PowerUpType::None:        return "None";
    case PowerUpType::SlowMotion:  return "SlowMotion";
    case PowerUpType::DoubleScore: return "DoubleScore";
    case PowerUpType::Shield:      return "Shield";
    case PowerUpType::TimeFreeze:  return "TimeFreeze";
    }
    return "Unknown";
}

} // namespace reflex::core
