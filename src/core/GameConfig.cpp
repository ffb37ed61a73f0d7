#include "core/GameConfig.hpp"
#include <stdexcept>
#include <string>

namespace reflex::core {

namespace {

void requirePositive(double value, const char* field) {
    if (!(value > 0.0)) {
        throw std::invalid_argument(std::string("GameConfig: ") + field + " must be positive");
    }
}

} // namespace

void GameConfig::validate() const {
    requirePositive(minSpawnInterval, "minSpawnInterval");
    requirePositive(maxSpawnInterval, "maxSpawnInterval");
    requirePositive(spawnInterval, "spawnInterval");
    if (minSpawnInterval > maxSpawnInterval) {
        throw std::invalid_argument("GameConfig: minSpawnInterval must not exceed maxSpawnInterval");
    }
    if (spawnInterval < minSpawnInterval || spawnInterval > maxSpawnInterval) {
        throw std::invalid_argument("GameConfig: spawnInterval must lie within [minSpawnInterval, maxSpawnInterval]");
    }

    requirePositive(comboTimeWindow, "comboTimeWindow");
    requirePositive(comboThresholds.x2, "comboThresholds.x2");
    if (!(comboThresholds.x2 < comboThresholds.x3 && comboThresholds.x3 < comboThresholds.x5)) {
        throw std::invalid_argument("GameConfig: comboThresholds must be strictly increasing (x2 < x3 < x5)");
    }

    requirePositive(scoreThresholdEasy, "scoreThresholdEasy");
    if (!(scoreThresholdEasy < scoreThresholdMedium && scoreThresholdMedium < scoreThresholdHard)) {
        throw std::invalid_argument("GameConfig: score thresholds must satisfy easy < medium < hard");
    }
    requirePositive(difficultyAdjustSpeed, "difficultyAdjustSpeed");

    requirePositive(powerUpDurations.slowMotion, "powerUpDurations.slowMotion");
    requirePositive(powerUpDurations.doubleScore, "powerUpDurations.doubleScore");
    requirePositive(powerUpDurations.timeFreeze, "powerUpDurations.timeFreeze");

    requirePositive(specialMultipliers.moving, "specialMultipliers.moving");
    requirePositive(specialMultipliers.tiny, "specialMultipliers.tiny");
    requirePositive(specialMultipliers.giant, "specialMultipliers.giant");
}

} // namespace reflex::core
