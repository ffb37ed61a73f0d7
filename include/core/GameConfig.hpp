#pragma once

namespace reflex::core {

// Combo multiplier thresholds (number of consecutive hits).
// Must be strictly increasing.
struct ComboThresholds {
    int x2{3};
    int x3{5};
    int x5{10};
};

struct PowerUpDurations {
    double slowMotion{5.0};   // seconds, real time
    double doubleScore{30.0}; // seconds, real time
    double timeFreeze{3.0};   // seconds, real time
};

// Score multipliers for the special target kinds
struct SpecialMultipliers {
    int moving{2};
    int tiny{3};
    int giant{1};
};

struct GameConfig {
    // Spawn pacing (seconds between spawns)
    double spawnInterval{1.0};
    double minSpawnInterval{0.4};
    double maxSpawnInterval{2.0};

    // Combo
    double comboTimeWindow{2.0}; // seconds, scaled time
    ComboThresholds comboThresholds{};

    // Dynamic difficulty
    bool enableDynamicDifficulty{true};
    int scoreThresholdEasy{20};
    int scoreThresholdMedium{50};
    int scoreThresholdHard{100};
    double difficultyAdjustSpeed{0.05};

    PowerUpDurations powerUpDurations{};
    SpecialMultipliers specialMultipliers{};

    // Throws std::invalid_argument naming the first offending field.
    void validate() const;
};

} // namespace reflex::core
