#pragma once

#include "GameConfig.hpp"
#include "Types.hpp"

namespace reflex::core {

class DifficultyController {
public:
    explicit DifficultyController(const GameConfig& config);

    // Seconds between two spawns
    double spawnInterval() const noexcept { return spawnInterval_; }

    int consecutiveGoodHits() const noexcept { return consecutiveGoodHits_; }
    int consecutiveMisses() const noexcept { return consecutiveMisses_; }

    // Call once per simulation tick with the (scaled) elapsed time
    void update(Seconds deltaTime, int score, int comboCount);

    // Call once per interaction event
    void onGoodHit() noexcept;
    void onMissOrBadHit() noexcept;

    void reset() noexcept;

private:
    bool enabled_;
    double initialInterval_;
    double minInterval_;
    double maxInterval_;
    int easyThreshold_;
    int mediumThreshold_;
    int hardThreshold_;
    int comboSpikeThreshold_;
    double adjustSpeed_;

    double spawnInterval_;
    int consecutiveGoodHits_{0};
    int consecutiveMisses_{0};
};

} // namespace reflex::core
