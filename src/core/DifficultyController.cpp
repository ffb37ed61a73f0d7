#include "core/DifficultyController.hpp"
#include <algorithm>

namespace reflex::core {

namespace {

// Medium difficulty never pushes the interval closer than this to the minimum
constexpr double kMediumFloorOffset = 0.2;

} // namespace

DifficultyController::DifficultyController(const GameConfig& config)
    : enabled_{config.enableDynamicDifficulty}
    , initialInterval_{config.spawnInterval}
    , minInterval_{config.minSpawnInterval}
    , maxInterval_{config.maxSpawnInterval}
    , easyThreshold_{config.scoreThresholdEasy}
    , mediumThreshold_{config.scoreThresholdMedium}
    , hardThreshold_{config.scoreThresholdHard}
    , comboSpikeThreshold_{config.comboThresholds.x5}
    , adjustSpeed_{config.difficultyAdjustSpeed}
    , spawnInterval_{config.spawnInterval}
{
}

void DifficultyController::update(Seconds deltaTime, int score, int comboCount) {
    if (!enabled_) return;

    const double dt = deltaTime.count();
    if (dt <= 0.0) return;

    const double step = adjustSpeed_ * dt;

    // Score band: first match wins
    if (score >= hardThreshold_) {
        spawnInterval_ = std::max(minInterval_, spawnInterval_ - step);
    } else if (score >= mediumThreshold_) {
        spawnInterval_ = std::max(minInterval_ + kMediumFloorOffset, spawnInterval_ - step * 0.5);
    } else if (score < easyThreshold_) {
        spawnInterval_ = std::min(maxInterval_, spawnInterval_ + step);
    }

    // Streaks push further in the same tick
    if (comboCount >= comboSpikeThreshold_) {
        spawnInterval_ = std::max(minInterval_, spawnInterval_ - step * 2.0);
    } else if (comboCount == 0 && consecutiveMisses_ >= 3) {
        spawnInterval_ = std::min(maxInterval_, spawnInterval_ + step * 1.5);
    }

    spawnInterval_ = std::clamp(spawnInterval_, minInterval_, maxInterval_);
}

void DifficultyController::onGoodHit() noexcept {
    ++consecutiveGoodHits_;
    consecutiveMisses_ = 0;
}

void DifficultyController::onMissOrBadHit() noexcept {
    ++consecutiveMisses_;
    consecutiveGoodHits_ = 0;
}

void DifficultyController::reset() noexcept {
    spawnInterval_ = initialInterval_;
    consecutiveGoodHits_ = 0;
    consecutiveMisses_ = 0;
}

} // namespace reflex::core
