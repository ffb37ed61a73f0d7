#pragma once

#include "DifficultyController.hpp"
#include "GameEvents.hpp"
#include "Target.hpp"
#include "TimerService.hpp"
#include <random>
#include <utility>
#include <vector>

namespace reflex::core {

// Periodically asks the scene for a new target. The wait between two
// requests is read from the difficulty controller each cycle and runs on
// the scaled clock, so slow motion and time freeze also slow spawning.
class SpawnLoop {
public:
    SpawnLoop(TimerService& timers, GameEvents& events, const DifficultyController& difficulty);

    SpawnLoop(const SpawnLoop&) = delete;
    SpawnLoop& operator=(const SpawnLoop&) = delete;
    ~SpawnLoop();

    // No-op if already running
    void start();
    void stop() noexcept;
    bool isRunning() const noexcept { return timer_ != kInvalidTimer; }

    void setCandidates(std::vector<TargetKind> candidates) { candidates_ = std::move(candidates); }
    const std::vector<TargetKind>& candidates() const noexcept { return candidates_; }

    // For deterministic tests
    void seed(unsigned int value) { rng_.seed(value); }

    std::size_t spawnedCount() const noexcept { return spawned_; }

private:
    TimerService& timers_;
    GameEvents& events_;
    const DifficultyController& difficulty_;

    std::vector<TargetKind> candidates_;
    std::mt19937 rng_;
    TimerHandle timer_{kInvalidTimer};
    std::size_t spawned_{0};

    void scheduleNext();
    void onTimer();
};

} // namespace reflex::core
