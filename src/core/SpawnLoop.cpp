#include "core/SpawnLoop.hpp"
#include <iostream>

namespace reflex::core {

SpawnLoop::SpawnLoop(TimerService& timers, GameEvents& events, const DifficultyController& difficulty)
    : timers_{timers}
    , events_{events}
    , difficulty_{difficulty}
    , rng_{std::random_device{}()}
{
}

SpawnLoop::~SpawnLoop() {
    stop();
}

void SpawnLoop::start() {
    if (isRunning()) return;
    scheduleNext();
}

void SpawnLoop::stop() noexcept {
    timers_.cancel(timer_);
    timer_ = kInvalidTimer;
}

void SpawnLoop::scheduleNext() {
    timer_ = timers_.schedule(Seconds{difficulty_.spawnInterval()}, ClockKind::Scaled,
                              [this] { onTimer(); });
}

void SpawnLoop::onTimer() {
    timer_ = kInvalidTimer;

    // Reschedule first so a listener stopping the loop wins
    scheduleNext();

    if (candidates_.empty()) {
        std::cerr << "[SpawnLoop] no spawn candidates configured, skipping cycle\n";
        return;
    }

    std::uniform_int_distribution<std::size_t> dist(0, candidates_.size() - 1);
    const TargetKind kind = candidates_[dist(rng_)];
    ++spawned_;
    events_.targetSpawned(kind);
}

} // namespace reflex::core
