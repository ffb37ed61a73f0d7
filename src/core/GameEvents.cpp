#include "core/GameEvents.hpp"
#include <algorithm>

namespace reflex::core {

void GameEvents::addListener(IGameListener* listener) {
    if (!listener || isRegistered(listener)) return;
    listeners_.push_back(listener);
}

void GameEvents::removeListener(IGameListener* listener) {
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                     listeners_.end());
}

bool GameEvents::isRegistered(const IGameListener* listener) const noexcept {
    return std::find(listeners_.begin(), listeners_.end(), listener) != listeners_.end();
}

template <typename Fn>
void GameEvents::dispatch(Fn&& fn) {
    // Iterate over a snapshot: a listener may add or remove listeners
    // while being notified. Removed ones are skipped for the rest of
    // this dispatch.
    const auto snapshot = listeners_;
    for (IGameListener* listener : snapshot) {
        if (isRegistered(listener)) {
            fn(*listener);
        }
    }
}

void GameEvents::scoreChanged(int score) {
    dispatch([score](IGameListener& l) { l.onScoreChanged(score); });
}

void GameEvents::gameOver() {
    dispatch([](IGameListener& l) { l.onGameOver(); });
}

void GameEvents::comboChanged(int count, int multiplier) {
    dispatch([count, multiplier](IGameListener& l) { l.onComboChanged(count, multiplier); });
}

void GameEvents::powerUpActivated(PowerUpType type, double durationSeconds) {
    dispatch([type, durationSeconds](IGameListener& l) {
        l.onPowerUpActivated(type, durationSeconds);
    });
}

void GameEvents::powerUpDeactivated(PowerUpType type) {
    dispatch([type](IGameListener& l) { l.onPowerUpDeactivated(type); });
}

void GameEvents::targetSpawned(TargetKind kind) {
    dispatch([kind](IGameListener& l) { l.onTargetSpawned(kind); });
}

} // namespace reflex::core
