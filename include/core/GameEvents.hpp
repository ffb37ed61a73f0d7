#pragma once

#include "Types.hpp"
#include "Target.hpp"
#include <cstddef>
#include <vector>

namespace reflex::core {

// Observer interface for presentation layers (HUD, audio, effects).
// Every hook has an empty default so listeners override only what they need.
class IGameListener {
public:
    virtual ~IGameListener() = default;

    virtual void onScoreChanged(int /*score*/) {}
    virtual void onGameOver() {}
    virtual void onComboChanged(int /*count*/, int /*multiplier*/) {}
    virtual void onPowerUpActivated(PowerUpType /*type*/, double /*durationSeconds*/) {}
    virtual void onPowerUpDeactivated(PowerUpType /*type*/) {}

    // A new target should be put into the scene
    virtual void onTargetSpawned(TargetKind /*kind*/) {}
};

/// Listener registry with synchronous, in-order delivery.
/// Does not own the listeners; callers keep them alive while registered.
class GameEvents {
public:
    // Both are idempotent
    void addListener(IGameListener* listener);
    void removeListener(IGameListener* listener);

    std::size_t listenerCount() const noexcept { return listeners_.size(); }

    void scoreChanged(int score);
    void gameOver();
    void comboChanged(int count, int multiplier);
    void powerUpActivated(PowerUpType type, double durationSeconds);
    void powerUpDeactivated(PowerUpType type);
    void targetSpawned(TargetKind kind);

private:
    std::vector<IGameListener*> listeners_;

    template <typename Fn>
    void dispatch(Fn&& fn);

    bool isRegistered(const IGameListener* listener) const noexcept;
};

} // namespace reflex::core
