#pragma once

#include "ComboTracker.hpp"
#include "DifficultyController.hpp"
#include "GameConfig.hpp"
#include "GameEvents.hpp"
#include "PowerUpController.hpp"
#include "ScoreManager.hpp"
#include "SpawnLoop.hpp"
#include "TimerService.hpp"
#include "Types.hpp"
#include <vector>

namespace reflex::core {

/// Owns one game's score, combo, difficulty, power-ups and spawning.
///
/// Built once by the host and handed by reference to whoever reports
/// target interactions or listens for state changes. Every interaction
/// is a no-op unless the session is Running.
class GameState {
public:
    /// Throws std::invalid_argument if `config` does not validate.
    explicit GameState(GameConfig config = {});

    GameState(const GameState&) = delete;
    GameState& operator=(const GameState&) = delete;

    const GameConfig& config() const noexcept { return config_; }

    int score() const noexcept { return scoreManager_.score(); }
    GameStatus status() const noexcept { return status_; }
    bool isActive() const noexcept { return status_ == GameStatus::Running; }

    int comboCount() const noexcept { return combo_.count(); }
    int comboMultiplier() const noexcept { return combo_.multiplier(); }

    double spawnInterval() const noexcept { return difficulty_.spawnInterval(); }
    double timeScale() const noexcept { return timers_.timeScale(); }
    bool isPowerUpActive(PowerUpType type) const noexcept { return powerUps_.isActive(type); }

    const DifficultyController& difficulty() const noexcept { return difficulty_; }
    const TimerService& timers() const noexcept { return timers_; }
    SpawnLoop& spawner() noexcept { return spawner_; }
    const SpawnLoop& spawner() const noexcept { return spawner_; }

    void addListener(IGameListener* listener) { events_.addListener(listener); }
    void removeListener(IGameListener* listener) { events_.removeListener(listener); }

    // Session control
    void startSession();
    void stopSession();
    void gameOver();

    // One simulation step of `deltaTime` real time. Difficulty sees the
    // scaled delta; timers (combo decay, spawns, power-up expiry) fire here.
    void tick(Seconds deltaTime);

    // Score ledger
    void addScore(int base);
    void decreaseScore(int amount);

    // Interaction events reported by the target layer
    void hitGood(int points);
    void hitBad(int points);
    void hitPowerUp(PowerUpType type, Seconds duration);
    void hitSpecial(int points, int multiplier);
    // `blastedPoints` are the point values of the targets caught in the blast
    void hitBomb(int points, const std::vector<int>& blastedPoints = {});
    void missGood(int points);

private:
    GameConfig config_;

    // Declaration order matters: the timer service must outlive
    // everything that holds timer handles.
    GameEvents events_;
    TimerService timers_;
    ScoreManager scoreManager_;
    DifficultyController difficulty_;
    ComboTracker combo_;
    PowerUpController powerUps_;
    SpawnLoop spawner_;

    GameStatus status_{GameStatus::NotStarted};

    void checkGameOver();
};

} // namespace reflex::core
