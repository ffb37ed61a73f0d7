#include "core/GameState.hpp"

namespace reflex::core {

namespace {

const GameConfig& validated(const GameConfig& config) {
    config.validate();
    return config;
}

} // namespace

GameState::GameState(GameConfig config)
    : config_{validated(config)}
    , events_{}
    , timers_{}
    , scoreManager_{}
    , difficulty_{config_}
    , combo_{timers_, events_, Seconds{config_.comboTimeWindow}, config_.comboThresholds}
    , powerUps_{timers_, events_}
    , spawner_{timers_, events_, difficulty_}
    , status_{GameStatus::NotStarted}
{
}

void GameState::startSession() {
    if (status_ == GameStatus::Running) return;

    // Fresh session: nothing from the previous one survives
    scoreManager_.reset();
    combo_.clear();
    difficulty_.reset();
    powerUps_.clear();
    spawner_.stop();

    status_ = GameStatus::Running;

    events_.scoreChanged(scoreManager_.score());
    events_.comboChanged(combo_.count(), combo_.multiplier());

    spawner_.start();
}

void GameState::stopSession() {
    if (status_ != GameStatus::Running) return;

    spawner_.stop();
    combo_.clear();
    status_ = GameStatus::Stopped;
}

void GameState::gameOver() {
    if (status_ != GameStatus::Running) return;

    status_ = GameStatus::GameOver;
    spawner_.stop();
    // A combo decay firing later would otherwise mutate a finished session
    combo_.clear();

    events_.gameOver();
}

void GameState::tick(Seconds deltaTime) {
    if (deltaTime < Seconds{0.0}) return;

    if (isActive()) {
        difficulty_.update(deltaTime * timers_.timeScale(), score(), combo_.count());
    }

    // Timers keep running after game over so power-ups still expire
    // and restore normal time.
    timers_.advance(deltaTime);
}

void GameState::addScore(int base) {
    if (!isActive()) return;

    scoreManager_.add(ScoreManager::applyMultipliers(
        base, combo_.multiplier(), powerUps_.isDoubleScoreActive()));
    events_.scoreChanged(scoreManager_.score());
    checkGameOver();
}

void GameState::decreaseScore(int amount) {
    if (!isActive()) return;

    // A shield swallows the whole hit, whatever its size
    if (powerUps_.consumeShield()) {
        return;
    }

    scoreManager_.subtract(amount);
    events_.scoreChanged(scoreManager_.score());
    checkGameOver();
}

void GameState::checkGameOver() {
    if (scoreManager_.score() <= 0 && isActive()) {
        gameOver();
    }
}

void GameState::hitGood(int points) {
    if (!isActive()) return;

    combo_.registerHit();
    addScore(points);
    if (isActive()) {
        difficulty_.onGoodHit();
    }
}

void GameState::hitBad(int points) {
    if (!isActive()) return;

    combo_.reset();
    decreaseScore(points);
    if (isActive()) {
        difficulty_.onMissOrBadHit();
    }
}

void GameState::hitPowerUp(PowerUpType type, Seconds duration) {
    if (!isActive()) return;

    powerUps_.activate(type, duration);
}

void GameState::hitSpecial(int points, int multiplier) {
    if (!isActive()) return;

    combo_.registerHit();
    addScore(points * multiplier);
    if (isActive()) {
        difficulty_.onGoodHit();
    }
}

void GameState::hitBomb(int points, const std::vector<int>& blastedPoints) {
    if (!isActive()) return;

    for (int blasted : blastedPoints) {
        addScore(blasted);
        if (!isActive()) return;
    }

    combo_.registerHit();
    addScore(points);
}

void GameState::missGood(int points) {
    // Same bookkeeping as hitting a bad target
    hitBad(points);
}

} // namespace reflex::core
