#pragma once

namespace reflex::core {

// Score ledger. Never goes below zero.
class ScoreManager {
public:
    // Adds an already multiplied amount; the result is floored at 0
    void add(int amount) noexcept;

    // Removes `amount`, floored at 0
    void subtract(int amount) noexcept;

    int score() const noexcept { return score_; }

    void reset() noexcept { score_ = 0; }

    // Points actually awarded for a hit worth `base`
    static int applyMultipliers(int base, int comboMultiplier, bool doubleScore) noexcept;

private:
    int score_{0};
};

} // namespace reflex::core
