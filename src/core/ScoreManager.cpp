#include "core/ScoreManager.hpp"
#include <algorithm>

namespace reflex::core {

void ScoreManager::add(int amount) noexcept {
    score_ = std::max(0, score_ + amount);
}

void ScoreManager::subtract(int amount) noexcept {
    score_ = std::max(0, score_ - amount);
}

int ScoreManager::applyMultipliers(int base, int comboMultiplier, bool doubleScore) noexcept {
    int amount = base * comboMultiplier;
    if (doubleScore) {
        amount *= 2;
    }
    return amount;
}

} // namespace reflex::core
