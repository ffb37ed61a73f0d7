#include <catch2/catch_test_macros.hpp>

#include "core/ScoreManager.hpp"

using namespace reflex::core;

TEST_CASE("ScoreManager keeps the score non-negative", "[score]") {
    ScoreManager s;

    SECTION("Adding raises the score") {
        s.add(3);
        s.add(4);
        REQUIRE(s.score() == 7);
    }

    SECTION("Subtracting clamps at zero") {
        s.add(3);
        s.subtract(5);
        REQUIRE(s.score() == 0);
    }

    SECTION("Negative adds clamp at zero too") {
        s.add(2);
        s.add(-10);
        REQUIRE(s.score() == 0);
    }

    SECTION("Reset") {
        s.add(42);
        s.reset();
        REQUIRE(s.score() == 0);
    }
}

TEST_CASE("ScoreManager multiplier rules", "[score]") {
    SECTION("Combo tier multiplies the base") {
        REQUIRE(ScoreManager::applyMultipliers(1, 1, false) == 1);
        REQUIRE(ScoreManager::applyMultipliers(2, 3, false) == 6);
        REQUIRE(ScoreManager::applyMultipliers(1, 5, false) == 5);
    }

    SECTION("Double score doubles after the combo tier") {
        REQUIRE(ScoreManager::applyMultipliers(1, 1, true) == 2);
        REQUIRE(ScoreManager::applyMultipliers(3, 2, true) == 12);
    }

    SECTION("Zero stays zero") {
        REQUIRE(ScoreManager::applyMultipliers(0, 5, true) == 0);
    }
}
