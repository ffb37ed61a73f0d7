#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <random>

#include "core/DifficultyController.hpp"
#include "core/GameConfig.hpp"

using Catch::Approx;
using reflex::core::DifficultyController;
using reflex::core::GameConfig;
using reflex::core::Seconds;

TEST_CASE("DifficultyController: low score slows spawning down", "[difficulty]")
{
    GameConfig cfg; // interval 1.0 in [0.4, 2.0], speed 0.05
    DifficultyController d{cfg};

    d.update(Seconds{1.0}, /*score=*/0, /*combo=*/0);
    CHECK(d.spawnInterval() == Approx(1.05));
}

TEST_CASE("DifficultyController: score bands", "[difficulty]")
{
    GameConfig cfg;
    DifficultyController d{cfg};

    SECTION("between easy and medium nothing changes") {
        d.update(Seconds{1.0}, 30, 1);
        CHECK(d.spawnInterval() == Approx(1.0));
    }

    SECTION("hard band moves toward the minimum at full speed") {
        d.update(Seconds{1.0}, 100, 0);
        CHECK(d.spawnInterval() == Approx(0.95));
    }

    SECTION("medium band moves at half speed and stops above the minimum") {
        d.update(Seconds{1.0}, 50, 0);
        CHECK(d.spawnInterval() == Approx(0.975));

        for (int i = 0; i < 100; ++i) {
            d.update(Seconds{1.0}, 60, 0);
        }
        CHECK(d.spawnInterval() == Approx(cfg.minSpawnInterval + 0.2));
    }
}

TEST_CASE("DifficultyController: combo streak stacks on top of the score band", "[difficulty]")
{
    GameConfig cfg;
    DifficultyController d{cfg};

    d.update(Seconds{1.0}, 100, cfg.comboThresholds.x5);
    // -0.05 from the hard band, then -0.10 from the streak
    CHECK(d.spawnInterval() == Approx(0.85));
}

TEST_CASE("DifficultyController: repeated misses ease off further", "[difficulty]")
{
    GameConfig cfg;
    DifficultyController d{cfg};

    d.onMissOrBadHit();
    d.onMissOrBadHit();
    d.update(Seconds{1.0}, 30, 0);
    CHECK(d.spawnInterval() == Approx(1.0)); // only two misses

    d.onMissOrBadHit();
    d.update(Seconds{1.0}, 0, 0);
    // +0.05 from the easy band, then +0.075 from the misses
    CHECK(d.spawnInterval() == Approx(1.125));

    SECTION("a live combo suppresses the miss rule") {
        d.update(Seconds{1.0}, 30, 1);
        CHECK(d.spawnInterval() == Approx(1.125));
    }
}

TEST_CASE("DifficultyController: hit counters are mutually exclusive", "[difficulty]")
{
    GameConfig cfg;
    DifficultyController d{cfg};

    d.onGoodHit();
    d.onGoodHit();
    CHECK(d.consecutiveGoodHits() == 2);
    CHECK(d.consecutiveMisses() == 0);

    d.onMissOrBadHit();
    CHECK(d.consecutiveGoodHits() == 0);
    CHECK(d.consecutiveMisses() == 1);

    d.onGoodHit();
    CHECK(d.consecutiveGoodHits() == 1);
    CHECK(d.consecutiveMisses() == 0);
}

TEST_CASE("DifficultyController: interval never leaves its bounds", "[difficulty]")
{
    GameConfig cfg;
    DifficultyController d{cfg};

    std::mt19937 rng{1234};
    std::uniform_int_distribution<int> score(0, 200);
    std::uniform_int_distribution<int> combo(0, 15);
    std::uniform_int_distribution<int> event(0, 2);
    std::uniform_real_distribution<double> dt(0.0, 5.0);

    for (int i = 0; i < 5000; ++i) {
        switch (event(rng)) {
        case 0: d.onGoodHit(); break;
        case 1: d.onMissOrBadHit(); break;
        default: break;
        }
        d.update(Seconds{dt(rng)}, score(rng), combo(rng));

        REQUIRE(d.spawnInterval() >= cfg.minSpawnInterval);
        REQUIRE(d.spawnInterval() <= cfg.maxSpawnInterval);
    }
}

TEST_CASE("DifficultyController: long stretches saturate at the bounds", "[difficulty]")
{
    GameConfig cfg;
    DifficultyController d{cfg};

    d.update(Seconds{1000.0}, 500, 20);
    CHECK(d.spawnInterval() == Approx(cfg.minSpawnInterval));

    d.update(Seconds{1000.0}, 0, 0);
    CHECK(d.spawnInterval() == Approx(cfg.maxSpawnInterval));
}

TEST_CASE("DifficultyController: disabled or zero-length ticks change nothing", "[difficulty]")
{
    GameConfig cfg;

    SECTION("zero delta") {
        DifficultyController d{cfg};
        d.update(Seconds{0.0}, 0, 0);
        CHECK(d.spawnInterval() == Approx(1.0));
    }

    SECTION("dynamic difficulty off") {
        cfg.enableDynamicDifficulty = false;
        DifficultyController d{cfg};
        d.update(Seconds{10.0}, 500, 20);
        CHECK(d.spawnInterval() == Approx(1.0));
    }
}

TEST_CASE("DifficultyController: reset restores the starting point", "[difficulty]")
{
    GameConfig cfg;
    DifficultyController d{cfg};

    d.onMissOrBadHit();
    d.update(Seconds{3.0}, 0, 0);
    REQUIRE(d.spawnInterval() > 1.0);

    d.reset();
    CHECK(d.spawnInterval() == Approx(1.0));
    CHECK(d.consecutiveMisses() == 0);
    CHECK(d.consecutiveGoodHits() == 0);
}
