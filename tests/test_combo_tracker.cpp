#include <catch2/catch_test_macros.hpp>

#include <utility>

#include "core/ComboTracker.hpp"
#include "core/GameEvents.hpp"
#include "core/TimerService.hpp"
#include "RecordingListener.hpp"

using namespace reflex::core;

namespace {

struct ComboFixture {
    TimerService timers;
    GameEvents events;
    RecordingListener listener;
    ComboTracker combo{timers, events, Seconds{2.0}, ComboThresholds{3, 5, 10}};

    ComboFixture() { events.addListener(&listener); }
};

} // namespace

TEST_CASE("ComboTracker: tier table follows thresholds", "[combo]")
{
    const ComboThresholds t{3, 5, 10};

    CHECK(ComboTracker::tierFor(0, t) == 1);
    CHECK(ComboTracker::tierFor(2, t) == 1);
    CHECK(ComboTracker::tierFor(3, t) == 2);
    CHECK(ComboTracker::tierFor(4, t) == 2);
    CHECK(ComboTracker::tierFor(5, t) == 3);
    CHECK(ComboTracker::tierFor(9, t) == 3);
    CHECK(ComboTracker::tierFor(10, t) == 5);
    CHECK(ComboTracker::tierFor(50, t) == 5);
}

TEST_CASE("ComboTracker: hits inside the window climb the tiers monotonically", "[combo]")
{
    ComboFixture f;

    int lastTier = 1;
    for (int i = 1; i <= 12; ++i) {
        f.combo.registerHit();
        f.timers.advance(Seconds{1.0}); // well inside the 2s window

        REQUIRE(f.combo.count() == i);
        CHECK(f.combo.multiplier() >= lastTier);
        CHECK(f.combo.multiplier() == ComboTracker::tierFor(i, ComboThresholds{3, 5, 10}));
        lastTier = f.combo.multiplier();
    }

    CHECK(f.combo.multiplier() == 5);
    REQUIRE(f.listener.combos.size() == 12);
    CHECK(f.listener.combos[2] == std::make_pair(3, 2));
    CHECK(f.listener.combos[4] == std::make_pair(5, 3));
    CHECK(f.listener.combos[9] == std::make_pair(10, 5));
}

TEST_CASE("ComboTracker: decays exactly once after the window", "[combo]")
{
    ComboFixture f;

    f.combo.registerHit();
    f.combo.registerHit();
    REQUIRE(f.combo.isDecayPending());
    f.listener.clear();

    f.timers.advance(Seconds{1.5});
    CHECK(f.combo.count() == 2);
    CHECK(f.listener.combos.empty());

    f.timers.advance(Seconds{0.5});
    CHECK(f.combo.count() == 0);
    CHECK(f.combo.multiplier() == 1);
    REQUIRE(f.listener.combos.size() == 1);
    CHECK(f.listener.combos[0] == std::make_pair(0, 1));
    CHECK_FALSE(f.combo.isDecayPending());

    f.timers.advance(Seconds{10.0});
    CHECK(f.listener.combos.size() == 1);
}

TEST_CASE("ComboTracker: a fresh hit replaces the pending decay", "[combo]")
{
    ComboFixture f;

    f.combo.registerHit();
    f.timers.advance(Seconds{1.5});
    f.combo.registerHit();

    // The first window would have closed here
    f.timers.advance(Seconds{1.0});
    CHECK(f.combo.count() == 2);
    CHECK(f.timers.pendingCount() == 1);

    f.timers.advance(Seconds{1.0});
    CHECK(f.combo.count() == 0);
}

TEST_CASE("ComboTracker: decay runs on the scaled clock", "[combo]")
{
    ComboFixture f;

    f.combo.registerHit();
    f.timers.setTimeScale(0.5);

    f.timers.advance(Seconds{2.0});
    CHECK(f.combo.count() == 1);

    f.timers.advance(Seconds{2.0});
    CHECK(f.combo.count() == 0);
}

TEST_CASE("ComboTracker: reset always notifies, clear never does", "[combo]")
{
    ComboFixture f;

    f.combo.reset();
    f.combo.reset();
    REQUIRE(f.listener.combos.size() == 2);
    CHECK(f.listener.combos[1] == std::make_pair(0, 1));

    f.combo.registerHit();
    f.listener.clear();

    f.combo.clear();
    CHECK(f.combo.count() == 0);
    CHECK_FALSE(f.combo.isDecayPending());
    CHECK(f.listener.combos.empty());

    f.timers.advance(Seconds{5.0});
    CHECK(f.listener.combos.empty());
}

TEST_CASE("ComboTracker: custom thresholds", "[combo]")
{
    TimerService timers;
    GameEvents events;
    ComboTracker combo{timers, events, Seconds{1.0}, ComboThresholds{1, 2, 4}};

    combo.registerHit();
    CHECK(combo.multiplier() == 2);
    combo.registerHit();
    CHECK(combo.multiplier() == 3);
    combo.registerHit();
    CHECK(combo.multiplier() == 3);
    combo.registerHit();
    CHECK(combo.multiplier() == 5);
}
