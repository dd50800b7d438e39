#include <catch2/catch_test_macros.hpp>
#include "fitz/core/LifecycleOrchestrator.h"
#include "fitz/core/SimulationStepper.h"
#include "support/ScriptedLevel.h"

#include <chrono>
#include <limits>

using namespace fitz;
using fitz::testing::ScriptedLevelEngine;
using fitz::testing::ScriptedLevelFactory;
using namespace std::chrono_literals;

namespace {

struct StepperFixture {
    explicit StepperFixture(SimulationConfig c = {}) : cfg(c), lifecycle(factory, cfg), stepper(lifecycle, cfg) {}

    void start() {
        lifecycle.resetSession(session);
        session.state = GameState::Play;
    }

    ScriptedLevelEngine& engine() { return static_cast<ScriptedLevelEngine&>(*session.engine); }

    ScriptedLevelFactory factory{};
    SimulationConfig cfg{};
    LifecycleOrchestrator lifecycle;
    SimulationStepper stepper;
    GameSession session{};
};

} // namespace

TEST_CASE("one second at 10 Hz runs the tick cap and keeps the rest", "[stepper]") {
    StepperFixture f;
    f.start();

    StepReport r = f.stepper.advance(f.session, 1.0);
    REQUIRE(r.ticks == 5);
    REQUIRE(r.deferred);
    REQUIRE(f.engine().ticks == 5);
    REQUIRE(f.session.timeBudget == 500ms);

    r = f.stepper.advance(f.session, 0.0);
    REQUIRE(r.ticks == 5);
    REQUIRE_FALSE(r.deferred);
    REQUIRE(f.session.timeBudget == 0ms);
}

TEST_CASE("sub-tick deltas accumulate across frames", "[stepper]") {
    StepperFixture f;
    f.start();

    REQUIRE(f.stepper.advance(f.session, 0.05).ticks == 0);
    REQUIRE(f.session.timeBudget == 50ms);
    REQUIRE(f.stepper.advance(f.session, 0.05).ticks == 1);
    REQUIRE(f.session.timeBudget == 0ms);
}

TEST_CASE("advance does nothing outside Play", "[stepper]") {
    StepperFixture f;
    f.lifecycle.resetSession(f.session);
    REQUIRE(f.session.state == GameState::Title);

    StepReport r = f.stepper.advance(f.session, 1.0);
    REQUIRE(r.ticks == 0);
    REQUIRE(f.session.timeBudget == 0ms);
    REQUIRE(f.session.animTime == 0.0);
}

TEST_CASE("negative and non-finite deltas count as zero", "[stepper]") {
    StepperFixture f;
    f.start();

    REQUIRE(f.stepper.advance(f.session, -0.5).ticks == 0);
    REQUIRE(f.stepper.advance(f.session, std::numeric_limits<double>::quiet_NaN()).ticks == 0);
    REQUIRE(f.stepper.advance(f.session, std::numeric_limits<double>::infinity()).ticks == 0);
    REQUIRE(f.session.timeBudget == 0ms);
    REQUIRE(f.session.animTime == 0.0);
}

TEST_CASE("the animation clock follows real time while playing", "[stepper]") {
    StepperFixture f;
    f.start();
    f.stepper.advance(f.session, 0.25);
    f.stepper.advance(f.session, 0.25);
    REQUIRE(f.session.animTime == 0.5);
}

TEST_CASE("a pellet is eaten only at a tile center", "[stepper]") {
    StepperFixture f;
    f.factory.setup = [](ScriptedLevelEngine& e) {
        e.placePellet({1, 2});
        e.placePellet({2, 1});
        e.onTick = [](ScriptedLevelEngine& s, int tick) {
            if (tick == 1) s.player().pos = {5, 4};  // between (1,1) and (2,1)
            if (tick == 2) s.player().pos = {4, 8};  // center of (1,2)
        };
    };
    f.start();
    REQUIRE(f.engine().pelletsRemaining() == 3);

    StepReport r = f.stepper.advance(f.session, 0.1);
    REQUIRE(r.pelletsEaten == 0);
    REQUIRE(f.session.score == 0);

    r = f.stepper.advance(f.session, 0.1);
    REQUIRE(r.pelletsEaten == 1);
    REQUIRE(f.session.score == 10);
    REQUIRE(f.engine().pelletsRemaining() == 2);
    const TileObject* tile = f.engine().tileAt({1, 2});
    REQUIRE(tile->destroyed);
    REQUIRE(tile->kind == TileKind::Empty);

    // Standing on the eaten tile again scores nothing.
    r = f.stepper.advance(f.session, 0.1);
    REQUIRE(r.pelletsEaten == 0);
    REQUIRE(f.session.score == 10);
}

TEST_CASE("pellet score is configurable", "[stepper]") {
    SimulationConfig cfg;
    cfg.pelletScore = 50;
    StepperFixture f(cfg);
    f.factory.setup = [](ScriptedLevelEngine& e) {
        e.placePellet({1, 2});
        e.onTick = [](ScriptedLevelEngine& s, int) { s.player().pos = {4, 8}; };
    };
    f.start();
    f.stepper.advance(f.session, 0.1);
    REQUIRE(f.session.score == 50);
}

TEST_CASE("clearing the last pellet advances exactly one level", "[stepper][lifecycle]") {
    StepperFixture f;
    f.factory.setup = [](ScriptedLevelEngine& e) {
        e.onTick = [](ScriptedLevelEngine& s, int) { s.player().pos = toAbs({27, 23}); };
    };
    f.start();
    const int createsBefore = f.factory.createCalls;

    StepReport r = f.stepper.advance(f.session, 1.0);
    REQUIRE(r.levelAdvanced);
    REQUIRE(r.ticks == 1);
    REQUIRE(f.session.level == 2);
    REQUIRE(f.session.score == 10);
    REQUIRE(f.session.timeBudget == 0ms);
    REQUIRE(f.factory.createCalls == createsBefore + 1);
    REQUIRE(f.session.engine->levelIndex() == 2);
    REQUIRE(f.session.engine->pelletsRemaining() == 1);
    REQUIRE(f.session.engine->player().active);

    // Only two levels exist: the next clear wraps back to level 1.
    r = f.stepper.advance(f.session, 1.0);
    REQUIRE(r.levelAdvanced);
    REQUIRE(f.session.level == 1);
    REQUIRE(f.session.score == 20);
}

TEST_CASE("a catch costs a life and rebuilds the level", "[stepper][lifecycle]") {
    StepperFixture f;
    f.factory.setup = [](ScriptedLevelEngine& e) {
        e.onTick = [](ScriptedLevelEngine& s, int tick) {
            if (tick == 2) s.pursuers()[1].pos = s.player().pos;
        };
    };
    f.start();
    ScriptedLevelEngine* first = f.factory.last;

    StepReport r = f.stepper.advance(f.session, 1.0);
    REQUIRE(r.collision);
    REQUIRE(r.catchingPursuer == std::optional<std::size_t>{1});
    REQUIRE(r.ticks == 2);
    REQUIRE(f.session.lives == 1);
    REQUIRE_FALSE(f.session.gameOver);
    REQUIRE(f.session.state == GameState::Play);
    REQUIRE(f.session.timeBudget == 0ms);
    REQUIRE(f.factory.last != first);
    REQUIRE(f.session.engine->player().active);
}

TEST_CASE("running out of lives ends the game and freezes the simulation", "[stepper][lifecycle]") {
    SimulationConfig cfg;
    cfg.startingLives = 0;
    StepperFixture f(cfg);
    f.factory.setup = [](ScriptedLevelEngine& e) {
        e.onTick = [](ScriptedLevelEngine& s, int) { s.pursuers()[0].pos = s.player().pos; };
    };
    f.start();

    StepReport r = f.stepper.advance(f.session, 0.1);
    REQUIRE(r.collision);
    REQUIRE(f.session.lives == -1);
    REQUIRE(f.session.gameOver);
    REQUIRE(f.session.state == GameState::GameOver);

    r = f.stepper.advance(f.session, 1.0);
    REQUIRE(r.ticks == 0);
}

TEST_CASE("caged pursuers on top of the player do not catch", "[stepper]") {
    StepperFixture f;
    f.factory.setup = [](ScriptedLevelEngine& e) {
        e.pursuers()[0].caged = true;
        e.pursuers()[0].pos = e.player().pos;
    };
    f.start();
    StepReport r = f.stepper.advance(f.session, 0.3);
    REQUIRE(r.ticks == 3);
    REQUIRE_FALSE(r.collision);
    REQUIRE(f.session.lives == 2);
}

TEST_CASE("tick cap is configurable", "[stepper]") {
    SimulationConfig cfg;
    cfg.maxTicksPerFrame = 2;
    cfg.tickHz = 20;
    StepperFixture f(cfg);
    f.start();
    REQUIRE(f.stepper.tickDuration() == 50ms);
    StepReport r = f.stepper.advance(f.session, 0.2);
    REQUIRE(r.ticks == 2);
    REQUIRE(r.deferred);
    REQUIRE(f.session.timeBudget == 100ms);
}
