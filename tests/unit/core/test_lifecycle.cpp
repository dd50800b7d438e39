#include <catch2/catch_test_macros.hpp>
#include "fitz/core/LifecycleOrchestrator.h"
#include "support/ScriptedLevel.h"

#include <chrono>

using namespace fitz;
using fitz::testing::ScriptedLevelFactory;
using namespace std::chrono_literals;

TEST_CASE("reset restores starting values and returns to the title", "[lifecycle]") {
    ScriptedLevelFactory factory;
    LifecycleOrchestrator lifecycle(factory, SimulationConfig{});
    GameSession s;
    s.score = 990;
    s.lives = -1;
    s.level = 2;
    s.gameOver = true;
    s.state = GameState::GameOver;
    s.animTime = 12.0;
    s.timeBudget = 300ms;

    lifecycle.resetSession(s);
    REQUIRE(s.score == 0);
    REQUIRE(s.lives == 2);
    REQUIRE(s.level == 1);
    REQUIRE_FALSE(s.gameOver);
    REQUIRE(s.state == GameState::Title);
    REQUIRE(s.animTime == 0.0);
    REQUIRE(s.timeBudget == 0ms);
    REQUIRE(s.engine);
    REQUIRE(s.engine->levelIndex() == 1);
    REQUIRE(s.engine->player().active);
}

TEST_CASE("losing a life with one left keeps playing", "[lifecycle]") {
    ScriptedLevelFactory factory;
    LifecycleOrchestrator lifecycle(factory, SimulationConfig{});
    GameSession s;
    lifecycle.resetSession(s);
    s.state = GameState::Play;
    s.lives = 1;
    s.level = 2;
    s.score = 40;
    s.engine = factory.create(2);
    s.timeBudget = 70ms;

    REQUIRE_FALSE(lifecycle.loseLife(s));
    REQUIRE(s.lives == 0);
    REQUIRE_FALSE(s.gameOver);
    REQUIRE(s.level == 2);
    REQUIRE(s.score == 40);
    REQUIRE(s.engine->levelIndex() == 2);
    REQUIRE(s.timeBudget == 0ms);
}

TEST_CASE("losing a life with none left is game over", "[lifecycle]") {
    ScriptedLevelFactory factory;
    LifecycleOrchestrator lifecycle(factory, SimulationConfig{});
    GameSession s;
    lifecycle.resetSession(s);
    s.state = GameState::Play;
    s.lives = 0;
    const int creates = factory.createCalls;

    REQUIRE(lifecycle.loseLife(s));
    REQUIRE(s.lives == -1);
    REQUIRE(s.gameOver);
    REQUIRE(s.state == GameState::GameOver);
    REQUIRE(factory.createCalls == creates);
}

TEST_CASE("advancing past the last level wraps to the first", "[lifecycle]") {
    ScriptedLevelFactory factory(3);
    LifecycleOrchestrator lifecycle(factory, SimulationConfig{});
    GameSession s;
    lifecycle.resetSession(s);
    s.score = 120;
    s.lives = 1;

    lifecycle.advanceLevel(s);
    REQUIRE(s.level == 2);
    lifecycle.advanceLevel(s);
    REQUIRE(s.level == 3);
    lifecycle.advanceLevel(s);
    REQUIRE(s.level == 1);
    REQUIRE(s.engine->levelIndex() == 1);
    REQUIRE(s.score == 120);
    REQUIRE(s.lives == 1);
}

TEST_CASE("a level that fails to build falls back to the first level", "[lifecycle]") {
    ScriptedLevelFactory factory(3);
    factory.broken = { 2 };
    LifecycleOrchestrator lifecycle(factory, SimulationConfig{});
    GameSession s;
    lifecycle.resetSession(s);

    lifecycle.advanceLevel(s);
    REQUIRE(s.level == 1);
    REQUIRE(s.engine);
    REQUIRE(s.engine->levelIndex() == 1);
}

TEST_CASE("with no buildable level the session has no engine", "[lifecycle]") {
    ScriptedLevelFactory factory(1);
    factory.broken = { 1 };
    LifecycleOrchestrator lifecycle(factory, SimulationConfig{});
    GameSession s;
    lifecycle.resetSession(s);
    REQUIRE_FALSE(s.engine);
    REQUIRE(s.state == GameState::Title);
}
