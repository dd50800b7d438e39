#include <catch2/catch_test_macros.hpp>
#include "fitz/core/FrameLoop.h"
#include "fitz/core/GameController.h"
#include "support/ScriptedLevel.h"

#include <string>
#include <vector>

using namespace fitz;
using fitz::testing::ScriptedLevelEngine;
using fitz::testing::ScriptedLevelFactory;

namespace {
ScreenLayout layout() {
    ScreenLayout l;
    l.startButton = Rect{ 180.0f, 524.0f, 180.0f, 56.0f };
    return l;
}
}

TEST_CASE("controller starts on the title with a fresh session", "[controller]") {
    ScriptedLevelFactory factory;
    GameController controller(factory, SimulationConfig{}, layout());
    const RenderSnapshot snap = controller.snapshot();
    REQUIRE(snap.state == GameState::Title);
    REQUIRE(snap.lives == 2);
    REQUIRE(snap.score == 0);
    REQUIRE(snap.gridWidth == 28);
    REQUIRE(snap.tiles.size() == 28u * 24u);
    REQUIRE(snap.pursuers.size() == 2);
}

TEST_CASE("a frame applies events in order before advancing", "[controller]") {
    ScriptedLevelFactory factory;
    GameController controller(factory, SimulationConfig{}, layout());

    const std::vector<InputEvent> events{ InputEvent::confirm(), InputEvent::intent(Direction::Down) };
    FrameOutcome out = controller.frame(events, 0.1);
    REQUIRE(out.signal == FrameSignal::Continue);
    REQUIRE(out.eventsHandled == 2);
    REQUIRE(out.step.ticks == 1);
    REQUIRE(controller.session().engine->player().nextDir == Direction::Down);
}

TEST_CASE("a quit stops event handling but the frame still advances", "[controller]") {
    ScriptedLevelFactory factory;
    GameController controller(factory, SimulationConfig{}, layout());
    controller.session().state = GameState::Play;

    const std::vector<InputEvent> events{ InputEvent::cancel(), InputEvent::intent(Direction::Left) };
    FrameOutcome out = controller.frame(events, 0.2);
    REQUIRE(out.signal == FrameSignal::Quit);
    REQUIRE(out.eventsHandled == 1);
    REQUIRE(controller.session().engine->player().nextDir == Direction::None);
    REQUIRE(out.step.ticks == 2);
}

TEST_CASE("snapshot shows eaten pellets as empty", "[controller]") {
    ScriptedLevelFactory factory;
    factory.setup = [](ScriptedLevelEngine& e) {
        e.placePellet({1, 2});
        e.onTick = [](ScriptedLevelEngine& s, int) { s.player().pos = {4, 8}; };
    };
    GameController controller(factory, SimulationConfig{}, layout());
    REQUIRE(controller.snapshot().tileAt(1, 2) == TileKind::Pellet);

    controller.session().state = GameState::Play;
    controller.advance(0.1);
    const RenderSnapshot snap = controller.snapshot();
    REQUIRE(snap.tileAt(1, 2) == TileKind::Empty);
    REQUIRE(snap.score == 10);
    REQUIRE(snap.tileAt(-1, 0) == TileKind::Wall);
}

TEST_CASE("pursuer animation flips six times a second", "[controller]") {
    RenderSnapshot snap;
    snap.animTime = 0.0;
    REQUIRE(snap.animationFrame() == 1);
    snap.animTime = 0.17;
    REQUIRE(snap.animationFrame() == 2);
    snap.animTime = 0.34;
    REQUIRE(snap.animationFrame() == 1);
}

TEST_CASE("frame loop renders the quitting frame and then stops", "[controller]") {
    ScriptedLevelFactory factory;
    GameController controller(factory, SimulationConfig{}, layout());

    std::vector<std::string> calls;
    int frame = 0;
    FrameHooks hooks;
    hooks.frameDelta = [&] { calls.push_back("delta"); return 0.1; };
    hooks.poll = [&] {
        calls.push_back("poll");
        ++frame;
        std::vector<InputEvent> events;
        if (frame == 1) events.push_back(InputEvent::confirm());
        if (frame == 3) events.push_back(InputEvent::cancel());
        return events;
    };
    hooks.render = [&](const RenderSnapshot&) { calls.push_back("render"); };
    hooks.yield = [&] { calls.push_back("yield"); };

    FrameLoop loop(controller, hooks);
    const int frames = loop.run();
    REQUIRE(frames == 3);
    REQUIRE(calls.size() == 12);
    REQUIRE(calls[0] == "delta");
    REQUIRE(calls[1] == "poll");
    REQUIRE(calls[2] == "render");
    REQUIRE(calls[3] == "yield");
    REQUIRE(calls.back() == "yield");
    REQUIRE(static_cast<ScriptedLevelEngine&>(*controller.session().engine).ticks == 3);
}

TEST_CASE("frame loop honours a frame limit", "[controller]") {
    ScriptedLevelFactory factory;
    GameController controller(factory, SimulationConfig{}, layout());
    FrameLoop loop(controller, FrameHooks{});
    REQUIRE(loop.run(4) == 4);
}
