#include "fitz/core/GameController.h"
#include "services/logger/LogManager.h"

namespace fitz {

GameController::GameController(const LevelFactory& factory, SimulationConfig sim, ScreenLayout screen)
    : lifecycle_(factory, sim)
    , stepper_(lifecycle_, sim)
    , machine_(lifecycle_, screen) {
    lifecycle_.resetSession(session_);
    logging::LogManager::info("Game controller ready: {} Hz, cap {} ticks/frame, threshold {}",
                              sim.tickHz, sim.maxTicksPerFrame, sim.collisionThreshold);
}

FrameSignal GameController::handleEvent(const InputEvent& event) {
    return machine_.handleEvent(session_, event);
}

StepReport GameController::advance(double realDeltaSeconds) {
    return stepper_.advance(session_, realDeltaSeconds);
}

FrameOutcome GameController::frame(std::span<const InputEvent> events, double realDeltaSeconds) {
    FrameOutcome outcome;
    for (const InputEvent& e : events) {
        ++outcome.eventsHandled;
        if (handleEvent(e) == FrameSignal::Quit) {
            outcome.signal = FrameSignal::Quit;
            break;
        }
    }
    outcome.step = advance(realDeltaSeconds);
    return outcome;
}

RenderSnapshot makeSnapshot(const GameSession& session) {
    RenderSnapshot snap;
    snap.state = session.state;
    snap.score = session.score;
    snap.lives = session.lives;
    snap.level = session.level;
    snap.gameOver = session.gameOver;
    snap.animTime = session.animTime;

    if (!session.engine) return snap;
    const LevelEngine& engine = *session.engine;

    snap.gridWidth = engine.gridWidth();
    snap.gridHeight = engine.gridHeight();
    snap.tiles.reserve(static_cast<std::size_t>(snap.gridWidth) * static_cast<std::size_t>(snap.gridHeight));
    for (int y = 0; y < snap.gridHeight; ++y) {
        for (int x = 0; x < snap.gridWidth; ++x) {
            const TileObject* obj = engine.tileAt({x, y});
            if (obj == nullptr || (obj->kind == TileKind::Pellet && obj->destroyed)) {
                snap.tiles.push_back(TileKind::Empty);
            } else {
                snap.tiles.push_back(obj->kind);
            }
        }
    }

    const Agent& p = engine.player();
    snap.player = AgentView{ p.pos, p.dir, p.active, false };
    for (const Agent& g : engine.pursuers()) {
        snap.pursuers.push_back(AgentView{ g.pos, g.dir, g.active, g.caged });
    }
    return snap;
}

} // namespace fitz
