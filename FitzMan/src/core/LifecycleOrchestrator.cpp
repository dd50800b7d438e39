#include "fitz/core/LifecycleOrchestrator.h"
#include "services/logger/LogManager.h"

namespace fitz {

using logging::LogManager;

LifecycleOrchestrator::LifecycleOrchestrator(const LevelFactory& factory, SimulationConfig config)
    : factory_(factory), config_(config) {}

void LifecycleOrchestrator::installLevel(GameSession& session) const {
    session.engine = factory_.create(session.level);
    if (!session.engine && session.level != config_.firstLevel) {
        LogManager::warn("Level {} could not be built; falling back to level {}", session.level, config_.firstLevel);
        session.level = config_.firstLevel;
        session.engine = factory_.create(session.level);
    }
    if (!session.engine) {
        LogManager::error("No level content available for level {}; simulation is idle", session.level);
    } else {
        session.engine->player().active = true;
    }
    session.timeBudget = SimDuration::zero();
}

void LifecycleOrchestrator::resetSession(GameSession& session) const {
    session.score = 0;
    session.lives = config_.startingLives;
    session.level = config_.firstLevel;
    session.gameOver = false;
    session.animTime = 0.0;
    installLevel(session);
    session.state = GameState::Title;
    LogManager::info("Session reset: lives={}, level={}", session.lives, session.level);
}

bool LifecycleOrchestrator::loseLife(GameSession& session) const {
    session.lives -= 1;
    if (session.lives < 0) {
        session.gameOver = true;
        session.state = GameState::GameOver;
        LogManager::info("Game over: score={}, level={}", session.score, session.level);
        return true;
    }
    LogManager::info("Life lost: {} remaining, restarting level {}", session.lives, session.level);
    installLevel(session);
    return false;
}

void LifecycleOrchestrator::advanceLevel(GameSession& session) const {
    const int cleared = session.level;
    session.level += 1;
    if (!factory_.hasLevel(session.level)) {
        LogManager::info("Level {} cleared; no level {} content, wrapping to level {}", cleared, session.level, config_.firstLevel);
        session.level = config_.firstLevel;
    } else {
        LogManager::info("Level {} cleared; advancing to level {}", cleared, session.level);
    }
    installLevel(session);
}

} // namespace fitz
