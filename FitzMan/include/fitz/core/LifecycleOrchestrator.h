#pragma once
#include "fitz/core/GameSession.h"
#include "fitz/core/LevelEngine.h"
#include "fitz/core/SimulationConfig.h"

namespace fitz {

class LifecycleOrchestrator {
public:
    LifecycleOrchestrator(const LevelFactory& factory, SimulationConfig config);

    // Full reset back to the title screen: score, lives, level and level state.
    void resetSession(GameSession& session) const;

    // Decrements lives. Returns true when the session just went game over;
    // otherwise the current level is rebuilt and the tick budget cleared.
    bool loseLife(GameSession& session) const;

    // Moves to the next level, wrapping to the first one when no content
    // exists for it. Score and lives carry over.
    void advanceLevel(GameSession& session) const;

    [[nodiscard]] const SimulationConfig& config() const noexcept { return config_; }

private:
    void installLevel(GameSession& session) const;

    const LevelFactory& factory_;
    SimulationConfig config_{};
};

} // namespace fitz
