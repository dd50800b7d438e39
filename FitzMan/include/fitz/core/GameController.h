#pragma once
#include "fitz/core/GameSession.h"
#include "fitz/core/GameStateMachine.h"
#include "fitz/core/InputEvent.h"
#include "fitz/core/LevelEngine.h"
#include "fitz/core/LifecycleOrchestrator.h"
#include "fitz/core/RenderSnapshot.h"
#include "fitz/core/SimulationConfig.h"
#include "fitz/core/SimulationStepper.h"

#include <span>

namespace fitz {

struct FrameOutcome {
    FrameSignal signal = FrameSignal::Continue;
    int eventsHandled = 0;
    StepReport step{};
};

// Owns the session and the pieces that act on it. One frame = the events
// received since the last frame, in arrival order, then one simulation advance.
class GameController {
public:
    GameController(const LevelFactory& factory, SimulationConfig sim, ScreenLayout screen);
    GameController(const GameController&) = delete;
    GameController& operator=(const GameController&) = delete;

    FrameSignal handleEvent(const InputEvent& event);
    StepReport advance(double realDeltaSeconds);
    FrameOutcome frame(std::span<const InputEvent> events, double realDeltaSeconds);

    [[nodiscard]] RenderSnapshot snapshot() const { return makeSnapshot(session_); }

    [[nodiscard]] const GameSession& session() const noexcept { return session_; }
    GameSession& session() noexcept { return session_; }
    [[nodiscard]] const SimulationStepper& stepper() const noexcept { return stepper_; }

private:
    GameSession session_{};
    LifecycleOrchestrator lifecycle_;
    SimulationStepper stepper_;
    GameStateMachine machine_;
};

} // namespace fitz
