#include "fitz/core/GameStateMachine.h"
#include "services/logger/LogManager.h"

namespace fitz {

using logging::LogManager;

const char* to_string(GameState state) noexcept {
    switch (state) {
        case GameState::Title: return "Title";
        case GameState::Play: return "Play";
        case GameState::GameOver: return "GameOver";
        default: return "Unknown";
    }
}

GameStateMachine::GameStateMachine(const LifecycleOrchestrator& lifecycle, ScreenLayout layout)
    : lifecycle_(lifecycle), layout_(layout) {}

FrameSignal GameStateMachine::handleEvent(GameSession& session, const InputEvent& event) const {
    if (event.kind == InputKind::Cancel) {
        LogManager::info("Quit requested from {}", to_string(session.state));
        return FrameSignal::Quit;
    }

    if (session.gameOver || session.state == GameState::GameOver) {
        handleGameOver(session, event);
        return FrameSignal::Continue;
    }

    switch (session.state) {
        case GameState::Title: handleTitle(session, event); break;
        case GameState::Play: handlePlay(session, event); break;
        case GameState::GameOver: break;
    }
    return FrameSignal::Continue;
}

void GameStateMachine::handleGameOver(GameSession& session, const InputEvent& event) const {
    switch (event.kind) {
        case InputKind::Confirm:
        case InputKind::PointerPress:
        case InputKind::PointerRelease:
        case InputKind::TouchPress:
            LogManager::info("Restarting after game over (final score {})", session.score);
            lifecycle_.resetSession(session);
            break;
        default:
            break;
    }
}

void GameStateMachine::handleTitle(GameSession& session, const InputEvent& event) const {
    switch (event.kind) {
        case InputKind::Confirm:
            enterPlay(session, "confirm");
            break;
        case InputKind::PointerPress:
        case InputKind::PointerRelease:
            if (layout_.startButton.contains(event.point)) enterPlay(session, "pointer");
            break;
        case InputKind::TouchPress: {
            const Point px{ event.point.x * static_cast<float>(layout_.width),
                            event.point.y * static_cast<float>(layout_.height) };
            if (layout_.startButton.contains(px)) enterPlay(session, "touch");
            break;
        }
        default:
            break;
    }
}

void GameStateMachine::handlePlay(GameSession& session, const InputEvent& event) const {
    if (event.kind != InputKind::Intent || event.direction == Direction::None) return;
    if (!session.engine) return;
    session.engine->player().nextDir = event.direction;
}

void GameStateMachine::enterPlay(GameSession& session, const char* trigger) const {
    session.state = GameState::Play;
    LogManager::info("Title -> Play ({}), level {}", trigger, session.level);
}

} // namespace fitz
