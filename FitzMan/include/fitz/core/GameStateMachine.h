#pragma once
#include "fitz/core/GameSession.h"
#include "fitz/core/InputEvent.h"
#include "fitz/core/LifecycleOrchestrator.h"

namespace fitz {

enum class FrameSignal { Continue, Quit };

struct ScreenLayout {
    int width = 540;
    int height = 820;
    Rect startButton{};
};

// Title / Play / GameOver transitions driven by input. A cancel input asks the
// frame loop to stop; it is returned, never thrown.
class GameStateMachine {
public:
    GameStateMachine(const LifecycleOrchestrator& lifecycle, ScreenLayout layout);

    FrameSignal handleEvent(GameSession& session, const InputEvent& event) const;

    [[nodiscard]] const ScreenLayout& layout() const noexcept { return layout_; }

private:
    void handleGameOver(GameSession& session, const InputEvent& event) const;
    void handleTitle(GameSession& session, const InputEvent& event) const;
    void handlePlay(GameSession& session, const InputEvent& event) const;
    void enterPlay(GameSession& session, const char* trigger) const;

    const LifecycleOrchestrator& lifecycle_;
    ScreenLayout layout_{};
};

} // namespace fitz
