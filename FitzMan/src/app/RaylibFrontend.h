#pragma once
#include "fitz/core/InputEvent.h"
#include "fitz/core/RenderSnapshot.h"
#include "input/TouchControls.h"
#include "services/configuration/GameSettings.h"

#include <vector>

namespace fitz::app {

// Window-side half of the game: turns raylib key, mouse and touch state into
// InputEvents and draws RenderSnapshots with raylib primitives. Requires an
// open window.
class RaylibFrontend {
public:
    explicit RaylibFrontend(WindowSettings window);

    double frameDelta() const;
    std::vector<InputEvent> pollEvents();
    // Opens the frame and draws; presentFrame() closes it.
    void render(const RenderSnapshot& snap);
    // Swaps buffers and sleeps to the target FPS. The frame's only blocking call.
    void presentFrame();

    [[nodiscard]] bool logOverlayVisible() const noexcept { return showLog_; }

private:
    void drawTitle() const;
    void drawBoard(const RenderSnapshot& snap) const;
    void drawPlayer(const RenderSnapshot& snap) const;
    void drawPursuers(const RenderSnapshot& snap) const;
    void drawHud(const RenderSnapshot& snap) const;
    void drawDpad() const;
    void drawGameOver() const;
    void drawLogOverlay() const;

    float boardX(const RenderSnapshot& snap) const;
    float boardY() const;

    WindowSettings window_{};
    input::DpadLayout dpad_{};
    Rect startButton_{};
    int lastTouchCount_ = 0;
    bool showLog_ = false;
};

} // namespace fitz::app
