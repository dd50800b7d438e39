#pragma once
#include "fitz/core/GameController.h"
#include "fitz/core/InputEvent.h"
#include "fitz/core/RenderSnapshot.h"

#include <functional>
#include <vector>

namespace fitz {

// Platform hooks for one logical thread. yield() runs last in every frame and
// is the only hook allowed to block: it paces to the target frame rate and
// hands control back to a host scheduler where there is one.
struct FrameHooks {
    std::function<double()> frameDelta;
    std::function<std::vector<InputEvent>()> poll;
    std::function<void(const RenderSnapshot&)> render;
    std::function<void()> yield;
};

class FrameLoop {
public:
    FrameLoop(GameController& controller, FrameHooks hooks);

    // delta -> poll -> handle events -> advance -> render -> yield.
    FrameOutcome runFrame();

    // Runs until a quit is signalled (after that frame renders) or maxFrames
    // frames have run when maxFrames > 0. Returns the number of frames run.
    int run(int maxFrames = 0);

private:
    GameController& controller_;
    FrameHooks hooks_{};
};

} // namespace fitz
