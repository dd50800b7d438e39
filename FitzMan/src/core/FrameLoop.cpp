#include "fitz/core/FrameLoop.h"
#include "services/logger/LogManager.h"

#include <utility>

namespace fitz {

FrameLoop::FrameLoop(GameController& controller, FrameHooks hooks)
    : controller_(controller), hooks_(std::move(hooks)) {}

FrameOutcome FrameLoop::runFrame() {
    const double dt = hooks_.frameDelta ? hooks_.frameDelta() : 0.0;
    std::vector<InputEvent> events;
    if (hooks_.poll) events = hooks_.poll();

    FrameOutcome outcome = controller_.frame(events, dt);

    if (hooks_.render) hooks_.render(controller_.snapshot());
    if (hooks_.yield) hooks_.yield();
    return outcome;
}

int FrameLoop::run(int maxFrames) {
    int frames = 0;
    while (maxFrames <= 0 || frames < maxFrames) {
        FrameOutcome outcome = runFrame();
        ++frames;
        if (outcome.signal == FrameSignal::Quit) {
            logging::LogManager::info("Frame loop stopping after {} frames", frames);
            break;
        }
    }
    return frames;
}

} // namespace fitz
