#pragma once
#include <chrono>

namespace fitz {

using SimDuration = std::chrono::nanoseconds;

// Tuning constants for the simulation core. The collision threshold and tick
// cap have no derivation beyond play-testing; keep them adjustable.
struct SimulationConfig {
    int tickHz = 10;
    int maxTicksPerFrame = 5;
    int collisionThreshold = 3;
    int pelletScore = 10;
    int startingLives = 2;
    int firstLevel = 1;

    [[nodiscard]] SimDuration tickDuration() const noexcept {
        const int hz = tickHz > 0 ? tickHz : 1;
        return SimDuration{ std::chrono::seconds{1} } / hz;
    }
};

} // namespace fitz
