#pragma once
#include "fitz/core/GameSession.h"
#include "fitz/core/LifecycleOrchestrator.h"
#include "fitz/core/SimulationConfig.h"

#include <cstddef>
#include <optional>

namespace fitz {

struct StepReport {
    int ticks = 0;
    int pelletsEaten = 0;
    bool collision = false;
    std::optional<std::size_t> catchingPursuer{};
    bool levelAdvanced = false;
    // Tick cap reached with at least one whole tick still in the budget.
    bool deferred = false;
};

// Converts variable frame deltas into a bounded number of fixed-duration
// ticks. Excess budget is carried over to later frames, never dropped.
class SimulationStepper {
public:
    SimulationStepper(const LifecycleOrchestrator& lifecycle, SimulationConfig config);

    StepReport advance(GameSession& session, double realDeltaSeconds) const;

    [[nodiscard]] SimDuration tickDuration() const noexcept { return tick_; }

private:
    bool consumePellet(GameSession& session) const;

    const LifecycleOrchestrator& lifecycle_;
    SimulationConfig config_{};
    SimDuration tick_{};
};

} // namespace fitz
