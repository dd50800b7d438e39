#include "fitz/core/SimulationStepper.h"
#include "fitz/core/CollisionDetector.h"
#include "services/logger/LogManager.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <vector>

namespace fitz {

using logging::LogManager;

namespace {

// Upper bound on a single frame delta, keeps the nanosecond conversion in range.
constexpr double kMaxFrameSeconds = 3600.0;

SimDuration toSimDuration(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        LogManager::warn("Ignoring invalid frame delta {}", seconds);
        return SimDuration::zero();
    }
    seconds = std::min(seconds, kMaxFrameSeconds);
    return SimDuration{ static_cast<SimDuration::rep>(std::llround(seconds * 1e9)) };
}

} // namespace

SimulationStepper::SimulationStepper(const LifecycleOrchestrator& lifecycle, SimulationConfig config)
    : lifecycle_(lifecycle), config_(config), tick_(config.tickDuration()) {}

StepReport SimulationStepper::advance(GameSession& session, double realDeltaSeconds) const {
    StepReport report;
    if (session.state != GameState::Play || session.gameOver || !session.engine) {
        return report;
    }

    const SimDuration delta = toSimDuration(realDeltaSeconds);
    session.animTime += std::chrono::duration<double>(delta).count();
    session.timeBudget += delta;

    const int maxTicks = std::max(1, config_.maxTicksPerFrame);
    std::vector<AbsPos> pursuersPrev;
    std::vector<PursuerSample> samples;

    while (session.timeBudget >= tick_ && report.ticks < maxTicks) {
        session.timeBudget -= tick_;
        ++report.ticks;

        LevelEngine& engine = *session.engine;
        const AbsPos playerPrev = engine.player().pos;
        pursuersPrev.clear();
        for (const Agent& g : engine.pursuers()) pursuersPrev.push_back(g.pos);

        engine.tick();

        samples.clear();
        auto pursuers = engine.pursuers();
        for (std::size_t i = 0; i < pursuers.size(); ++i) {
            const AbsPos prev = i < pursuersPrev.size() ? pursuersPrev[i] : pursuers[i].pos;
            samples.push_back(PursuerSample{ prev, pursuers[i].pos, pursuers[i].active, pursuers[i].caged });
        }

        const CollisionParams params{ engine.xPeriod(), config_.collisionThreshold };
        report.catchingPursuer = findCatchingPursuer(playerPrev, engine.player().pos, samples, params);
        if (report.catchingPursuer) {
            report.collision = true;
            LogManager::info("Player caught by pursuer {} at tick {} of this frame", *report.catchingPursuer, report.ticks);
            lifecycle_.loseLife(session);
            return report;
        }

        if (consumePellet(session)) {
            ++report.pelletsEaten;
        }

        if (session.engine->pelletsRemaining() <= 0) {
            report.levelAdvanced = true;
            lifecycle_.advanceLevel(session);
            return report;
        }
    }

    if (report.ticks >= maxTicks && session.timeBudget >= tick_) {
        report.deferred = true;
        LogManager::debug("Tick cap {} reached; deferring {} ms of simulation",
                          maxTicks,
                          std::chrono::duration_cast<std::chrono::milliseconds>(session.timeBudget).count());
    }
    return report;
}

bool SimulationStepper::consumePellet(GameSession& session) const {
    LevelEngine& engine = *session.engine;
    const AbsPos pos = engine.player().pos;
    if (!isOnTileCenter(pos)) return false;

    const TilePos tile = toTile(pos);
    if (tile.x < 0 || tile.x >= engine.gridWidth() || tile.y < 0 || tile.y >= engine.gridHeight()) {
        return false;
    }
    TileObject* obj = engine.tileAt(tile);
    if (obj == nullptr || obj->kind != TileKind::Pellet || obj->destroyed) return false;

    obj->destroyed = true;
    obj->kind = TileKind::Empty;
    engine.decrementPellets();
    session.score += config_.pelletScore;
    LogManager::trace("Pellet eaten at ({}, {}); {} remaining, score {}", tile.x, tile.y, engine.pelletsRemaining(), session.score);
    return true;
}

} // namespace fitz
