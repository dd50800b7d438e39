#include "level/GridLevelEngine.h"
#include "services/logger/LogManager.h"

#include <algorithm>
#include <limits>
#include <utility>

namespace fitz::level {

using logging::LogManager;

namespace {

// Tie-break order when two exits are equally close to the target.
constexpr std::array<Direction, 4> kSteerOrder = {
    Direction::Up, Direction::Left, Direction::Down, Direction::Right
};

} // namespace

GridLevelEngine::GridLevelEngine(int levelIndex, LevelLayout layout, LevelEngineSettings settings)
    : levelIndex_(levelIndex), layout_(std::move(layout)), settings_(settings) {
    tiles_.reserve(layout_.tiles.size());
    for (TileKind kind : layout_.tiles) {
        tiles_.push_back(TileObject{ kind, false });
    }
    pellets_ = layout_.pelletCount();

    player_.id = 0;
    player_.pos = toAbs(layout_.playerStart);
    player_.active = false;

    for (std::size_t i = 0; i < layout_.pursuerSpawns.size(); ++i) {
        Agent g;
        g.id = static_cast<int>(i) + 1;
        g.pos = toAbs(layout_.pursuerSpawns[i]);
        g.active = true;
        g.caged = true;
        pursuers_.push_back(g);
    }

    const int w = layout_.width;
    const int h = layout_.height;
    scatterCorners_ = { TilePos{1, 1}, TilePos{w - 2, 1}, TilePos{1, h - 2}, TilePos{w - 2, h - 2} };

    chase_ = false;
    phaseTicksLeft_ = settings_.scatterTicks;

    LogManager::debug("Level {} built: {}x{} tiles, {} pellets, {} pursuers",
                      levelIndex_, w, h, pellets_, pursuers_.size());
}

TileObject* GridLevelEngine::tileAt(TilePos tile) noexcept {
    if (tile.x < 0 || tile.y < 0 || tile.x >= layout_.width || tile.y >= layout_.height) return nullptr;
    return &tiles_[static_cast<std::size_t>(tile.y) * static_cast<std::size_t>(layout_.width) + static_cast<std::size_t>(tile.x)];
}

const TileObject* GridLevelEngine::tileAt(TilePos tile) const noexcept {
    if (tile.x < 0 || tile.y < 0 || tile.x >= layout_.width || tile.y >= layout_.height) return nullptr;
    return &tiles_[static_cast<std::size_t>(tile.y) * static_cast<std::size_t>(layout_.width) + static_cast<std::size_t>(tile.x)];
}

bool GridLevelEngine::isWalkable(TilePos tile) const noexcept {
    if (tile.y < 0 || tile.y >= layout_.height) return false;
    const TileObject* obj = tileAt({ wrapCoordinate(tile.x, layout_.width), tile.y });
    return obj != nullptr && obj->kind != TileKind::Wall && obj->kind != TileKind::Cage;
}

bool GridLevelEngine::canEnter(TilePos from, Direction dir) const noexcept {
    if (dir == Direction::None) return false;
    const TilePos d = directionDelta(dir);
    return isWalkable({ from.x + d.x, from.y + d.y });
}

void GridLevelEngine::stepOnce(Agent& agent) const noexcept {
    const TilePos d = directionDelta(agent.dir);
    agent.pos.x = wrapCoordinate(agent.pos.x + d.x, xPeriod());
    agent.pos.y = std::clamp(agent.pos.y + d.y, 0, yExtent() - kSubUnitsPerTile);
}

void GridLevelEngine::tick() {
    ++ticks_;
    updatePhase();
    movePlayer();
    for (std::size_t i = 0; i < pursuers_.size(); ++i) {
        updatePursuer(i);
    }
}

void GridLevelEngine::updatePhase() {
    if (--phaseTicksLeft_ > 0) return;
    chase_ = !chase_;
    phaseTicksLeft_ = chase_ ? settings_.chaseTicks : settings_.scatterTicks;
    if (phaseTicksLeft_ <= 0) phaseTicksLeft_ = 1;
}

void GridLevelEngine::movePlayer() {
    if (!player_.active) return;

    if (player_.dir != Direction::None && player_.nextDir == opposite(player_.dir)) {
        player_.dir = player_.nextDir;
    }

    for (int s = 0; s < settings_.playerSpeed; ++s) {
        if (isOnTileCenter(player_.pos)) {
            const TilePos tile = toTile(player_.pos);
            if (canEnter(tile, player_.nextDir)) {
                player_.dir = player_.nextDir;
            } else if (!canEnter(tile, player_.dir)) {
                player_.dir = Direction::None;
            }
        }
        if (player_.dir == Direction::None) break;
        stepOnce(player_);
    }
}

void GridLevelEngine::updatePursuer(std::size_t index) {
    Agent& g = pursuers_[index];
    if (!g.active) return;

    if (g.caged) {
        const long long releaseAt = static_cast<long long>(index + 1) * settings_.releaseTicks;
        if (layout_.releasePoint && ticks_ >= releaseAt) {
            g.caged = false;
            g.pos = toAbs(*layout_.releasePoint);
            g.dir = Direction::None;
            LogManager::debug("Pursuer {} released at tick {}", index, ticks_);
        }
        return;
    }

    for (int s = 0; s < settings_.pursuerSpeed; ++s) {
        if (isOnTileCenter(g.pos)) steerPursuer(index);
        if (g.dir == Direction::None) break;
        stepOnce(g);
    }
}

void GridLevelEngine::steerPursuer(std::size_t index) {
    Agent& g = pursuers_[index];
    const TilePos tile = toTile(g.pos);

    std::vector<Direction> options;
    for (Direction dir : kSteerOrder) {
        if (canEnter(tile, dir)) options.push_back(dir);
    }
    if (options.empty()) {
        g.dir = Direction::None;
        return;
    }

    // Avoid immediate reversal if possible
    std::vector<Direction> filtered;
    for (Direction dir : options) {
        if (g.dir != Direction::None && dir == opposite(g.dir) && options.size() > 1) continue;
        filtered.push_back(dir);
    }
    if (filtered.empty()) filtered = options;

    const TilePos target = pursuerTarget(index);
    Direction chosen = filtered.front();
    long long best = std::numeric_limits<long long>::max();
    for (Direction dir : filtered) {
        const TilePos d = directionDelta(dir);
        const int nx = wrapCoordinate(tile.x + d.x, layout_.width);
        const int ny = tile.y + d.y;
        const long long dx = wrapDistance(nx, target.x, layout_.width);
        const long long dy = ny - target.y;
        const long long dist = dx * dx + dy * dy;
        if (dist < best) {
            best = dist;
            chosen = dir;
        }
    }
    g.dir = chosen;
}

TilePos GridLevelEngine::pursuerTarget(std::size_t index) const {
    if (!chase_) return scatterCorners_[index % scatterCorners_.size()];

    TilePos target = toTile(player_.pos);
    if (index == 1) {
        const TilePos d = directionDelta(player_.dir);
        target.x += d.x * 4;
        target.y += d.y * 4;
    }
    return target;
}

} // namespace fitz::level
