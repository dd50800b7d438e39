#pragma once

// LevelEngine.h
// Narrow interface to the level/grid collaborator. The core reads agent and
// tile state through it, advances it one tick at a time, and performs the few
// writes it is allowed: activating agents, marking eaten pellets, and
// decrementing the pellet counter.

#include "fitz/core/Geometry.h"

#include <memory>
#include <span>

namespace fitz {

enum class TileKind { Empty, Wall, Cage, Pellet };

const char* to_string(TileKind kind) noexcept;

struct TileObject {
    TileKind kind = TileKind::Empty;
    bool destroyed = false;
};

struct Agent {
    int id = 0;
    AbsPos pos{};
    bool active = false;
    bool caged = false;
    Direction dir = Direction::None;
    Direction nextDir = Direction::None;
};

class LevelEngine {
public:
    virtual ~LevelEngine() = default;

    [[nodiscard]] virtual int levelIndex() const noexcept = 0;
    [[nodiscard]] virtual int gridWidth() const noexcept = 0;
    [[nodiscard]] virtual int gridHeight() const noexcept = 0;

    // Advance the player and every pursuer by one simulation step.
    virtual void tick() = 0;

    virtual Agent& player() noexcept = 0;
    virtual const Agent& player() const noexcept = 0;
    virtual std::span<Agent> pursuers() noexcept = 0;
    virtual std::span<const Agent> pursuers() const noexcept = 0;

    // nullptr when the tile lies outside the grid.
    virtual TileObject* tileAt(TilePos tile) noexcept = 0;
    virtual const TileObject* tileAt(TilePos tile) const noexcept = 0;

    [[nodiscard]] virtual int pelletsRemaining() const noexcept = 0;
    virtual void decrementPellets() noexcept = 0;

    [[nodiscard]] int xPeriod() const noexcept { return gridWidth() * kSubUnitsPerTile; }
    [[nodiscard]] int yExtent() const noexcept { return gridHeight() * kSubUnitsPerTile; }
};

// Source of level instances. hasLevel() answers whether content exists for an
// index; create() builds a fresh instance with its pellet counter reset.
class LevelFactory {
public:
    virtual ~LevelFactory() = default;

    [[nodiscard]] virtual bool hasLevel(int levelIndex) const = 0;
    virtual std::unique_ptr<LevelEngine> create(int levelIndex) const = 0;
};

} // namespace fitz
