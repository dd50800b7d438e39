#pragma once
#include "fitz/core/LevelEngine.h"
#include "level/LevelLayout.h"

#include <array>
#include <cstddef>
#include <vector>

namespace fitz::level {

struct LevelEngineSettings {
    int playerSpeed = 1;          // sub-units per tick
    int pursuerSpeed = 1;         // sub-units per tick
    int releaseTicks = 20;        // stagger between pursuer releases
    int scatterTicks = 70;
    int chaseTicks = 200;
};

// Reference level engine over a text layout. Moves one sub-unit at a time so
// that tile centers are never stepped over, whatever the speed.
class GridLevelEngine final : public LevelEngine {
public:
    GridLevelEngine(int levelIndex, LevelLayout layout, LevelEngineSettings settings = {});

    int levelIndex() const noexcept override { return levelIndex_; }
    int gridWidth() const noexcept override { return layout_.width; }
    int gridHeight() const noexcept override { return layout_.height; }

    void tick() override;

    Agent& player() noexcept override { return player_; }
    const Agent& player() const noexcept override { return player_; }
    std::span<Agent> pursuers() noexcept override { return pursuers_; }
    std::span<const Agent> pursuers() const noexcept override { return pursuers_; }

    TileObject* tileAt(TilePos tile) noexcept override;
    const TileObject* tileAt(TilePos tile) const noexcept override;

    int pelletsRemaining() const noexcept override { return pellets_; }
    void decrementPellets() noexcept override { --pellets_; }

    [[nodiscard]] bool isWalkable(TilePos tile) const noexcept;
    [[nodiscard]] bool chasePhase() const noexcept { return chase_; }
    [[nodiscard]] long long ticks() const noexcept { return ticks_; }
    [[nodiscard]] const LevelLayout& layout() const noexcept { return layout_; }

private:
    void updatePhase();
    void movePlayer();
    void updatePursuer(std::size_t index);
    void steerPursuer(std::size_t index);
    TilePos pursuerTarget(std::size_t index) const;
    bool canEnter(TilePos from, Direction dir) const noexcept;
    void stepOnce(Agent& agent) const noexcept;

    int levelIndex_ = 1;
    LevelLayout layout_{};
    LevelEngineSettings settings_{};
    std::vector<TileObject> tiles_{};
    int pellets_ = 0;

    Agent player_{};
    std::vector<Agent> pursuers_{};
    std::array<TilePos, 4> scatterCorners_{};

    long long ticks_ = 0;
    bool chase_ = false;
    int phaseTicksLeft_ = 0;
};

} // namespace fitz::level
