#pragma once
#include "fitz/core/GameSession.h"
#include "fitz/core/Geometry.h"
#include "fitz/core/LevelEngine.h"

#include <cstddef>
#include <vector>

namespace fitz {

struct AgentView {
    AbsPos pos{};
    Direction dir = Direction::None;
    bool active = false;
    bool caged = false;
};

// Read-only copy of everything the presentation layer draws.
struct RenderSnapshot {
    GameState state = GameState::Title;
    int score = 0;
    int lives = 0;
    int level = 1;
    bool gameOver = false;
    double animTime = 0.0;

    int gridWidth = 0;
    int gridHeight = 0;
    std::vector<TileKind> tiles{}; // row-major; eaten pellets read as Empty

    AgentView player{};
    std::vector<AgentView> pursuers{};

    [[nodiscard]] TileKind tileAt(int x, int y) const noexcept {
        if (x < 0 || y < 0 || x >= gridWidth || y >= gridHeight) return TileKind::Wall;
        return tiles[static_cast<std::size_t>(y) * static_cast<std::size_t>(gridWidth) + static_cast<std::size_t>(x)];
    }

    // Two-frame pursuer animation, six flips per second.
    [[nodiscard]] int animationFrame() const noexcept {
        return static_cast<int>(animTime * 6.0) % 2 == 0 ? 1 : 2;
    }
};

RenderSnapshot makeSnapshot(const GameSession& session);

} // namespace fitz
