#pragma once
#include "fitz/core/LevelEngine.h"
#include "fitz/core/SimulationConfig.h"

#include <memory>

namespace fitz {

enum class GameState { Title, Play, GameOver };

const char* to_string(GameState state) noexcept;

// Everything a running game owns. The level engine is replaced wholesale on
// life loss, level advance and restart; nothing else holds on to it.
struct GameSession {
    int score = 0;
    int lives = 0;
    int level = 1;
    bool gameOver = false;
    GameState state = GameState::Title;
    SimDuration timeBudget{0};
    double animTime = 0.0;
    std::unique_ptr<LevelEngine> engine{};
};

} // namespace fitz
