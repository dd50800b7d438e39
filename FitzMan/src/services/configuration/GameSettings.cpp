#include "GameSettings.h"
#include "ConfigurationManager.h"

#include <algorithm>
#include <cstdint>
#include <string>

namespace fitz {

using logging::LogManager;

namespace {

int readClamped(const char* key, int64_t fallback, int64_t lo, int64_t hi) {
    const int64_t raw = ConfigurationManager::getInt(key, fallback);
    const int64_t v = std::clamp(raw, lo, hi);
    if (v != raw) {
        LogManager::warn("Config '{}' = {} out of range [{}, {}]; using {}", key, raw, lo, hi, v);
    }
    return static_cast<int>(v);
}

} // namespace

GameSettings readGameSettings() {
    GameSettings s;

    s.sim.tickHz = readClamped("sim.tick_hz", 10, 1, 240);
    s.sim.maxTicksPerFrame = readClamped("sim.max_ticks_per_frame", 5, 1, 60);
    s.sim.collisionThreshold = readClamped("sim.collision_threshold", 3, 0, 15);
    s.sim.startingLives = readClamped("game.starting_lives", 2, 0, 9);
    s.sim.pelletScore = readClamped("game.pellet_score", 10, 0, 10000);

    s.level.releaseTicks = readClamped("level.pursuer_release_ticks", 20, 0, 1000);
    for (const auto& p : ConfigurationManager::getStringList("level.search_paths", { "resource", "levels" })) {
        if (!p.empty()) s.levelSearchPaths.emplace_back(p);
    }

    s.window.width = readClamped("window.width", 540, 320, 7680);
    s.window.height = readClamped("window.height", 820, 240, 4320);
    s.window.fps = readClamped("window.fps", 60, 10, 240);
    s.window.tilePx = readClamped("window.tile_px", 24, 8, 64);

    s.logBufferLines = readClamped("log.buffer_lines", 2000, 0, 100000);

    const std::string levelName = ConfigurationManager::getString("log.level", "info");
    if (auto lvl = logging::level_from_string(levelName)) {
        s.logLevel = *lvl;
    } else {
        LogManager::warn("Config 'log.level' = '{}' is not a log level; using info", levelName);
    }
    return s;
}

} // namespace fitz
