#pragma once
#include "fitz/core/SimulationConfig.h"
#include "level/GridLevelEngine.h"
#include "services/logger/LogManager.h"

#include <filesystem>
#include <vector>

namespace fitz {

struct WindowSettings {
    int width = 540;
    int height = 820;
    int fps = 60;
    int tilePx = 24;
};

// Typed view of the configuration document, clamped to supported ranges.
struct GameSettings {
    SimulationConfig sim{};
    level::LevelEngineSettings level{};
    std::vector<std::filesystem::path> levelSearchPaths{};
    WindowSettings window{};
    logging::Level logLevel = logging::Level::info;
    int logBufferLines = 2000;
};

// Reads the current ConfigurationManager document. Values outside their
// bounds are clamped and reported at warn level.
GameSettings readGameSettings();

} // namespace fitz
