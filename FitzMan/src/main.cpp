// main.cpp : FitzMan entry point.

#include "raylib.h"
#include "app/RaylibFrontend.h"
#include "fitz/core/FrameLoop.h"
#include "fitz/core/GameController.h"
#include "input/TouchControls.h"
#include "level/LevelCatalog.h"
#include "services/configuration/ConfigurationManager.h"
#include "services/configuration/GameSettings.h"
#include "services/logger/LogManager.h"

#include <utility>

int main()
{
    fitz::logging::LogManager::init({"FitzMan", fitz::logging::Level::info, "[%H:%M:%S] [%^%l%$] %v"});
    fitz::logging::LogManager::info("Starting FitzMan");

    if (!fitz::ConfigurationManager::load()) {
        fitz::logging::LogManager::warn("Configuration file missing or invalid; using defaults");
    }
    const fitz::GameSettings settings = fitz::readGameSettings();
    fitz::logging::LogManager::reconfigure({"FitzMan", settings.logLevel, "[%H:%M:%S] [%^%l%$] %v"});
    fitz::logging::set_log_buffer_capacity(static_cast<size_t>(settings.logBufferLines));

    SetConfigFlags(FLAG_VSYNC_HINT);
    InitWindow(settings.window.width, settings.window.height, "Fitz-Man");
    SetTargetFPS(settings.window.fps);
    fitz::logging::LogManager::info("Window initialized: {}x{} @ {} fps", GetScreenWidth(), GetScreenHeight(), settings.window.fps);

    fitz::level::LevelCatalog catalog(settings.levelSearchPaths, settings.level);
    fitz::GameController controller(catalog, settings.sim,
                                    fitz::input::defaultScreenLayout(settings.window.width, settings.window.height));
    fitz::app::RaylibFrontend frontend(settings.window);

    fitz::FrameHooks hooks;
    hooks.frameDelta = [&frontend] { return frontend.frameDelta(); };
    hooks.poll = [&frontend] { return frontend.pollEvents(); };
    hooks.render = [&frontend](const fitz::RenderSnapshot& snap) { frontend.render(snap); };
    hooks.yield = [&frontend] { frontend.presentFrame(); };

    fitz::FrameLoop loop(controller, std::move(hooks));
    const int frames = loop.run();

    CloseWindow();
    fitz::logging::LogManager::info("FitzMan exiting after {} frames; final score {}", frames, controller.session().score);
    fitz::logging::LogManager::shutdown();
    return 0;
}
