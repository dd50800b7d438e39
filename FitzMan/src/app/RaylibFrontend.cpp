#include "app/RaylibFrontend.h"
#include "services/logger/LogManager.h"
#include "raylib.h"

#include <algorithm>
#include <array>
#include <string>
#include <utility>

namespace fitz::app {

namespace {

constexpr std::array<Color, 4> kPursuerColors = {
    Color{255, 0, 0, 255},
    Color{255, 105, 180, 255},
    Color{0, 255, 255, 255},
    Color{255, 165, 0, 255}
};

constexpr int kHudFont = 22;
constexpr float kBoardTop = 10.0f;

struct KeyDir { int key; Direction dir; };

constexpr std::array<KeyDir, 8> kKeyDirs = {{
    { KEY_LEFT, Direction::Left }, { KEY_A, Direction::Left },
    { KEY_RIGHT, Direction::Right }, { KEY_D, Direction::Right },
    { KEY_UP, Direction::Up }, { KEY_W, Direction::Up },
    { KEY_DOWN, Direction::Down }, { KEY_S, Direction::Down },
}};

void drawCentered(const char* text, int cx, int cy, int size, Color color) {
    const int w = MeasureText(text, size);
    DrawText(text, cx - w / 2, cy - size / 2, size, color);
}

Rectangle toRaylib(const Rect& r) { return Rectangle{ r.x, r.y, r.width, r.height }; }

float headingFor(Direction dir) {
    switch (dir) {
        case Direction::Left: return 180.0f;
        case Direction::Up: return 270.0f;
        case Direction::Down: return 90.0f;
        default: return 0.0f;
    }
}

Color levelColor(logging::Level level) {
    switch (level) {
        case logging::Level::warn: return Color{255, 200, 80, 255};
        case logging::Level::err:
        case logging::Level::critical: return Color{255, 90, 90, 255};
        case logging::Level::trace:
        case logging::Level::debug: return Color{150, 150, 150, 255};
        default: return RAYWHITE;
    }
}

} // namespace

RaylibFrontend::RaylibFrontend(WindowSettings window)
    : window_(window),
      dpad_(input::computeDpad(window.width, window.height)),
      startButton_(input::startButtonRect(window.width, window.height)) {}

double RaylibFrontend::frameDelta() const {
    return static_cast<double>(GetFrameTime());
}

std::vector<InputEvent> RaylibFrontend::pollEvents() {
    std::vector<InputEvent> events;

    if (WindowShouldClose()) {
        events.push_back(InputEvent::cancel());
        return events;
    }
    if (IsKeyPressed(KEY_F1)) showLog_ = !showLog_;

    if (IsKeyPressed(KEY_ENTER) || IsKeyPressed(KEY_SPACE)) events.push_back(InputEvent::confirm());
    for (const auto& kd : kKeyDirs) {
        if (IsKeyPressed(kd.key)) events.push_back(InputEvent::intent(kd.dir));
    }

    const Vector2 mouse = GetMousePosition();
    const Point mp{ mouse.x, mouse.y };
    if (IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) {
        events.push_back(InputEvent::pointerPress(mp));
        if (Direction d = input::directionAt(dpad_, mp); d != Direction::None) {
            events.push_back(InputEvent::intent(d));
        }
    }
    if (IsMouseButtonReleased(MOUSE_BUTTON_LEFT)) events.push_back(InputEvent::pointerRelease(mp));

    const int touches = GetTouchPointCount();
    if (touches > lastTouchCount_) {
        const Vector2 t = GetTouchPosition(touches - 1);
        const Point normalized{ t.x / static_cast<float>(window_.width), t.y / static_cast<float>(window_.height) };
        events.push_back(InputEvent::touchPress(normalized));
        if (Direction d = input::directionAt(dpad_, Point{ t.x, t.y }); d != Direction::None) {
            events.push_back(InputEvent::intent(d));
        }
    }
    lastTouchCount_ = touches;
    return events;
}

float RaylibFrontend::boardX(const RenderSnapshot& snap) const {
    return static_cast<float>((window_.width - snap.gridWidth * window_.tilePx) / 2);
}

float RaylibFrontend::boardY() const { return kBoardTop; }

void RaylibFrontend::render(const RenderSnapshot& snap) {
    BeginDrawing();
    ClearBackground(BLACK);

    if (snap.state == GameState::Title) {
        drawTitle();
    } else {
        drawBoard(snap);
        drawPlayer(snap);
        drawPursuers(snap);
        drawHud(snap);
        drawDpad();
        if (snap.gameOver) drawGameOver();
    }
    if (showLog_) drawLogOverlay();
}

void RaylibFrontend::presentFrame() {
    EndDrawing();
}

void RaylibFrontend::drawTitle() const {
    drawCentered("Fitz-Man", window_.width / 2, static_cast<int>(window_.height * 0.14f), 56, RAYWHITE);

    const float r = static_cast<float>(window_.tilePx) * 2.5f;
    const Vector2 c{ window_.width * 0.5f, window_.height * 0.40f };
    DrawCircleSector(c, r, 30.0f, 330.0f, 32, Color{255, 252, 0, 255});

    DrawRectangleRec(toRaylib(startButton_), RAYWHITE);
    DrawRectangleLinesEx(toRaylib(startButton_), 2.0f, Color{220, 220, 220, 255});
    drawCentered("Start", static_cast<int>(startButton_.x + startButton_.width / 2),
                 static_cast<int>(startButton_.y + startButton_.height / 2), 24, BLACK);

    drawCentered("Arrow keys to move. Esc quits.", window_.width / 2, static_cast<int>(window_.height * 0.88f), 20, Color{140, 140, 140, 255});
}

void RaylibFrontend::drawBoard(const RenderSnapshot& snap) const {
    const float tile = static_cast<float>(window_.tilePx);
    const float ox = boardX(snap);
    const float oy = boardY();
    for (int y = 0; y < snap.gridHeight; ++y) {
        for (int x = 0; x < snap.gridWidth; ++x) {
            const Rectangle cell{ ox + x * tile, oy + y * tile, tile, tile };
            switch (snap.tileAt(x, y)) {
                case TileKind::Wall:
                    DrawRectangleRounded(cell, 0.4f, 6, Color{30, 30, 130, 255});
                    break;
                case TileKind::Cage:
                    DrawRectangleLinesEx(cell, 2.0f, Color{255, 184, 222, 255});
                    break;
                case TileKind::Pellet:
                    DrawCircle(static_cast<int>(cell.x + cell.width * 0.5f), static_cast<int>(cell.y + cell.height * 0.5f),
                               std::max(2.0f, cell.width * 0.12f), Color{255, 220, 120, 255});
                    break;
                case TileKind::Empty:
                    break;
            }
        }
    }
}

void RaylibFrontend::drawPlayer(const RenderSnapshot& snap) const {
    const float scale = static_cast<float>(window_.tilePx) / static_cast<float>(kSubUnitsPerTile);
    const float tile = static_cast<float>(window_.tilePx);
    const Vector2 pos{ boardX(snap) + snap.player.pos.x * scale + tile / 2, boardY() + snap.player.pos.y * scale + tile / 2 };
    const float heading = headingFor(snap.player.dir);
    const float mouth = snap.animationFrame() == 1 ? 35.0f : 10.0f;
    DrawCircleSector(pos, tile * 0.45f, heading + mouth, heading + 360.0f - mouth, 32, Color{255, 252, 0, 255});
}

void RaylibFrontend::drawPursuers(const RenderSnapshot& snap) const {
    const float scale = static_cast<float>(window_.tilePx) / static_cast<float>(kSubUnitsPerTile);
    const float tile = static_cast<float>(window_.tilePx);
    const int frame = snap.animationFrame();
    for (std::size_t i = 0; i < snap.pursuers.size(); ++i) {
        const AgentView& g = snap.pursuers[i];
        if (!g.active) continue;
        const Vector2 pos{ boardX(snap) + g.pos.x * scale + tile / 2, boardY() + g.pos.y * scale + tile / 2 };
        const float bodyRadius = tile * 0.42f;
        const Color bodyColor = kPursuerColors[i % kPursuerColors.size()];

        DrawCircleV({ pos.x, pos.y - bodyRadius * 0.2f }, bodyRadius, bodyColor);
        // Two-frame skirt: the hem shifts between frames.
        const float hem = frame == 1 ? 1.2f : 1.0f;
        const Rectangle skirt{ pos.x - bodyRadius, pos.y - bodyRadius * 0.2f, bodyRadius * 2.0f, bodyRadius * hem };
        DrawRectangleRounded(skirt, 0.6f, 8, bodyColor);

        const TilePos d = directionDelta(g.dir);
        const Vector2 eyeOffset{ d.x * bodyRadius * 0.25f, d.y * bodyRadius * 0.25f };
        const Vector2 leftEye = { pos.x - bodyRadius * 0.35f + eyeOffset.x, pos.y - bodyRadius * 0.25f + eyeOffset.y };
        const Vector2 rightEye = { pos.x + bodyRadius * 0.35f + eyeOffset.x, pos.y - bodyRadius * 0.25f + eyeOffset.y };
        DrawCircleV(leftEye, bodyRadius * 0.28f, RAYWHITE);
        DrawCircleV(rightEye, bodyRadius * 0.28f, RAYWHITE);
        DrawCircleV(leftEye, bodyRadius * 0.12f, Color{20, 20, 60, 255});
        DrawCircleV(rightEye, bodyRadius * 0.12f, Color{20, 20, 60, 255});
    }
}

void RaylibFrontend::drawHud(const RenderSnapshot& snap) const {
    const std::string hud = "Score: " + std::to_string(snap.score) +
                            "   Lives: " + std::to_string(std::max(0, snap.lives)) +
                            "   Level: " + std::to_string(snap.level);
    DrawText(hud.c_str(), 16, 18, kHudFont, RAYWHITE);
}

void RaylibFrontend::drawDpad() const {
    const std::array<std::pair<const Rect*, const char*>, 4> buttons = {{
        { &dpad_.up, "U" }, { &dpad_.down, "D" }, { &dpad_.left, "L" }, { &dpad_.right, "R" }
    }};
    for (const auto& [rect, label] : buttons) {
        DrawRectangleLinesEx(toRaylib(*rect), 2.0f, RAYWHITE);
        drawCentered(label, static_cast<int>(rect->x + rect->width / 2), static_cast<int>(rect->y + rect->height / 2), 20, RAYWHITE);
    }
}

void RaylibFrontend::drawGameOver() const {
    drawCentered("GAME OVER", window_.width / 2, window_.height / 2, 28, Color{255, 80, 80, 255});
    drawCentered("Press Enter or tap to restart", window_.width / 2, window_.height / 2 + 34, 20, Color{200, 200, 200, 255});
}

void RaylibFrontend::drawLogOverlay() const {
    constexpr int kLines = 18;
    constexpr int kFont = 14;
    const auto lines = logging::read_log_lines_snapshot(kLines);
    const logging::LevelCounts counts = logging::read_log_level_counts();
    const int h = (kLines + 1) * (kFont + 2) + 8;
    DrawRectangle(0, window_.height - h, window_.width, h, Color{0, 0, 0, 200});
    int y = window_.height - h + 4;
    const std::string header = fmt::format("log: {} warnings, {} errors", counts.warn, counts.err + counts.critical);
    DrawText(header.c_str(), 6, y, kFont, counts.err + counts.critical > 0 ? levelColor(logging::Level::err) : RAYWHITE);
    y += kFont + 2;
    for (const auto& line : lines) {
        const std::string text = fmt::format("{:<5} {}", logging::level_to_label(line.level), line.text);
        DrawText(text.c_str(), 6, y, kFont, levelColor(line.level));
        y += kFont + 2;
    }
}

} // namespace fitz::app
