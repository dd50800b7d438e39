#include "input/TouchControls.h"

namespace fitz::input {

DpadLayout computeDpad(int screenWidth, int screenHeight) noexcept {
    const float s = kDpadButtonSize;
    const float pad = kDpadPadding;
    const float baseY = static_cast<float>(screenHeight) - (s * 3.0f + pad * 2.0f) - 30.0f;
    const float baseX = static_cast<float>((screenWidth - static_cast<int>(s * 3.0f)) / 2);

    // Buttons sit edge to edge around an empty centre square; the padding only
    // lifts the pad off the bottom edge.
    DpadLayout d;
    d.up = { baseX + s, baseY, s, s };
    d.left = { baseX, baseY + s, s, s };
    d.right = { baseX + s * 2.0f, baseY + s, s, s };
    d.down = { baseX + s, baseY + s * 2.0f, s, s };
    return d;
}

Direction directionAt(const DpadLayout& dpad, Point p) noexcept {
    if (dpad.up.contains(p)) return Direction::Up;
    if (dpad.down.contains(p)) return Direction::Down;
    if (dpad.left.contains(p)) return Direction::Left;
    if (dpad.right.contains(p)) return Direction::Right;
    return Direction::None;
}

Rect startButtonRect(int screenWidth, int screenHeight) noexcept {
    const float x = (static_cast<float>(screenWidth) - kStartButtonWidth) / 2.0f;
    const float y = static_cast<float>(static_cast<int>(static_cast<float>(screenHeight) * 0.64f));
    return { x, y, kStartButtonWidth, kStartButtonHeight };
}

ScreenLayout defaultScreenLayout(int screenWidth, int screenHeight) noexcept {
    ScreenLayout layout;
    layout.width = screenWidth;
    layout.height = screenHeight;
    layout.startButton = startButtonRect(screenWidth, screenHeight);
    return layout;
}

} // namespace fitz::input
