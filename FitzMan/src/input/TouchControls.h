#pragma once
#include "fitz/core/GameStateMachine.h"
#include "fitz/core/Geometry.h"
#include "fitz/core/InputEvent.h"

namespace fitz::input {

inline constexpr float kDpadButtonSize = 54.0f;
inline constexpr float kDpadPadding = 12.0f;
inline constexpr float kStartButtonWidth = 180.0f;
inline constexpr float kStartButtonHeight = 56.0f;

// On-screen direction pad, anchored near the bottom of the window.
struct DpadLayout {
    Rect up{};
    Rect down{};
    Rect left{};
    Rect right{};
};

DpadLayout computeDpad(int screenWidth, int screenHeight) noexcept;

// Direction under a window-space point, Direction::None when no button is hit.
Direction directionAt(const DpadLayout& dpad, Point p) noexcept;

Rect startButtonRect(int screenWidth, int screenHeight) noexcept;
ScreenLayout defaultScreenLayout(int screenWidth, int screenHeight) noexcept;

} // namespace fitz::input
