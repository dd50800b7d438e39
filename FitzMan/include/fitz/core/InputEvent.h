#pragma once
#include "fitz/core/Geometry.h"

namespace fitz {

struct Point {
    float x = 0.0f;
    float y = 0.0f;
};

// Screen-space rectangle; the right and bottom edges are exclusive.
struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    [[nodiscard]] bool contains(Point p) const noexcept {
        return p.x >= x && p.x < x + width && p.y >= y && p.y < y + height;
    }
};

enum class InputKind {
    Confirm,
    Cancel,
    Intent,
    PointerPress,
    PointerRelease,
    TouchPress,
};

// One input event, already translated from the platform's keys and taps.
// Pointer points are in window pixels; touch points are normalized to 0..1.
struct InputEvent {
    InputKind kind = InputKind::Confirm;
    Direction direction = Direction::None;
    Point point{};

    static InputEvent confirm() { return { InputKind::Confirm }; }
    static InputEvent cancel() { return { InputKind::Cancel }; }
    static InputEvent intent(Direction d) { return { InputKind::Intent, d }; }
    static InputEvent pointerPress(Point p) { return { InputKind::PointerPress, Direction::None, p }; }
    static InputEvent pointerRelease(Point p) { return { InputKind::PointerRelease, Direction::None, p }; }
    static InputEvent touchPress(Point normalized) { return { InputKind::TouchPress, Direction::None, normalized }; }
};

} // namespace fitz
