#pragma once

// Geometry.h
// Absolute (sub-unit) and tile coordinates plus the wrap-aware distance helpers
// used by collision detection. The horizontal axis is periodic, the vertical
// axis is bounded.

namespace fitz {

inline constexpr int kSubUnitsPerTile = 4;

enum class Direction { None, Left, Right, Up, Down };

struct AbsPos {
    int x = 0;
    int y = 0;
    bool operator==(const AbsPos& other) const = default;
};

struct TilePos {
    int x = 0;
    int y = 0;
    bool operator==(const TilePos& other) const = default;
};

// Shorter arc between a and b on a ring of the given period.
[[nodiscard]] int wrapDistance(int a, int b, int period) noexcept;
[[nodiscard]] int linearDistance(int a, int b) noexcept;
// Offset of a relative to b on the ring, normalized to (-period/2, period/2].
[[nodiscard]] int signedWrapDelta(int a, int b, int period) noexcept;
[[nodiscard]] int wrapCoordinate(int value, int period) noexcept;

// True when both sub-unit components are zero.
[[nodiscard]] bool isOnTileCenter(AbsPos pos) noexcept;
[[nodiscard]] TilePos toTile(AbsPos pos) noexcept;
[[nodiscard]] AbsPos toAbs(TilePos tile) noexcept;

Direction opposite(Direction dir) noexcept;
TilePos directionDelta(Direction dir) noexcept;
const char* to_string(Direction dir) noexcept;

} // namespace fitz
