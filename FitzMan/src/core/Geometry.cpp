#include "fitz/core/Geometry.h"
#include <cstdlib>
#include <algorithm>

namespace fitz {

namespace {
int floorDiv(int value, int divisor) {
    int q = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) --q;
    return q;
}
} // namespace

int wrapCoordinate(int value, int period) noexcept {
    if (period <= 0) return value;
    return ((value % period) + period) % period;
}

int wrapDistance(int a, int b, int period) noexcept {
    if (period <= 0) return linearDistance(a, b);
    int d = std::abs(wrapCoordinate(a, period) - wrapCoordinate(b, period));
    return std::min(d, period - d);
}

int linearDistance(int a, int b) noexcept {
    return std::abs(a - b);
}

int signedWrapDelta(int a, int b, int period) noexcept {
    if (period <= 0) return a - b;
    int d = wrapCoordinate(a - b, period);
    if (d > period / 2) d -= period;
    return d;
}

bool isOnTileCenter(AbsPos pos) noexcept {
    return pos.x % kSubUnitsPerTile == 0 && pos.y % kSubUnitsPerTile == 0;
}

TilePos toTile(AbsPos pos) noexcept {
    return { floorDiv(pos.x, kSubUnitsPerTile), floorDiv(pos.y, kSubUnitsPerTile) };
}

AbsPos toAbs(TilePos tile) noexcept {
    return { tile.x * kSubUnitsPerTile, tile.y * kSubUnitsPerTile };
}

Direction opposite(Direction dir) noexcept {
    switch (dir) {
        case Direction::Left: return Direction::Right;
        case Direction::Right: return Direction::Left;
        case Direction::Up: return Direction::Down;
        case Direction::Down: return Direction::Up;
        case Direction::None: default: return Direction::None;
    }
}

TilePos directionDelta(Direction dir) noexcept {
    switch (dir) {
        case Direction::Left: return {-1, 0};
        case Direction::Right: return {1, 0};
        case Direction::Up: return {0, -1};
        case Direction::Down: return {0, 1};
        case Direction::None: default: return {0, 0};
    }
}

const char* to_string(Direction dir) noexcept {
    switch (dir) {
        case Direction::Left: return "Left";
        case Direction::Right: return "Right";
        case Direction::Up: return "Up";
        case Direction::Down: return "Down";
        case Direction::None: default: return "None";
    }
}

} // namespace fitz
