#include "fitz/core/LevelEngine.h"

namespace fitz {

const char* to_string(TileKind kind) noexcept {
    switch (kind) {
        case TileKind::Empty: return "empty";
        case TileKind::Wall: return "wall";
        case TileKind::Cage: return "cage";
        case TileKind::Pellet: return "pellet";
        default: return "unknown";
    }
}

} // namespace fitz
