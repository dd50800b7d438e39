#pragma once
#include "fitz/core/Geometry.h"
#include "fitz/core/LevelEngine.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace fitz::level {

inline constexpr std::size_t kMaxPursuers = 4;
// Level files larger than this are treated as unreadable.
inline constexpr std::uintmax_t kMaxLevelFileBytes = 64u * 1024u;

// Parsed level text. Glyphs: '#' wall, '.' pellet, ' ' empty, 'C' cage,
// 'G' pursuer spawn (cage), 'P' player start, 'R' pursuer release point.
struct LevelLayout {
    int width = 0;
    int height = 0;
    std::vector<TileKind> tiles{};
    TilePos playerStart{};
    std::vector<TilePos> pursuerSpawns{};
    std::optional<TilePos> releasePoint{};

    [[nodiscard]] TileKind at(int x, int y) const {
        return tiles[static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)];
    }
    [[nodiscard]] int pelletCount() const;
};

std::optional<LevelLayout> parseLevelLayout(std::string_view text, std::string_view sourceName);
std::optional<LevelLayout> loadLevelLayoutFile(const std::filesystem::path& path);

} // namespace fitz::level
