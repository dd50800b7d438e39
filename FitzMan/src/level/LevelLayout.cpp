#include "level/LevelLayout.h"
#include "services/logger/LogManager.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <string>

namespace fitz::level {

using logging::LogManager;

namespace {

std::vector<std::string_view> splitRows(std::string_view text) {
    std::vector<std::string_view> rows;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t nl = text.find('\n', start);
        std::string_view row = text.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start);
        if (!row.empty() && row.back() == '\r') row.remove_suffix(1);
        rows.push_back(row);
        if (nl == std::string_view::npos) break;
        start = nl + 1;
    }
    while (!rows.empty() && rows.back().empty()) rows.pop_back();
    return rows;
}

} // namespace

int LevelLayout::pelletCount() const {
    return static_cast<int>(std::count(tiles.begin(), tiles.end(), TileKind::Pellet));
}

std::optional<LevelLayout> parseLevelLayout(std::string_view text, std::string_view sourceName) {
    const std::vector<std::string_view> rows = splitRows(text);
    if (rows.empty()) {
        LogManager::warn("Level '{}' rejected: no rows", sourceName);
        return std::nullopt;
    }

    LevelLayout layout;
    layout.width = static_cast<int>(rows.front().size());
    layout.height = static_cast<int>(rows.size());
    if (layout.width == 0) {
        LogManager::warn("Level '{}' rejected: empty first row", sourceName);
        return std::nullopt;
    }
    layout.tiles.reserve(static_cast<std::size_t>(layout.width) * rows.size());

    int playerStarts = 0;
    for (int y = 0; y < layout.height; ++y) {
        const std::string_view row = rows[static_cast<std::size_t>(y)];
        if (static_cast<int>(row.size()) != layout.width) {
            LogManager::warn("Level '{}' rejected: row {} has width {}, expected {}", sourceName, y, row.size(), layout.width);
            return std::nullopt;
        }
        for (int x = 0; x < layout.width; ++x) {
            switch (row[static_cast<std::size_t>(x)]) {
                case '#': layout.tiles.push_back(TileKind::Wall); break;
                case '.': layout.tiles.push_back(TileKind::Pellet); break;
                case ' ': layout.tiles.push_back(TileKind::Empty); break;
                case 'C': layout.tiles.push_back(TileKind::Cage); break;
                case 'G':
                    layout.tiles.push_back(TileKind::Cage);
                    layout.pursuerSpawns.push_back({x, y});
                    break;
                case 'P':
                    layout.tiles.push_back(TileKind::Empty);
                    layout.playerStart = {x, y};
                    ++playerStarts;
                    break;
                case 'R':
                    layout.tiles.push_back(TileKind::Empty);
                    layout.releasePoint = TilePos{x, y};
                    break;
                default:
                    LogManager::warn("Level '{}' rejected: unknown glyph '{}' at ({}, {})", sourceName, row[static_cast<std::size_t>(x)], x, y);
                    return std::nullopt;
            }
        }
    }

    if (playerStarts != 1) {
        LogManager::warn("Level '{}' rejected: expected one player start, found {}", sourceName, playerStarts);
        return std::nullopt;
    }
    if (layout.pursuerSpawns.size() > kMaxPursuers) {
        LogManager::warn("Level '{}' rejected: {} pursuer spawns (max {})", sourceName, layout.pursuerSpawns.size(), kMaxPursuers);
        return std::nullopt;
    }
    if (layout.pelletCount() == 0) {
        LogManager::warn("Level '{}' rejected: no pellets", sourceName);
        return std::nullopt;
    }
    if (!layout.releasePoint && !layout.pursuerSpawns.empty()) {
        LogManager::warn("Level '{}' has no release point; pursuers stay caged", sourceName);
    }
    return layout;
}

std::optional<LevelLayout> loadLevelLayoutFile(const std::filesystem::path& path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) return std::nullopt;
    if (size > kMaxLevelFileBytes) {
        LogManager::warn("Level file '{}' rejected: {} bytes exceeds limit", path.string(), size);
        return std::nullopt;
    }
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) return std::nullopt;
    std::ostringstream buffer;
    buffer << ifs.rdbuf();
    return parseLevelLayout(buffer.str(), path.string());
}

} // namespace fitz::level
