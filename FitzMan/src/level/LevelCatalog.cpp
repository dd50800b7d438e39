#include "level/LevelCatalog.h"
#include "services/logger/LogManager.h"

#include <array>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace fitz::level {

using logging::LogManager;

namespace {

constexpr std::array<std::string_view, 24> kLevelOne = {
    "############################",
    "#............##............#",
    "#.####.#####.##.#####.####.#",
    "#.####.#####.##.#####.####.#",
    "#.####.#####.##.#####.####.#",
    "#..........................#",
    "#.####.##.########.##.####.#",
    "#.####.##.########.##.####.#",
    "#......##....##....##......#",
    "######.#####.##.#####.######",
    ".............##.............",
    "######.#####.##.#####.######",
    "#.####.#####.##.#####.####.#",
    "#.####.##....R.....##.####.#",
    "#......##.#CGGGGC#.##......#",
    "######.##.########.##.######",
    "#............##............#",
    "#.####.#####.##.#####.####.#",
    "#...##.......P........##...#",
    "###.##.##.########.##.##.###",
    "#......##....##....##......#",
    "#.##########.##.##########.#",
    "#..........................#",
    "############################",
};

constexpr std::array<std::string_view, 26> kLevelTwo = {
    "############################",
    "#............##............#",
    "#.####.#####.##.#####.####.#",
    "#.####.#####.##.#####.####.#",
    "#.####.#####.##.#####.####.#",
    "#..........................#",
    "#.####.##.########.##.####.#",
    "#.####.##.########.##.####.#",
    "#......##....##....##......#",
    "######.##### ## #####.######",
    "######.##          ##.######",
    "######.## ###CC### ##.######",
    "      .   #CGGGGC#   .      ",
    "######.## ######## ##.######",
    "######.##    R     ##.######",
    "######.## ######## ##.######",
    "#............##............#",
    "#.####.#####.##.#####.####.#",
    "#...##.......P........##...#",
    "###.##.##.########.##.##.###",
    "###.##.##.########.##.##.###",
    "#......##....##....##......#",
    "#.##########.##.##########.#",
    "#.##########.##.##########.#",
    "#..........................#",
    "############################",
};

template <std::size_t N>
std::string joinRows(const std::array<std::string_view, N>& rows) {
    std::string text;
    for (std::string_view row : rows) {
        text.append(row);
        text.push_back('\n');
    }
    return text;
}

std::optional<std::string> builtinText(int levelIndex) {
    switch (levelIndex) {
        case 1: return joinRows(kLevelOne);
        case 2: return joinRows(kLevelTwo);
        default: return std::nullopt;
    }
}

} // namespace

LevelCatalog::LevelCatalog(std::vector<std::filesystem::path> searchPaths, LevelEngineSettings settings)
    : searchPaths_(std::move(searchPaths)), settings_(settings) {}

int LevelCatalog::builtinLevelCount() noexcept { return 2; }

std::optional<std::filesystem::path> LevelCatalog::findLevelFile(int levelIndex) const {
    const std::string name = "level" + std::to_string(levelIndex) + ".txt";
    for (const auto& dir : searchPaths_) {
        std::error_code ec;
        const auto candidate = dir / name;
        if (std::filesystem::is_regular_file(candidate, ec)) return candidate;
    }
    return std::nullopt;
}

bool LevelCatalog::hasLevel(int levelIndex) const {
    if (levelIndex < 1) return false;
    return findLevelFile(levelIndex).has_value() || levelIndex <= builtinLevelCount();
}

std::optional<LevelLayout> LevelCatalog::layoutFor(int levelIndex) const {
    if (levelIndex < 1) return std::nullopt;
    if (auto file = findLevelFile(levelIndex)) {
        if (auto layout = loadLevelLayoutFile(*file)) return layout;
        LogManager::warn("Level file '{}' unusable", file->string());
        if (levelIndex > builtinLevelCount()) return std::nullopt;
        LogManager::info("Using built-in layout for level {}", levelIndex);
    }
    auto text = builtinText(levelIndex);
    if (!text) return std::nullopt;
    return parseLevelLayout(*text, "builtin:" + std::to_string(levelIndex));
}

std::unique_ptr<LevelEngine> LevelCatalog::create(int levelIndex) const {
    auto layout = layoutFor(levelIndex);
    if (!layout) {
        LogManager::error("No usable layout for level {}", levelIndex);
        return nullptr;
    }
    return std::make_unique<GridLevelEngine>(levelIndex, std::move(*layout), settings_);
}

} // namespace fitz::level
