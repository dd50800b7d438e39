#pragma once
#include "fitz/core/LevelEngine.h"
#include "level/GridLevelEngine.h"
#include "level/LevelLayout.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace fitz::level {

// Level source for the game. Index N is read from "level<N>.txt" in the first
// search path that has it; otherwise the built-in mazes cover the low indices.
class LevelCatalog final : public LevelFactory {
public:
    explicit LevelCatalog(std::vector<std::filesystem::path> searchPaths = {}, LevelEngineSettings settings = {});

    bool hasLevel(int levelIndex) const override;
    std::unique_ptr<LevelEngine> create(int levelIndex) const override;

    // Parsed layout for an index, or nullopt when none exists or it is invalid.
    std::optional<LevelLayout> layoutFor(int levelIndex) const;

    [[nodiscard]] static int builtinLevelCount() noexcept;
    [[nodiscard]] const std::vector<std::filesystem::path>& searchPaths() const noexcept { return searchPaths_; }
    [[nodiscard]] const LevelEngineSettings& settings() const noexcept { return settings_; }

private:
    std::optional<std::filesystem::path> findLevelFile(int levelIndex) const;

    std::vector<std::filesystem::path> searchPaths_{};
    LevelEngineSettings settings_{};
};

} // namespace fitz::level
