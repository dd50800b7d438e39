#pragma once
#include "fitz/core/Geometry.h"

#include <cstddef>
#include <optional>
#include <span>

namespace fitz {

struct PursuerSample {
    AbsPos prev{};
    AbsPos cur{};
    bool active = true;
    bool caged = false;
};

struct CollisionParams {
    int xPeriod = 0;
    int threshold = 3;
};

// Index of the first pursuer that caught the player between the two samples,
// either by overlapping at the current sample or by crossing through the
// player along one axis while staying aligned on the other. Inactive and
// caged pursuers never catch.
[[nodiscard]] std::optional<std::size_t> findCatchingPursuer(AbsPos playerPrev,
                                                             AbsPos playerCur,
                                                             std::span<const PursuerSample> pursuers,
                                                             const CollisionParams& params) noexcept;

[[nodiscard]] bool checkCollision(AbsPos playerPrev,
                                  AbsPos playerCur,
                                  std::span<const PursuerSample> pursuers,
                                  const CollisionParams& params) noexcept;

} // namespace fitz
