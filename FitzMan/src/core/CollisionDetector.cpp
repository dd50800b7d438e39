#include "fitz/core/CollisionDetector.h"

namespace fitz {

namespace {

// Exact alignment at either sample, or a change of side between them.
bool crossed(int prevDelta, int curDelta) {
    return prevDelta == 0 || curDelta == 0 || (prevDelta > 0) != (curDelta > 0);
}

} // namespace

std::optional<std::size_t> findCatchingPursuer(AbsPos playerPrev,
                                               AbsPos playerCur,
                                               std::span<const PursuerSample> pursuers,
                                               const CollisionParams& params) noexcept {
    const int t = params.threshold;
    const int period = params.xPeriod;

    for (std::size_t i = 0; i < pursuers.size(); ++i) {
        const PursuerSample& g = pursuers[i];
        if (!g.active || g.caged) continue;

        const int dxNow = wrapDistance(playerCur.x, g.cur.x, period);
        const int dyNow = linearDistance(playerCur.y, g.cur.y);
        if (dxNow <= t && dyNow <= t) return i;

        const int dxPrev = wrapDistance(playerPrev.x, g.prev.x, period);
        const int dyPrev = linearDistance(playerPrev.y, g.prev.y);

        if (dyNow <= t && dyPrev <= t) {
            const int sPrev = signedWrapDelta(playerPrev.x, g.prev.x, period);
            const int sNow = signedWrapDelta(playerCur.x, g.cur.x, period);
            if (crossed(sPrev, sNow)) return i;
        }

        if (dxNow <= t && dxPrev <= t) {
            // Vertical axis does not wrap.
            const int sPrev = playerPrev.y - g.prev.y;
            const int sNow = playerCur.y - g.cur.y;
            if (crossed(sPrev, sNow)) return i;
        }
    }
    return std::nullopt;
}

bool checkCollision(AbsPos playerPrev,
                    AbsPos playerCur,
                    std::span<const PursuerSample> pursuers,
                    const CollisionParams& params) noexcept {
    return findCatchingPursuer(playerPrev, playerCur, pursuers, params).has_value();
}

} // namespace fitz
