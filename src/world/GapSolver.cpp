#include "GapSolver.h"
#include "WorldConstants.h"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace sectorforge {
namespace GapSolver {

namespace {

// Unfilled span on an edge, bounded per corner
struct Gap {
    float bottomLeft;
    float bottomRight;
    float topLeft;
    float topRight;
};

std::pair<float, float> floorEdge(const Sector& sector, Direction dir, float fallback) {
    if (sector.floor) {
        return sector.floor->edgeHeights(dir);
    }
    return {fallback, fallback};
}

std::pair<float, float> ceilingEdge(const Sector& sector, Direction dir, float fallback) {
    if (sector.ceiling) {
        return sector.ceiling->edgeHeights(dir);
    }
    return {fallback, fallback};
}

float largerSpan(const std::array<float, 4>& h) {
    return std::max(h[WALL_TOP_LEFT] - h[WALL_BOTTOM_LEFT], h[WALL_TOP_RIGHT] - h[WALL_BOTTOM_RIGHT]);
}

float meanSpan(const std::array<float, 4>& h) {
    return ((h[WALL_TOP_LEFT] - h[WALL_BOTTOM_LEFT]) + (h[WALL_TOP_RIGHT] - h[WALL_BOTTOM_RIGHT])) * 0.5f;
}

float midpoint(const std::array<float, 4>& h) {
    return (h[0] + h[1] + h[2] + h[3]) * 0.25f;
}

WallFit fillEmptyEdge(float floorLeft, float floorRight, float ceilLeft, float ceilRight,
                      std::optional<float> preferredY) {
    bool floorSloped = std::abs(floorLeft - floorRight) > MIN_GAP;
    bool ceilingSloped = std::abs(ceilLeft - ceilRight) > MIN_GAP;

    if ((floorSloped || ceilingSloped) && preferredY) {
        float floorTop = std::max(floorLeft, floorRight);
        float ceilingBottom = std::min(ceilLeft, ceilRight);
        float split = (floorTop + ceilingBottom) * 0.5f;

        std::array<float, 4> lower = {floorLeft, floorRight, floorTop, floorTop};
        std::array<float, 4> upper = {floorTop, floorTop,
                                      std::max(ceilRight, floorTop), std::max(ceilLeft, floorTop)};

        bool lowerUsable = largerSpan(lower) > HEIGHT_EPSILON;
        bool upperUsable = largerSpan(upper) > HEIGHT_EPSILON;

        // A flat floor leaves no lower triangle; fall through to the other fill
        if (*preferredY < split && lowerUsable) return WallFit::fit(lower);
        if (upperUsable) return WallFit::fit(upper);
        if (lowerUsable) return WallFit::fit(lower);
        return WallFit::noGap();
    }

    std::array<float, 4> full = {floorLeft, floorRight, ceilRight, ceilLeft};
    if (largerSpan(full) <= HEIGHT_EPSILON) {
        return WallFit::noGap();
    }
    return WallFit::fit(full);
}

// Wall heights filling a gap, or nullopt if neither corner reaches MIN_GAP.
// A corner short of MIN_GAP collapses to a single point.
std::optional<std::array<float, 4>> fitGap(const Gap& gap) {
    const float threshold = MIN_GAP - HEIGHT_EPSILON;
    float leftSpan = gap.topLeft - gap.bottomLeft;
    float rightSpan = gap.topRight - gap.bottomRight;

    if (std::max(leftSpan, rightSpan) < threshold) {
        return std::nullopt;
    }

    std::array<float, 4> h = {gap.bottomLeft, gap.bottomRight, gap.topRight, gap.topLeft};

    if (leftSpan < threshold) {
        float point = leftSpan >= 0.0f ? gap.bottomLeft : (gap.bottomLeft + gap.topLeft) * 0.5f;
        h[WALL_BOTTOM_LEFT] = point;
        h[WALL_TOP_LEFT] = point;
    }
    if (rightSpan < threshold) {
        float point = rightSpan >= 0.0f ? gap.bottomRight : (gap.bottomRight + gap.topRight) * 0.5f;
        h[WALL_BOTTOM_RIGHT] = point;
        h[WALL_TOP_RIGHT] = point;
    }
    return h;
}

} // namespace

WallFit nextWallPosition(const Sector& sector, Direction dir,
                         float fallbackFloor, float fallbackCeiling,
                         std::optional<float> preferredY) {
    const WallStack& stack = sector.walls(dir);
    if (stack.full()) {
        return WallFit::slotFull();
    }

    auto [floorLeft, floorRight] = floorEdge(sector, dir, fallbackFloor);
    auto [ceilLeft, ceilRight] = ceilingEdge(sector, dir, fallbackCeiling);

    if (stack.empty()) {
        return fillEmptyEdge(floorLeft, floorRight, ceilLeft, ceilRight, preferredY);
    }

    // Candidate gaps from bottom to top: below the lowest wall, between each
    // pair, above the highest wall. Gaps start at the highest top reached so
    // far per corner, so a tall wall covers shorter walls stacked inside it.
    auto order = stack.sortedByBottom();
    std::vector<Gap> gaps;
    gaps.reserve(stack.size() + 1);

    const VerticalFace& lowest = stack[order[0]];
    gaps.push_back({floorLeft, floorRight,
                    lowest.heights[WALL_BOTTOM_LEFT], lowest.heights[WALL_BOTTOM_RIGHT]});

    float reachedLeft = lowest.heights[WALL_TOP_LEFT];
    float reachedRight = lowest.heights[WALL_TOP_RIGHT];

    for (size_t i = 1; i < stack.size(); ++i) {
        const VerticalFace& above = stack[order[i]];
        gaps.push_back({reachedLeft, reachedRight,
                        above.heights[WALL_BOTTOM_LEFT], above.heights[WALL_BOTTOM_RIGHT]});
        reachedLeft = std::max(reachedLeft, above.heights[WALL_TOP_LEFT]);
        reachedRight = std::max(reachedRight, above.heights[WALL_TOP_RIGHT]);
    }

    gaps.push_back({reachedLeft, reachedRight, ceilLeft, ceilRight});

    std::optional<std::array<float, 4>> best;
    float bestScore = 0.0f;

    for (const Gap& gap : gaps) {
        auto candidate = fitGap(gap);
        if (!candidate) {
            continue;
        }

        if (preferredY) {
            float distance = std::abs(midpoint(*candidate) - *preferredY);
            if (!best || distance < bestScore - HEIGHT_EPSILON) {
                best = candidate;
                bestScore = distance;
            }
        } else {
            float size = meanSpan(*candidate);
            if (!best || size > bestScore + HEIGHT_EPSILON) {
                best = candidate;
                bestScore = size;
            }
        }
    }

    if (!best) {
        return WallFit::noGap();
    }
    return WallFit::fit(*best);
}

WallFit nextDiagonalWallPosition(const Sector& sector, bool nwSe,
                                 float fallbackFloor, float fallbackCeiling,
                                 std::optional<float> preferredY) {
    Direction dir = nwSe ? Direction::NwSe : Direction::NeSw;
    return nextWallPosition(sector, dir, fallbackFloor, fallbackCeiling, preferredY);
}

} // namespace GapSolver
} // namespace sectorforge
