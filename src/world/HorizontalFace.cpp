#include "HorizontalFace.h"
#include "WorldConstants.h"

#include <algorithm>
#include <cmath>

namespace sectorforge {

HorizontalFace HorizontalFace::flat(float height, TextureRef tex) {
    HorizontalFace face;
    face.heights = {height, height, height, height};
    face.texture = std::move(tex);
    return face;
}

HorizontalFace HorizontalFace::sloped(const std::array<float, 4>& cornerHeights, TextureRef tex) {
    HorizontalFace face;
    face.heights = cornerHeights;
    face.texture = std::move(tex);
    return face;
}

bool HorizontalFace::hasUniformColor() const {
    return colors[0].sameRgb(colors[1]) && colors[0].sameRgb(colors[2]) && colors[0].sameRgb(colors[3]);
}

bool HorizontalFace::isFlat() const {
    float h = heights[0];
    return std::all_of(heights.begin(), heights.end(),
                       [h](float corner) { return std::abs(corner - h) < HEIGHT_EPSILON; });
}

float HorizontalFace::minHeight() const {
    return *std::min_element(heights.begin(), heights.end());
}

float HorizontalFace::maxHeight() const {
    return *std::max_element(heights.begin(), heights.end());
}

float HorizontalFace::interpolateHeight(float u, float v) const {
    u = std::clamp(u, 0.0f, 1.0f);
    v = std::clamp(v, 0.0f, 1.0f);

    const float nw = heights[CORNER_NW];
    const float ne = heights[CORNER_NE];
    const float se = heights[CORNER_SE];
    const float sw = heights[CORNER_SW];

    if (splitDirection == SplitDirection::NwSe) {
        if (u >= v) {
            // Triangle NW(0,0), NE(1,0), SE(1,1)
            return nw + u * (ne - nw) + v * (se - ne);
        }
        // Triangle NW(0,0), SE(1,1), SW(0,1)
        return nw + v * (sw - nw) + u * (se - sw);
    }

    if (u + v <= 1.0f) {
        // Triangle NW(0,0), NE(1,0), SW(0,1)
        return nw + u * (ne - nw) + v * (sw - nw);
    }
    // Triangle NE(1,0), SE(1,1), SW(0,1)
    return se + (1.0f - u) * (sw - se) + (1.0f - v) * (ne - se);
}

std::pair<float, float> HorizontalFace::edgeHeights(Direction dir) const {
    auto [left, right] = edgeCorners(dir);
    return {heights[left], heights[right]};
}

float HorizontalFace::edgeMax(Direction dir) const {
    auto [left, right] = edgeHeights(dir);
    return std::max(left, right);
}

float HorizontalFace::edgeMin(Direction dir) const {
    auto [left, right] = edgeHeights(dir);
    return std::min(left, right);
}

std::array<Corner, 3> HorizontalFace::triangleCorners(int triangle) const {
    if (splitDirection == SplitDirection::NwSe) {
        if (triangle == 0) return {CORNER_NW, CORNER_NE, CORNER_SE};
        return {CORNER_NW, CORNER_SE, CORNER_SW};
    }
    if (triangle == 0) return {CORNER_NW, CORNER_NE, CORNER_SW};
    return {CORNER_NE, CORNER_SE, CORNER_SW};
}

const TextureRef& HorizontalFace::triangleTexture(int triangle) const {
    if (triangle == 1 && texture2) return *texture2;
    return texture;
}

const std::array<Color, 4>& HorizontalFace::triangleColors(int triangle) const {
    if (triangle == 1 && colors2) return *colors2;
    return colors;
}

const std::optional<std::array<glm::vec2, 4>>& HorizontalFace::triangleUv(int triangle) const {
    if (triangle == 1 && uv2) return uv2;
    return uv;
}

void HorizontalFace::raise(float amount) {
    for (float& h : heights) {
        h += amount;
    }
}

} // namespace sectorforge
