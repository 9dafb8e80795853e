#include "VerticalFace.h"
#include "WorldConstants.h"

#include <algorithm>
#include <cmath>

namespace sectorforge {

VerticalFace::VerticalFace(float yBottom, float yTop, TextureRef tex)
    : heights{yBottom, yBottom, yTop, yTop}
    , texture(std::move(tex)) {}

VerticalFace VerticalFace::fromHeights(const std::array<float, 4>& cornerHeights, TextureRef tex) {
    VerticalFace face;
    face.heights = cornerHeights;
    face.texture = std::move(tex);
    return face;
}

bool VerticalFace::hasUniformColor() const {
    return colors[0].sameRgb(colors[1]) && colors[0].sameRgb(colors[2]) && colors[0].sameRgb(colors[3]);
}

float VerticalFace::yMin() const {
    return *std::min_element(heights.begin(), heights.end());
}

float VerticalFace::yMax() const {
    return *std::max_element(heights.begin(), heights.end());
}

bool VerticalFace::isFlat() const {
    bool bottomSame = std::abs(heights[WALL_BOTTOM_LEFT] - heights[WALL_BOTTOM_RIGHT]) < HEIGHT_EPSILON;
    bool topSame = std::abs(heights[WALL_TOP_RIGHT] - heights[WALL_TOP_LEFT]) < HEIGHT_EPSILON;
    return bottomSame && topSame;
}

} // namespace sectorforge
