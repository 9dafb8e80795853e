#pragma once

#include "Color.h"
#include "TextureRef.h"

#include <glm/glm.hpp>
#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace sectorforge {

// How wall UVs are generated when no explicit uv is set
enum class UvProjection : uint8_t {
    Default = 0,    // Stretch texture once across the quad
    Projected       // Derive from world-space edge length and height
};

inline const char* uvProjectionName(UvProjection projection) {
    return projection == UvProjection::Projected ? "projected" : "default";
}

inline std::optional<UvProjection> parseUvProjection(std::string_view name) {
    if (name == "default") return UvProjection::Default;
    if (name == "projected") return UvProjection::Projected;
    return std::nullopt;
}

// Wall corner indices in the wall's own frame
enum WallCorner : uint8_t {
    WALL_BOTTOM_LEFT = 0,
    WALL_BOTTOM_RIGHT = 1,
    WALL_TOP_RIGHT = 2,
    WALL_TOP_LEFT = 3
};

/**
 * A wall segment on one edge or diagonal of a sector.
 *
 * heights = [bottom-left, bottom-right, top-right, top-left]. Left and right
 * are the two sector corners returned by edgeCorners() for the slot the wall
 * lives in. Bottom and top corners need not be level, so a wall can follow a
 * sloped floor or collapse to a triangle.
 */
struct VerticalFace {
    std::array<float, 4> heights{0.0f, 0.0f, 0.0f, 0.0f};
    TextureRef texture;
    std::optional<std::array<glm::vec2, 4>> uv;
    std::array<Color, 4> colors{Color::neutral(), Color::neutral(), Color::neutral(), Color::neutral()};

    bool solid = true;
    BlendMode blendMode = BlendMode::Opaque;
    FaceNormalMode normalMode = FaceNormalMode::Front;
    bool blackTransparent = true;
    UvProjection uvProjection = UvProjection::Default;

    VerticalFace() = default;
    VerticalFace(float yBottom, float yTop, TextureRef tex);

    static VerticalFace fromHeights(const std::array<float, 4>& cornerHeights, TextureRef tex);

    void setUniformColor(const Color& color) { colors = {color, color, color, color}; }
    bool hasUniformColor() const;

    float yBottom() const { return (heights[WALL_BOTTOM_LEFT] + heights[WALL_BOTTOM_RIGHT]) * 0.5f; }
    float yTop() const { return (heights[WALL_TOP_RIGHT] + heights[WALL_TOP_LEFT]) * 0.5f; }

    // Extremes over all four corners
    float yMin() const;
    float yMax() const;

    // Average height (top minus bottom)
    float height() const { return yTop() - yBottom(); }

    bool isFlat() const;

    // (bottom, top) of each vertical side
    std::pair<float, float> leftCoverage() const {
        return {heights[WALL_BOTTOM_LEFT], heights[WALL_TOP_LEFT]};
    }
    std::pair<float, float> rightCoverage() const {
        return {heights[WALL_BOTTOM_RIGHT], heights[WALL_TOP_RIGHT]};
    }
};

} // namespace sectorforge
