#pragma once

#include "Color.h"
#include "Direction.h"
#include "TextureRef.h"

#include <glm/glm.hpp>
#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace sectorforge {

// Which diagonal splits a floor/ceiling quad into its two triangles
enum class SplitDirection : uint8_t {
    NwSe = 0,   // Triangles (NW, NE, SE) and (NW, SE, SW)
    NeSw        // Triangles (NW, NE, SW) and (NE, SE, SW)
};

inline const char* splitDirectionName(SplitDirection split) {
    return split == SplitDirection::NeSw ? "ne_sw" : "nw_se";
}

inline std::optional<SplitDirection> parseSplitDirection(std::string_view name) {
    if (name == "nw_se") return SplitDirection::NwSe;
    if (name == "ne_sw") return SplitDirection::NeSw;
    return std::nullopt;
}

/**
 * Floor or ceiling of a sector.
 *
 * Corner heights are ordered [NW, NE, SE, SW]. The quad is rendered and
 * height-sampled as two triangles chosen by splitDirection. The first
 * triangle uses texture/uv/colors; the second may override each of them,
 * falling back to the first triangle's values when unset.
 */
struct HorizontalFace {
    std::array<float, 4> heights{0.0f, 0.0f, 0.0f, 0.0f};
    SplitDirection splitDirection = SplitDirection::NwSe;

    TextureRef texture;
    std::optional<std::array<glm::vec2, 4>> uv;
    std::array<Color, 4> colors{Color::neutral(), Color::neutral(), Color::neutral(), Color::neutral()};

    // Second triangle overrides
    std::optional<TextureRef> texture2;
    std::optional<std::array<glm::vec2, 4>> uv2;
    std::optional<std::array<Color, 4>> colors2;

    bool walkable = true;
    BlendMode blendMode = BlendMode::Opaque;
    FaceNormalMode normalMode = FaceNormalMode::Front;
    bool blackTransparent = true;

    static HorizontalFace flat(float height, TextureRef tex);
    static HorizontalFace sloped(const std::array<float, 4>& cornerHeights, TextureRef tex);

    void setUniformColor(const Color& color) { colors = {color, color, color, color}; }
    bool hasUniformColor() const;

    float avgHeight() const {
        return (heights[0] + heights[1] + heights[2] + heights[3]) * 0.25f;
    }

    bool isFlat() const;

    float minHeight() const;
    float maxHeight() const;

    // Height at normalized in-sector coordinates. u runs west->east, v runs
    // north->south; both are clamped to [0, 1].
    float interpolateHeight(float u, float v) const;

    // (left, right) corner heights of an edge or diagonal, seen from inside
    std::pair<float, float> edgeHeights(Direction dir) const;
    float edgeMax(Direction dir) const;
    float edgeMin(Direction dir) const;

    // Corner indices of triangle 0 or 1 for the current split
    std::array<Corner, 3> triangleCorners(int triangle) const;

    const TextureRef& triangleTexture(int triangle) const;
    const std::array<Color, 4>& triangleColors(int triangle) const;
    const std::optional<std::array<glm::vec2, 4>>& triangleUv(int triangle) const;

    // Offset every corner by the same amount
    void raise(float amount);
};

} // namespace sectorforge
