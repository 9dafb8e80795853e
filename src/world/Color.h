#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace sectorforge {

// PS1-style semi-transparency modes
enum class BlendMode : uint8_t {
    Opaque = 0,     // Overwrite
    Average,        // 0.5*B + 0.5*F
    Add,            // B + F
    Subtract,       // B - F
    AddQuarter,     // B + 0.25*F
    Erase           // Alpha to 0
};

// Which side(s) of a face are rendered
enum class FaceNormalMode : uint8_t {
    Front = 0,
    Back,
    Both
};

inline const char* blendModeName(BlendMode mode) {
    switch (mode) {
        case BlendMode::Opaque:     return "opaque";
        case BlendMode::Average:    return "average";
        case BlendMode::Add:        return "add";
        case BlendMode::Subtract:   return "subtract";
        case BlendMode::AddQuarter: return "add_quarter";
        case BlendMode::Erase:      return "erase";
    }
    return "opaque";
}

inline std::optional<BlendMode> parseBlendMode(std::string_view name) {
    if (name == "opaque") return BlendMode::Opaque;
    if (name == "average") return BlendMode::Average;
    if (name == "add") return BlendMode::Add;
    if (name == "subtract") return BlendMode::Subtract;
    if (name == "add_quarter") return BlendMode::AddQuarter;
    if (name == "erase") return BlendMode::Erase;
    return std::nullopt;
}

inline const char* normalModeName(FaceNormalMode mode) {
    switch (mode) {
        case FaceNormalMode::Front: return "front";
        case FaceNormalMode::Back:  return "back";
        case FaceNormalMode::Both:  return "both";
    }
    return "front";
}

inline std::optional<FaceNormalMode> parseNormalMode(std::string_view name) {
    if (name == "front") return FaceNormalMode::Front;
    if (name == "back") return FaceNormalMode::Back;
    if (name == "both") return FaceNormalMode::Both;
    return std::nullopt;
}

// Vertex color used to modulate texels. 128 is neutral, below darkens,
// above brightens.
struct Color {
    uint8_t r = 128;
    uint8_t g = 128;
    uint8_t b = 128;
    BlendMode blend = BlendMode::Opaque;

    constexpr Color() = default;
    constexpr Color(uint8_t red, uint8_t green, uint8_t blue, BlendMode mode = BlendMode::Opaque)
        : r(red), g(green), b(blue), blend(mode) {}

    static constexpr Color neutral() { return Color(128, 128, 128); }
    static constexpr Color black() { return Color(0, 0, 0); }

    // RGB only, blend mode is not part of the tint
    constexpr bool sameRgb(const Color& other) const {
        return r == other.r && g == other.g && b == other.b;
    }

    constexpr bool operator==(const Color& other) const {
        return sameRgb(other) && blend == other.blend;
    }

    constexpr bool operator!=(const Color& other) const {
        return !(*this == other);
    }
};

} // namespace sectorforge
