#pragma once

#include <string>
#include <utility>

namespace sectorforge {

// Texture reference by pack and name (e.g. "retro-texture-pack" / "FLOOR_1A").
// An empty reference renders with the fallback texture.
struct TextureRef {
    std::string pack;
    std::string name;

    TextureRef() = default;
    TextureRef(std::string packName, std::string textureName)
        : pack(std::move(packName)), name(std::move(textureName)) {}

    static TextureRef none() { return TextureRef(); }

    bool isValid() const {
        return !pack.empty() && !name.empty();
    }

    bool operator==(const TextureRef& other) const {
        return pack == other.pack && name == other.name;
    }

    bool operator!=(const TextureRef& other) const {
        return !(*this == other);
    }
};

} // namespace sectorforge
