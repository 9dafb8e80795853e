#pragma once

#include "Color.h"
#include "Room.h"
#include "TextureRef.h"

#include <glm/glm.hpp>
#include <array>
#include <cstdint>
#include <functional>
#include <utility>
#include <optional>
#include <vector>

namespace sectorforge {

struct RoomVertex {
    glm::vec3 position;
    glm::vec3 normal;
    glm::vec2 texCoord;
    Color color;
};

struct MeshTriangle {
    std::array<uint32_t, 3> indices{0, 0, 0};
    uint32_t textureId = 0;
    BlendMode blendMode = BlendMode::Opaque;
    bool blackTransparent = true;
};

struct RoomMesh {
    std::vector<RoomVertex> vertices;
    std::vector<MeshTriangle> triangles;

    bool empty() const { return triangles.empty(); }
};

// Resolves a texture reference to a renderer texture id, nullopt if unknown
using TextureLookup = std::function<std::optional<uint32_t>(const TextureRef&)>;

/**
 * Converts a room into world-space triangles for the renderer.
 *
 * Floors face up, ceilings face down and walls face into their sector
 * (diagonal walls face the half-sector on the left of their corner pair:
 * SW for NW-SE, NW for NE-SW). Winding is counter-clockwise seen from the
 * front. FaceNormalMode::Back flips winding and normal, Both emits both
 * sides. Degenerate triangles (collapsed wall corners) are skipped.
 *
 * Texture ids come from the lookup; unresolved textures use id 0.
 */
class RoomMeshBuilder {
public:
    explicit RoomMeshBuilder(TextureLookup lookup = nullptr) : textureLookup(std::move(lookup)) {}

    RoomMesh build(const Room& room) const;

    void addSector(RoomMesh& mesh, const Room& room, size_t x, size_t z, const Sector& sector) const;

private:
    struct FaceVertex {
        glm::vec3 position;
        glm::vec2 texCoord;
        Color color;
    };

    struct FaceStyle {
        uint32_t textureId;
        BlendMode blendMode;
        FaceNormalMode normalMode;
        bool blackTransparent;
    };

    void addHorizontalFace(RoomMesh& mesh, const HorizontalFace& face, const glm::vec3& origin,
                           bool isCeiling) const;
    void addWall(RoomMesh& mesh, const VerticalFace& wall, Direction dir, const glm::vec3& origin) const;

    // Emits one triangle oriented toward `facing`, honouring the normal mode
    void emitTriangle(RoomMesh& mesh, std::array<FaceVertex, 3> corners, const glm::vec3& facing,
                      const FaceStyle& style) const;

    uint32_t resolveTexture(const TextureRef& texture) const;

    TextureLookup textureLookup;
};

} // namespace sectorforge
