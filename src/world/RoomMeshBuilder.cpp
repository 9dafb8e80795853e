#include "RoomMeshBuilder.h"

#include <glm/geometric.hpp>
#include <algorithm>
#include <utility>

namespace sectorforge {

namespace {

constexpr float DEGENERATE_AREA = 1e-6f;

// Default UVs per corner
const std::array<glm::vec2, 4> FLOOR_UVS = {
    glm::vec2(0.0f, 0.0f), glm::vec2(1.0f, 0.0f), glm::vec2(1.0f, 1.0f), glm::vec2(0.0f, 1.0f)
};
const std::array<glm::vec2, 4> WALL_UVS = {
    glm::vec2(0.0f, 1.0f), glm::vec2(1.0f, 1.0f), glm::vec2(1.0f, 0.0f), glm::vec2(0.0f, 0.0f)
};

glm::vec3 cornerPosition(const glm::vec3& origin, Corner corner, float height) {
    auto [dx, dz] = cornerOffset(corner);
    return glm::vec3(origin.x + dx * SECTOR_SIZE, height, origin.z + dz * SECTOR_SIZE);
}

// Horizontal direction a wall's front faces
glm::vec3 wallFacing(Direction dir) {
    auto [left, right] = edgeCorners(dir);
    auto [lx, lz] = cornerOffset(left);
    auto [rx, rz] = cornerOffset(right);

    if (isDiagonal(dir)) {
        // Left perpendicular of the left->right corner pair
        return glm::vec3(-(rz - lz), 0.0f, rx - lx);
    }

    // Toward the sector centre
    return glm::vec3(0.5f - (lx + rx) * 0.5f, 0.0f, 0.5f - (lz + rz) * 0.5f);
}

} // anonymous namespace

uint32_t RoomMeshBuilder::resolveTexture(const TextureRef& texture) const {
    if (!textureLookup || !texture.isValid()) return 0;
    return textureLookup(texture).value_or(0);
}

RoomMesh RoomMeshBuilder::build(const Room& room) const {
    RoomMesh mesh;
    room.forEachSector([&](size_t x, size_t z, const Sector& sector) {
        addSector(mesh, room, x, z, sector);
    });
    return mesh;
}

void RoomMeshBuilder::addSector(RoomMesh& mesh, const Room& room, size_t x, size_t z,
                                const Sector& sector) const {
    const glm::vec3 origin = room.gridToWorld(x, z);

    if (sector.floor) {
        addHorizontalFace(mesh, *sector.floor, origin, false);
    }
    if (sector.ceiling) {
        addHorizontalFace(mesh, *sector.ceiling, origin, true);
    }
    for (Direction dir : ALL_DIRECTIONS) {
        for (const VerticalFace& wall : sector.walls(dir)) {
            addWall(mesh, wall, dir, origin);
        }
    }
}

void RoomMeshBuilder::addHorizontalFace(RoomMesh& mesh, const HorizontalFace& face, const glm::vec3& origin,
                                        bool isCeiling) const {
    const glm::vec3 facing = isCeiling ? glm::vec3(0.0f, -1.0f, 0.0f) : glm::vec3(0.0f, 1.0f, 0.0f);

    for (int t = 0; t < 2; ++t) {
        const auto& uvOverride = face.triangleUv(t);
        const auto& uvs = uvOverride ? *uvOverride : FLOOR_UVS;
        const auto& colors = face.triangleColors(t);

        std::array<FaceVertex, 3> corners;
        const auto cornerIds = face.triangleCorners(t);
        for (size_t i = 0; i < 3; ++i) {
            Corner c = cornerIds[i];
            corners[i] = {cornerPosition(origin, c, face.heights[c]), uvs[c], colors[c]};
        }

        FaceStyle style{resolveTexture(face.triangleTexture(t)), face.blendMode, face.normalMode,
                        face.blackTransparent};
        emitTriangle(mesh, corners, facing, style);
    }
}

void RoomMeshBuilder::addWall(RoomMesh& mesh, const VerticalFace& wall, Direction dir,
                              const glm::vec3& origin) const {
    auto [left, right] = edgeCorners(dir);

    const std::array<glm::vec3, 4> positions = {
        cornerPosition(origin, left, wall.heights[WALL_BOTTOM_LEFT]),
        cornerPosition(origin, right, wall.heights[WALL_BOTTOM_RIGHT]),
        cornerPosition(origin, right, wall.heights[WALL_TOP_RIGHT]),
        cornerPosition(origin, left, wall.heights[WALL_TOP_LEFT])
    };

    std::array<glm::vec2, 4> uvs = wall.uv ? *wall.uv : WALL_UVS;
    if (!wall.uv && wall.uvProjection == UvProjection::Projected) {
        // One texture repeat per SECTOR_SIZE along the edge and vertically
        const float length = glm::length(glm::vec2(positions[1].x - positions[0].x,
                                                   positions[1].z - positions[0].z)) / SECTOR_SIZE;
        const float top = wall.yMax();
        uvs[WALL_BOTTOM_LEFT] = glm::vec2(0.0f, (top - wall.heights[WALL_BOTTOM_LEFT]) / SECTOR_SIZE);
        uvs[WALL_BOTTOM_RIGHT] = glm::vec2(length, (top - wall.heights[WALL_BOTTOM_RIGHT]) / SECTOR_SIZE);
        uvs[WALL_TOP_RIGHT] = glm::vec2(length, (top - wall.heights[WALL_TOP_RIGHT]) / SECTOR_SIZE);
        uvs[WALL_TOP_LEFT] = glm::vec2(0.0f, (top - wall.heights[WALL_TOP_LEFT]) / SECTOR_SIZE);
    }

    auto vertex = [&](WallCorner c) {
        return FaceVertex{positions[c], uvs[c], wall.colors[c]};
    };

    const glm::vec3 facing = wallFacing(dir);
    FaceStyle style{resolveTexture(wall.texture), wall.blendMode, wall.normalMode, wall.blackTransparent};

    emitTriangle(mesh, {vertex(WALL_BOTTOM_LEFT), vertex(WALL_BOTTOM_RIGHT), vertex(WALL_TOP_RIGHT)}, facing, style);
    emitTriangle(mesh, {vertex(WALL_BOTTOM_LEFT), vertex(WALL_TOP_RIGHT), vertex(WALL_TOP_LEFT)}, facing, style);
}

void RoomMeshBuilder::emitTriangle(RoomMesh& mesh, std::array<FaceVertex, 3> corners, const glm::vec3& facing,
                                   const FaceStyle& style) const {
    glm::vec3 n = glm::cross(corners[1].position - corners[0].position,
                             corners[2].position - corners[0].position);
    const float area = glm::length(n);
    if (area < DEGENERATE_AREA) return;

    n /= area;
    if (glm::dot(n, facing) < 0.0f) {
        std::swap(corners[1], corners[2]);
        n = -n;
    }

    auto push = [&](const std::array<FaceVertex, 3>& tri, const glm::vec3& normal) {
        const uint32_t base = static_cast<uint32_t>(mesh.vertices.size());
        for (const auto& v : tri) {
            mesh.vertices.push_back({v.position, normal, v.texCoord, v.color});
        }
        mesh.triangles.push_back({{base, base + 1, base + 2}, style.textureId, style.blendMode,
                                  style.blackTransparent});
    };

    if (style.normalMode != FaceNormalMode::Back) {
        push(corners, n);
    }
    if (style.normalMode != FaceNormalMode::Front) {
        push({corners[0], corners[2], corners[1]}, -n);
    }
}

} // namespace sectorforge
