#pragma once

#include <glm/glm.hpp>
#include <limits>

namespace sectorforge {

// Axis-aligned bounding box. Default-constructed boxes are invalid until
// expanded at least once.
struct AABB {
    glm::vec3 min = glm::vec3(std::numeric_limits<float>::max());
    glm::vec3 max = glm::vec3(std::numeric_limits<float>::lowest());

    void expand(const glm::vec3& point) {
        min = glm::min(min, point);
        max = glm::max(max, point);
    }

    bool isValid() const {
        return min.x <= max.x && min.y <= max.y && min.z <= max.z;
    }

    bool contains(const glm::vec3& point) const {
        return point.x >= min.x && point.x <= max.x &&
               point.y >= min.y && point.y <= max.y &&
               point.z >= min.z && point.z <= max.z;
    }

    AABB translated(const glm::vec3& offset) const {
        if (!isValid()) return *this;
        return AABB{min + offset, max + offset};
    }
};

} // namespace sectorforge
