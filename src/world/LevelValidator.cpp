#include "LevelValidator.h"

#include <array>
#include <cmath>
#include <optional>
#include <sstream>

namespace sectorforge {

namespace {

template<size_t N>
std::optional<size_t> firstInvalid(const std::array<float, N>& values, const LevelValidator& validator) {
    for (size_t i = 0; i < N; ++i) {
        if (!validator.isValidCoord(values[i])) return i;
    }
    return std::nullopt;
}

std::string invalidHeight(const std::string& context, size_t index, float value) {
    std::ostringstream oss;
    oss << context << ": invalid height[" << index << "] = " << value;
    return oss.str();
}

} // anonymous namespace

bool LevelValidator::isValidCoord(float value) const {
    return std::isfinite(value) && std::fabs(value) <= limits.maxCoord;
}

ValidationResult LevelValidator::validateTexture(const TextureRef& texture, const std::string& context) const {
    if (texture.pack.size() > limits.maxStringLength) {
        std::ostringstream oss;
        oss << context << ": texture pack name too long (" << texture.pack.size()
            << " > " << limits.maxStringLength << ")";
        return ValidationResult::fail(oss.str());
    }
    if (texture.name.size() > limits.maxStringLength) {
        std::ostringstream oss;
        oss << context << ": texture name too long (" << texture.name.size()
            << " > " << limits.maxStringLength << ")";
        return ValidationResult::fail(oss.str());
    }
    return ValidationResult::ok();
}

ValidationResult LevelValidator::validateHorizontal(const HorizontalFace& face, const std::string& context) const {
    if (auto bad = firstInvalid(face.heights, *this)) {
        return ValidationResult::fail(invalidHeight(context, *bad, face.heights[*bad]));
    }
    if (auto result = validateTexture(face.texture, context); !result) {
        return result;
    }
    if (face.texture2) {
        return validateTexture(*face.texture2, context + " texture2");
    }
    return ValidationResult::ok();
}

ValidationResult LevelValidator::validateVertical(const VerticalFace& face, const std::string& context) const {
    if (auto bad = firstInvalid(face.heights, *this)) {
        return ValidationResult::fail(invalidHeight(context, *bad, face.heights[*bad]));
    }
    return validateTexture(face.texture, context);
}

ValidationResult LevelValidator::validateSector(const Sector& sector, const std::string& context) const {
    if (sector.floor) {
        if (auto result = validateHorizontal(*sector.floor, context + " floor"); !result) {
            return result;
        }
    }
    if (sector.ceiling) {
        if (auto result = validateHorizontal(*sector.ceiling, context + " ceiling"); !result) {
            return result;
        }
    }

    for (Direction dir : ALL_DIRECTIONS) {
        const WallStack& stack = sector.walls(dir);
        for (size_t i = 0; i < stack.size(); ++i) {
            std::ostringstream wallContext;
            wallContext << context << " walls_" << directionName(dir) << "[" << i << "]";
            if (auto result = validateVertical(stack[i], wallContext.str()); !result) {
                return result;
            }
        }
    }

    return ValidationResult::ok();
}

ValidationResult LevelValidator::validateRoom(const Room& room, size_t roomIndex) const {
    std::ostringstream ctx;
    ctx << "room[" << roomIndex << "]";
    const std::string context = ctx.str();

    if (room.width() > limits.maxRoomSize) {
        std::ostringstream oss;
        oss << context << ": width too large (" << room.width() << " > " << limits.maxRoomSize << ")";
        return ValidationResult::fail(oss.str());
    }
    if (room.depth() > limits.maxRoomSize) {
        std::ostringstream oss;
        oss << context << ": depth too large (" << room.depth() << " > " << limits.maxRoomSize << ")";
        return ValidationResult::fail(oss.str());
    }

    const glm::vec3& pos = room.getPosition();
    if (!isValidCoord(pos.x) || !isValidCoord(pos.y) || !isValidCoord(pos.z)) {
        std::ostringstream oss;
        oss << context << ": invalid position (" << pos.x << ", " << pos.y << ", " << pos.z << ")";
        return ValidationResult::fail(oss.str());
    }

    if (!isValidCoord(room.getAmbient())) {
        std::ostringstream oss;
        oss << context << ": invalid ambient " << room.getAmbient();
        return ValidationResult::fail(oss.str());
    }

    ValidationResult result;
    room.forEachSector([&](size_t x, size_t z, const Sector& sector) {
        if (!result) return;
        std::ostringstream sectorContext;
        sectorContext << context << " sector[" << x << "," << z << "]";
        result = validateSector(sector, sectorContext.str());
    });
    return result;
}

ValidationResult LevelValidator::validate(const Level& level) const {
    if (level.roomCount() > limits.maxRooms) {
        std::ostringstream oss;
        oss << "too many rooms (" << level.roomCount() << " > " << limits.maxRooms << ")";
        return ValidationResult::fail(oss.str());
    }

    const auto& rooms = level.getRooms();
    for (size_t i = 0; i < rooms.size(); ++i) {
        if (auto result = validateRoom(rooms[i], i); !result) {
            return result;
        }
    }
    return ValidationResult::ok();
}

} // namespace sectorforge
