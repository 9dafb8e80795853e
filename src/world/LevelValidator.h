#pragma once

#include "Level.h"
#include "LevelLimits.h"

#include <string>
#include <utility>

namespace sectorforge {

struct ValidationResult {
    bool valid = true;
    std::string error;   // First problem found, with its location

    explicit operator bool() const { return valid; }

    static ValidationResult ok() { return ValidationResult(); }
    static ValidationResult fail(std::string message) { return ValidationResult{false, std::move(message)}; }
};

/**
 * Structural checks run on every loaded level before it is used.
 *
 * Rejects too many rooms, oversized rooms, non-finite or out of range
 * heights/positions/ambient and over-long texture strings. Errors name the
 * offending element, e.g. "room[0] sector[2,3] walls_north[1]: invalid
 * height[2] = nan".
 */
class LevelValidator {
public:
    explicit LevelValidator(const LevelLimits& limits = LevelLimits()) : limits(limits) {}

    ValidationResult validate(const Level& level) const;
    ValidationResult validateRoom(const Room& room, size_t roomIndex) const;
    ValidationResult validateSector(const Sector& sector, const std::string& context) const;

    bool isValidCoord(float value) const;

private:
    ValidationResult validateTexture(const TextureRef& texture, const std::string& context) const;
    ValidationResult validateHorizontal(const HorizontalFace& face, const std::string& context) const;
    ValidationResult validateVertical(const VerticalFace& face, const std::string& context) const;

    LevelLimits limits;
};

} // namespace sectorforge
