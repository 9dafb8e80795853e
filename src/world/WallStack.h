#pragma once

#include "VerticalFace.h"
#include "WorldConstants.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <optional>
#include <utility>

namespace sectorforge {

/**
 * Fixed-capacity stack of walls on one sector edge or diagonal.
 *
 * Holds at most MAX_WALLS_PER_EDGE walls inline. Walls keep insertion order;
 * use sortedByBottom() when vertical order matters.
 *
 * Usage:
 *   WallStack& north = sector.walls(Direction::North);
 *   if (!north.push(VerticalFace(0.0f, 1024.0f, tex))) {
 *       // edge is full
 *   }
 */
class WallStack {
public:
    static constexpr size_t CAPACITY = MAX_WALLS_PER_EDGE;

    using iterator = VerticalFace*;
    using const_iterator = const VerticalFace*;

    size_t size() const { return count; }
    bool empty() const { return count == 0; }
    bool full() const { return count == CAPACITY; }
    static constexpr size_t capacity() { return CAPACITY; }

    /**
     * Append a wall.
     * @return false if the stack already holds CAPACITY walls (nothing changes)
     */
    bool push(const VerticalFace& wall) {
        if (full()) {
            return false;
        }
        walls[count++] = wall;
        return true;
    }

    /**
     * Remove the wall at index, shifting later walls down.
     * @return false if index is out of range
     */
    bool erase(size_t index) {
        if (index >= count) {
            return false;
        }
        for (size_t i = index; i + 1 < count; ++i) {
            walls[i] = std::move(walls[i + 1]);
        }
        walls[--count] = VerticalFace();
        return true;
    }

    void clear() {
        for (size_t i = 0; i < count; ++i) {
            walls[i] = VerticalFace();
        }
        count = 0;
    }

    VerticalFace& operator[](size_t index) { return walls[index]; }
    const VerticalFace& operator[](size_t index) const { return walls[index]; }

    VerticalFace* at(size_t index) { return index < count ? &walls[index] : nullptr; }
    const VerticalFace* at(size_t index) const { return index < count ? &walls[index] : nullptr; }

    iterator begin() { return walls.data(); }
    iterator end() { return walls.data() + count; }
    const_iterator begin() const { return walls.data(); }
    const_iterator end() const { return walls.data() + count; }

    // Indices of the walls ordered by average bottom height (ties keep insertion order)
    std::array<size_t, CAPACITY> sortedByBottom() const {
        std::array<size_t, CAPACITY> order{};
        for (size_t i = 0; i < CAPACITY; ++i) {
            order[i] = i;
        }
        std::stable_sort(order.begin(), order.begin() + count, [this](size_t a, size_t b) {
            return walls[a].yBottom() < walls[b].yBottom();
        });
        return order;
    }

    // Index of the wall with the lowest average bottom, if any
    std::optional<size_t> lowestIndex() const {
        if (empty()) {
            return std::nullopt;
        }
        return sortedByBottom()[0];
    }

    std::optional<float> maxHeight() const {
        if (empty()) {
            return std::nullopt;
        }
        float result = walls[0].yMax();
        for (size_t i = 1; i < count; ++i) {
            result = std::max(result, walls[i].yMax());
        }
        return result;
    }

    std::optional<float> minHeight() const {
        if (empty()) {
            return std::nullopt;
        }
        float result = walls[0].yMin();
        for (size_t i = 1; i < count; ++i) {
            result = std::min(result, walls[i].yMin());
        }
        return result;
    }

private:
    std::array<VerticalFace, CAPACITY> walls{};
    size_t count = 0;
};

} // namespace sectorforge
