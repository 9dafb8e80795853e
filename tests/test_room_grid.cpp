// Tests for Room - grid growth, trimming, bounds and wall placement

#include <doctest/doctest.h>
#include "world/Room.h"
#include <utility>

using namespace sectorforge;

namespace {

const TextureRef FLOOR_TEX("pack", "FLOOR_1A");
const TextureRef WALL_TEX("pack", "WALL_1A");

float floorHeightAt(const Room& room, size_t x, size_t z) {
    const Sector* sector = room.getSector(x, z);
    REQUIRE(sector != nullptr);
    REQUIRE(sector->floor.has_value());
    return sector->floor->heights[CORNER_NW];
}

} // namespace

TEST_SUITE("Room grid") {
    TEST_CASE("new room is empty") {
        Room room(3, glm::vec3(0.0f), 2, 3);
        CHECK(room.getId() == 3);
        CHECK(room.width() == 2);
        CHECK(room.depth() == 3);
        CHECK(room.sectorCount() == 0);
        CHECK(room.getAmbient() == doctest::Approx(0.5f));
        CHECK(room.getSector(0, 0) == nullptr);
        CHECK(room.getSector(2, 0) == nullptr);
    }

    TEST_CASE("set and remove sectors within range only") {
        Room room(0, glm::vec3(0.0f), 2, 2);
        CHECK(room.setSector(1, 1, Sector::withFloor(0.0f, FLOOR_TEX)));
        CHECK_FALSE(room.setSector(2, 0, Sector::withFloor(0.0f, FLOOR_TEX)));
        CHECK(room.sectorCount() == 1);

        CHECK(room.removeSector(1, 1));
        CHECK_FALSE(room.removeSector(5, 5));
        CHECK(room.sectorCount() == 0);
    }

    TEST_CASE("positive growth keeps position") {
        Room room(0, glm::vec3(0.0f), 1, 1);
        room.setFloor(0, 0, 0.0f, FLOOR_TEX);

        room.ensureSector(3, 2);
        CHECK(room.width() == 4);
        CHECK(room.depth() == 3);
        CHECK(room.getPosition().x == doctest::Approx(0.0f));
        CHECK(room.getPosition().z == doctest::Approx(0.0f));
        CHECK(room.getSector(0, 0)->floor.has_value());
        CHECK(room.getSector(3, 2) != nullptr);
    }

    TEST_CASE("growing west shifts position by one sector") {
        Room room(0, glm::vec3(0.0f), 1, 1);
        room.setFloor(0, 0, 128.0f, FLOOR_TEX);

        room.grow(Direction::West);
        CHECK(room.width() == 2);
        CHECK(room.getPosition().x == -SECTOR_SIZE);

        // Existing sector moved to the next index and kept its world position
        CHECK(room.getSector(0, 0) == nullptr);
        CHECK(floorHeightAt(room, 1, 0) == doctest::Approx(128.0f));
        CHECK(room.gridToWorld(1, 0).x == doctest::Approx(0.0f));

        // A floor at the new column sits one sector west of the old origin
        room.setFloor(0, 0, 0.0f, FLOOR_TEX);
        CHECK(room.gridToWorld(0, 0).x == doctest::Approx(-1024.0f));
    }

    TEST_CASE("growing north shifts position by one sector") {
        Room room(0, glm::vec3(0.0f, 0.0f, 2048.0f), 1, 1);
        room.setFloor(0, 0, 0.0f, FLOOR_TEX);

        room.grow(Direction::North, 2);
        CHECK(room.depth() == 3);
        CHECK(room.getPosition().z == doctest::Approx(0.0f));
        CHECK(room.getSector(0, 2) != nullptr);
        CHECK(room.gridToWorld(0, 2).z == doctest::Approx(2048.0f));
    }

    TEST_CASE("growToInclude remaps negative indices") {
        Room room(0, glm::vec3(0.0f), 1, 1);
        room.setFloor(0, 0, 0.0f, FLOOR_TEX);

        GridCoord coord = room.growToInclude(-1, 0);
        CHECK(coord == (GridCoord{0, 0}));
        CHECK(room.getPosition().x == -SECTOR_SIZE);
        CHECK(room.getSector(1, 0) != nullptr);

        coord = room.growToInclude(-2, -3);
        CHECK(coord == (GridCoord{0, 0}));
        CHECK(room.width() == 4);
        CHECK(room.depth() == 4);
        CHECK(room.getPosition().x == doctest::Approx(-3072.0f));
        CHECK(room.getPosition().z == doctest::Approx(-3072.0f));
        CHECK(room.getSector(3, 3) != nullptr);

        coord = room.growToInclude(5, 1);
        CHECK(coord == (GridCoord{5, 1}));
        CHECK(room.width() == 6);
    }

    TEST_CASE("repeated growth past the arena padding keeps sectors") {
        Room room(0, glm::vec3(0.0f), 1, 1);
        room.setFloor(0, 0, 512.0f, FLOOR_TEX);

        for (int i = 0; i < 10; ++i) {
            room.grow(Direction::West);
            room.grow(Direction::North);
            room.grow(Direction::East);
            room.grow(Direction::South);
        }

        CHECK(room.width() == 21);
        CHECK(room.depth() == 21);
        CHECK(room.getPosition().x == doctest::Approx(-10240.0f));
        CHECK(room.getPosition().z == doctest::Approx(-10240.0f));
        CHECK(room.sectorCount() == 1);
        CHECK(floorHeightAt(room, 10, 10) == doctest::Approx(512.0f));

        glm::vec3 world = room.gridToWorld(10, 10);
        CHECK(world.x == doctest::Approx(0.0f));
        CHECK(world.z == doctest::Approx(0.0f));
    }

    TEST_CASE("diagonal growth is ignored") {
        Room room(0, glm::vec3(0.0f), 1, 1);
        room.grow(Direction::NwSe);
        CHECK(room.width() == 1);
        CHECK(room.depth() == 1);
        CHECK(room.getPosition().x == doctest::Approx(0.0f));
    }

    TEST_CASE("world to grid conversion") {
        Room room(0, glm::vec3(-1024.0f, 0.0f, 0.0f), 2, 1);

        auto a = room.worldToGrid(-10.0f, 10.0f);
        REQUIRE(a.has_value());
        CHECK(*a == (GridCoord{0, 0}));

        auto b = room.worldToGrid(500.0f, 10.0f);
        REQUIRE(b.has_value());
        CHECK(*b == (GridCoord{1, 0}));

        CHECK_FALSE(room.worldToGrid(2000.0f, 10.0f).has_value());
        CHECK_FALSE(room.worldToGrid(-2000.0f, 10.0f).has_value());
        CHECK_FALSE(room.worldToGrid(0.0f, -1.0f).has_value());
    }

    TEST_CASE("copies are independent") {
        Room source(0, glm::vec3(0.0f), 1, 1);
        source.setFloor(0, 0, 0.0f, FLOOR_TEX);

        Room copy = source;
        copy.setFloor(0, 0, 512.0f, FLOOR_TEX);
        copy.grow(Direction::West);

        CHECK(floorHeightAt(source, 0, 0) == doctest::Approx(0.0f));
        CHECK(source.width() == 1);
        CHECK(floorHeightAt(copy, 1, 0) == doctest::Approx(512.0f));

        Room assigned;
        assigned = copy;
        CHECK(assigned.width() == 2);
        CHECK(assigned.getPosition().x == -SECTOR_SIZE);
        CHECK(floorHeightAt(assigned, 1, 0) == doctest::Approx(512.0f));
    }

    TEST_CASE("moved-from room is an empty grid") {
        Room source(0, glm::vec3(0.0f), 2, 2);
        source.setFloor(1, 1, 256.0f, FLOOR_TEX);
        source.grow(Direction::North);

        Room moved(std::move(source));
        CHECK(moved.width() == 2);
        CHECK(moved.depth() == 3);
        CHECK(moved.sectorCount() == 1);
        CHECK(floorHeightAt(moved, 1, 2) == doctest::Approx(256.0f));

        CHECK(source.width() == 0);
        CHECK(source.depth() == 0);
        CHECK(source.sectorCount() == 0);
        CHECK(source.getSector(0, 0) == nullptr);

        // Still usable after the move
        source.setFloor(0, 0, 128.0f, FLOOR_TEX);
        CHECK(source.width() == 1);
        CHECK(floorHeightAt(source, 0, 0) == doctest::Approx(128.0f));

        Room assigned;
        assigned = std::move(moved);
        CHECK(assigned.sectorCount() == 1);
        CHECK(moved.width() == 0);
        CHECK(moved.sectorCount() == 0);
    }
}

TEST_SUITE("Room trimming") {
    TEST_CASE("trim removes empty boundary rows and columns") {
        Room room(0, glm::vec3(0.0f), 4, 4);
        room.setFloor(2, 1, 256.0f, FLOOR_TEX);

        room.trimEmptyEdges();
        CHECK(room.width() == 1);
        CHECK(room.depth() == 1);
        CHECK(room.getPosition().x == doctest::Approx(2048.0f));
        CHECK(room.getPosition().z == doctest::Approx(1024.0f));
        CHECK(floorHeightAt(room, 0, 0) == doctest::Approx(256.0f));

        // Growth after a trim still works
        room.grow(Direction::East);
        room.grow(Direction::West);
        CHECK(room.width() == 3);
        CHECK(floorHeightAt(room, 1, 0) == doctest::Approx(256.0f));
        CHECK(room.getSector(0, 0) == nullptr);
        CHECK(room.getSector(2, 0) == nullptr);
    }

    TEST_CASE("trim keeps interior holes") {
        Room room(0, glm::vec3(0.0f), 3, 1);
        room.setFloor(0, 0, 0.0f, FLOOR_TEX);
        room.setFloor(2, 0, 0.0f, FLOOR_TEX);

        room.trimEmptyEdges();
        CHECK(room.width() == 3);
        CHECK(room.getPosition().x == doctest::Approx(0.0f));
    }

    TEST_CASE("trimming an empty room leaves one cell") {
        Room room(0, glm::vec3(1024.0f, 0.0f, 1024.0f), 3, 3);
        room.trimEmptyEdges();
        CHECK(room.width() == 1);
        CHECK(room.depth() == 1);
        CHECK(room.getPosition().x == doctest::Approx(1024.0f));
        CHECK(room.getSector(0, 0) == nullptr);
    }

    TEST_CASE("cleanup drops sectors without geometry") {
        Room room(0, glm::vec3(0.0f), 3, 1);
        room.ensureSector(0, 0);
        room.ensureSector(1, 0).walls(Direction::North).push(VerticalFace(0.0f, 1024.0f, WALL_TEX));
        room.setFloor(2, 0, 0.0f, FLOOR_TEX);
        CHECK(room.sectorCount() == 3);

        CHECK(room.cleanupEmptySectors() == 1);
        CHECK(room.sectorCount() == 2);
        CHECK(room.width() == 2);
        CHECK(room.getPosition().x == doctest::Approx(1024.0f));
        CHECK(room.getSector(0, 0)->wallCount() == 1);
    }
}

TEST_SUITE("Room bounds") {
    TEST_CASE("empty room has invalid bounds") {
        Room room;
        room.recalculateBounds();
        CHECK_FALSE(room.getBounds().isValid());
        CHECK_FALSE(room.containsPoint(glm::vec3(0.0f)));
    }

    TEST_CASE("bounds cover floor and ceiling") {
        Room room(0, glm::vec3(2048.0f, 100.0f, 0.0f), 1, 1);
        room.setFloor(0, 0, 0.0f, FLOOR_TEX);
        room.setCeiling(0, 0, 1024.0f, FLOOR_TEX);
        room.recalculateBounds();

        const AABB& local = room.getBounds();
        CHECK(local.min.x == doctest::Approx(0.0f));
        CHECK(local.min.y == doctest::Approx(0.0f));
        CHECK(local.max.x == doctest::Approx(1024.0f));
        CHECK(local.max.y == doctest::Approx(1024.0f));
        CHECK(local.max.z == doctest::Approx(1024.0f));

        AABB world = room.worldBounds();
        CHECK(world.min.x == doctest::Approx(2048.0f));
        CHECK(world.max.x == doctest::Approx(3072.0f));
        // Heights are already world-space
        CHECK(world.min.y == doctest::Approx(0.0f));

        CHECK(room.containsPoint(glm::vec3(2500.0f, 500.0f, 500.0f)));
        CHECK_FALSE(room.containsPoint(glm::vec3(500.0f, 500.0f, 500.0f)));
        CHECK_FALSE(room.containsPoint(glm::vec3(2500.0f, 2000.0f, 500.0f)));
    }

    TEST_CASE("bounds include walls beyond the ceiling") {
        Room room(0, glm::vec3(0.0f), 1, 1);
        room.setFloor(0, 0, -512.0f, FLOOR_TEX);
        room.addWall(0, 0, Direction::North, 0.0f, 3000.0f, WALL_TEX);
        room.recalculateBounds();

        CHECK(room.getBounds().min.y == doctest::Approx(-512.0f));
        CHECK(room.getBounds().max.y == doctest::Approx(3000.0f));
    }

    TEST_CASE("bounds follow sloped faces") {
        Room room(0, glm::vec3(0.0f), 1, 1);
        room.ensureSector(0, 0).floor = HorizontalFace::sloped({0.0f, 256.0f, 768.0f, 128.0f}, FLOOR_TEX);
        room.recalculateBounds();
        CHECK(room.getBounds().max.y == doctest::Approx(768.0f));
    }
}

TEST_SUITE("Room walls") {
    TEST_CASE("addWall honours the edge cap") {
        Room room(0, glm::vec3(0.0f), 1, 1);
        CHECK(room.addWall(0, 0, Direction::East, 0.0f, 256.0f, WALL_TEX));
        CHECK(room.addWall(0, 0, Direction::East, 512.0f, 768.0f, WALL_TEX));
        CHECK(room.addWall(0, 0, Direction::East, 1024.0f, 1280.0f, WALL_TEX));
        CHECK_FALSE(room.addWall(0, 0, Direction::East, 2048.0f, 2304.0f, WALL_TEX));
        CHECK(room.getSector(0, 0)->walls(Direction::East).size() == 3);
    }

    TEST_CASE("placeWall inserts what the solver proposes") {
        Room room(0, glm::vec3(0.0f), 1, 1);
        room.setFloor(0, 0, 0.0f, FLOOR_TEX);
        room.setCeiling(0, 0, 2048.0f, FLOOR_TEX);

        WallFit fit = room.placeWall(0, 0, Direction::North, WALL_TEX);
        REQUIRE(fit.fits());
        CHECK(fit.heights[WALL_TOP_LEFT] == doctest::Approx(2048.0f));
        CHECK(room.getSector(0, 0)->walls(Direction::North).size() == 1);
        CHECK(room.getBounds().max.y == doctest::Approx(2048.0f));

        WallFit again = room.placeWall(0, 0, Direction::North, WALL_TEX);
        CHECK(again.status == WallFitStatus::NoGap);
        CHECK(room.getSector(0, 0)->walls(Direction::North).size() == 1);
    }

    TEST_CASE("placeWall on a new cell uses the fallback heights") {
        Room room(0, glm::vec3(0.0f), 1, 1);
        WallFit fit = room.placeWall(2, 0, Direction::South, WALL_TEX);
        REQUIRE(fit.fits());
        CHECK(room.width() == 3);
        CHECK(fit.heights[WALL_BOTTOM_LEFT] == doctest::Approx(0.0f));
        CHECK(fit.heights[WALL_TOP_RIGHT] == doctest::Approx(DEFAULT_CEILING_HEIGHT));
    }

    TEST_CASE("enclose closes every open edge once") {
        Room room(0, glm::vec3(0.0f), 2, 1);
        room.setFloor(0, 0, 0.0f, FLOOR_TEX);
        room.setFloor(1, 0, 0.0f, FLOOR_TEX);
        room.setCeiling(0, 0, 1024.0f, FLOOR_TEX);

        CHECK(room.encloseOpenEdges(WALL_TEX) == 6);

        const Sector* west = room.getSector(0, 0);
        CHECK(west->walls(Direction::East).empty());
        CHECK(west->walls(Direction::West).size() == 1);
        CHECK(west->walls(Direction::North)[0].yTop() == doctest::Approx(1024.0f));

        const Sector* east = room.getSector(1, 0);
        CHECK(east->walls(Direction::West).empty());
        CHECK(east->walls(Direction::East)[0].yTop() == doctest::Approx(DEFAULT_CEILING_HEIGHT));

        CHECK(room.encloseOpenEdges(WALL_TEX) == 0);
    }

    TEST_CASE("extrudeFloor raises the floor and refreshes bounds") {
        Room room(0, glm::vec3(0.0f), 1, 1);
        room.setFloor(0, 0, 0.0f, FLOOR_TEX);
        room.recalculateBounds();

        CHECK(room.extrudeFloor(0, 0, 512.0f, WALL_TEX));
        CHECK(floorHeightAt(room, 0, 0) == doctest::Approx(512.0f));
        CHECK(room.getSector(0, 0)->wallCount() == 4);
        CHECK(room.getBounds().max.y == doctest::Approx(512.0f));

        CHECK_FALSE(room.extrudeFloor(4, 4, 512.0f, WALL_TEX));
    }
}
