// Tests for VerticalFace and WallStack

#include <doctest/doctest.h>
#include "world/VerticalFace.h"
#include "world/WallStack.h"

using namespace sectorforge;

TEST_SUITE("VerticalFace") {
    TEST_CASE("level wall from bottom and top") {
        VerticalFace wall(256.0f, 1024.0f, TextureRef("pack", "WALL"));
        CHECK(wall.heights[WALL_BOTTOM_LEFT] == doctest::Approx(256.0f));
        CHECK(wall.heights[WALL_BOTTOM_RIGHT] == doctest::Approx(256.0f));
        CHECK(wall.heights[WALL_TOP_RIGHT] == doctest::Approx(1024.0f));
        CHECK(wall.heights[WALL_TOP_LEFT] == doctest::Approx(1024.0f));
        CHECK(wall.yBottom() == doctest::Approx(256.0f));
        CHECK(wall.yTop() == doctest::Approx(1024.0f));
        CHECK(wall.height() == doctest::Approx(768.0f));
        CHECK(wall.isFlat());
    }

    TEST_CASE("defaults") {
        VerticalFace wall;
        CHECK(wall.solid);
        CHECK(wall.blackTransparent);
        CHECK(wall.blendMode == BlendMode::Opaque);
        CHECK(wall.normalMode == FaceNormalMode::Front);
        CHECK(wall.uvProjection == UvProjection::Default);
        CHECK(wall.hasUniformColor());
        CHECK_FALSE(wall.uv.has_value());
    }

    TEST_CASE("sloped wall averages and extremes") {
        VerticalFace wall = VerticalFace::fromHeights({0.0f, 512.0f, 2048.0f, 1024.0f}, TextureRef());
        CHECK(wall.yBottom() == doctest::Approx(256.0f));
        CHECK(wall.yTop() == doctest::Approx(1536.0f));
        CHECK(wall.yMin() == doctest::Approx(0.0f));
        CHECK(wall.yMax() == doctest::Approx(2048.0f));
        CHECK_FALSE(wall.isFlat());
    }

    TEST_CASE("coverage per vertical side") {
        VerticalFace wall = VerticalFace::fromHeights({0.0f, 512.0f, 2048.0f, 1024.0f}, TextureRef());
        auto left = wall.leftCoverage();
        auto right = wall.rightCoverage();
        CHECK(left.first == doctest::Approx(0.0f));
        CHECK(left.second == doctest::Approx(1024.0f));
        CHECK(right.first == doctest::Approx(512.0f));
        CHECK(right.second == doctest::Approx(2048.0f));
    }

    TEST_CASE("triangular wall has a collapsed side") {
        VerticalFace wall = VerticalFace::fromHeights({0.0f, 512.0f, 512.0f, 512.0f}, TextureRef());
        auto right = wall.rightCoverage();
        CHECK(right.first == doctest::Approx(right.second));
        CHECK_FALSE(wall.isFlat());
    }

    TEST_CASE("uv projection names") {
        CHECK(parseUvProjection("projected") == UvProjection::Projected);
        CHECK(parseUvProjection(uvProjectionName(UvProjection::Default)) == UvProjection::Default);
        CHECK_FALSE(parseUvProjection("planar").has_value());
    }
}

TEST_SUITE("WallStack") {
    TEST_CASE("holds at most three walls") {
        WallStack stack;
        CHECK(stack.empty());
        CHECK(WallStack::capacity() == 3);

        CHECK(stack.push(VerticalFace(0.0f, 256.0f, TextureRef())));
        CHECK(stack.push(VerticalFace(512.0f, 768.0f, TextureRef())));
        CHECK(stack.push(VerticalFace(1024.0f, 1280.0f, TextureRef())));
        CHECK(stack.full());

        CHECK_FALSE(stack.push(VerticalFace(2048.0f, 3072.0f, TextureRef())));
        CHECK(stack.size() == 3);
        CHECK(stack[2].yBottom() == doctest::Approx(1024.0f));
    }

    TEST_CASE("erase shifts later walls down") {
        WallStack stack;
        stack.push(VerticalFace(0.0f, 256.0f, TextureRef()));
        stack.push(VerticalFace(512.0f, 768.0f, TextureRef()));
        stack.push(VerticalFace(1024.0f, 1280.0f, TextureRef()));

        CHECK(stack.erase(0));
        CHECK(stack.size() == 2);
        CHECK(stack[0].yBottom() == doctest::Approx(512.0f));
        CHECK(stack[1].yBottom() == doctest::Approx(1024.0f));

        CHECK_FALSE(stack.erase(5));
        CHECK(stack.at(2) == nullptr);
    }

    TEST_CASE("sorted by bottom ignores insertion order") {
        WallStack stack;
        stack.push(VerticalFace(1024.0f, 1280.0f, TextureRef()));
        stack.push(VerticalFace(0.0f, 256.0f, TextureRef()));
        stack.push(VerticalFace(512.0f, 768.0f, TextureRef()));

        auto order = stack.sortedByBottom();
        CHECK(order[0] == 1);
        CHECK(order[1] == 2);
        CHECK(order[2] == 0);
        CHECK(stack.lowestIndex() == 1);
    }

    TEST_CASE("occupied extent") {
        WallStack stack;
        CHECK_FALSE(stack.maxHeight().has_value());
        CHECK_FALSE(stack.minHeight().has_value());

        stack.push(VerticalFace(512.0f, 768.0f, TextureRef()));
        stack.push(VerticalFace::fromHeights({0.0f, 256.0f, 300.0f, 400.0f}, TextureRef()));
        CHECK(*stack.maxHeight() == doctest::Approx(768.0f));
        CHECK(*stack.minHeight() == doctest::Approx(0.0f));
    }

    TEST_CASE("clear empties the stack") {
        WallStack stack;
        stack.push(VerticalFace(0.0f, 256.0f, TextureRef()));
        stack.clear();
        CHECK(stack.empty());
        CHECK(stack.begin() == stack.end());
    }
}
