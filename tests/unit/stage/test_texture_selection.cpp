#include <catch2/catch_test_macros.hpp>

#include "stage/Adjacency.h"
#include "stage/Barrier.h"
#include "stage/TextureSelector.h"
#include "pm2d_test_helpers.h"

using pm2d::AdjacencyInfo;
using pm2d::BarrierKind;
using pm2d::Neighbour;
using pm2d::TextureTag;
using pm2d::Tile;

namespace {
constexpr Neighbour kBorder{true, BarrierKind::Border};
constexpr Neighbour kStructure{true, BarrierKind::Structure};
constexpr Neighbour kNone{};

AdjacencyInfo surrounded(Neighbour n = kBorder) {
    return AdjacencyInfo{n, n, n, n, n, n, n, n};
}

TextureTag tagAt(const pm2d::Grid& grid, int col, int row) {
    const auto* b = std::get_if<pm2d::BarrierCell>(&grid.get(col, row));
    return b ? b->tag : TextureTag::Default;
}
}

TEST_CASE("Horizontal border run on the bottom edge gets straight middle and arc ends", "[stage][texture]") {
    // Row 0 is the map edge below; open space above and at both ends.
    auto stage = pm2d::testing::compileOrThrow({
        "       ",
        "   p   ",
        " BBBBB ",
    }, pm2d::testing::fixtureOptions(7, 3));
    const auto& grid = stage.grid;

    REQUIRE(tagAt(grid, 1, 0) == TextureTag::OuterArcBottomRight);
    REQUIRE(tagAt(grid, 2, 0) == TextureTag::StraightHorizontalDown);
    REQUIRE(tagAt(grid, 3, 0) == TextureTag::StraightHorizontalDown);
    REQUIRE(tagAt(grid, 4, 0) == TextureTag::StraightHorizontalDown);
    REQUIRE(tagAt(grid, 5, 0) == TextureTag::OuterArcBottomLeft);
    REQUIRE(std::holds_alternative<std::monostate>(grid.get(0, 0)));
    REQUIRE(std::holds_alternative<std::monostate>(grid.get(6, 0)));
}

TEST_CASE("A one-cell-thick wall away from the edge stays unrendered", "[stage][texture]") {
    auto stage = pm2d::testing::compileOrThrow({
        "       ",
        " SSSSS ",
        "   p   ",
    }, pm2d::testing::fixtureOptions(7, 3));
    for (int col = 1; col <= 5; ++col) {
        REQUIRE(std::holds_alternative<std::monostate>(stage.grid.get(col, 1)));
    }
}

TEST_CASE("Map edge cells see synthetic border neighbours", "[stage][adjacency]") {
    pm2d::BarrierPoints none;
    auto a = pm2d::computeAdjacency(Tile{0, 0}, none, 3, 3);
    REQUIRE(a.left.present);
    REQUIRE(a.leftTop.present);
    REQUIRE(a.leftBottom.present);
    REQUIRE(a.bottom.present);
    REQUIRE(a.rightBottom.present);
    REQUIRE(a.left.kind == BarrierKind::Border);
    REQUIRE_FALSE(a.right.present);
    REQUIRE_FALSE(a.top.present);
    REQUIRE_FALSE(a.rightTop.present);

    pm2d::BarrierPoints points{{Tile{1, 1}, BarrierKind::Structure}};
    auto centre = pm2d::computeAdjacency(Tile{1, 2}, points, 3, 3);
    REQUIRE(centre.bottom.present);
    REQUIRE(centre.bottom.kind == BarrierKind::Structure);
    REQUIRE(centre.top.present); // top edge
}

TEST_CASE("Inner arcs name the missing diagonal", "[stage][texture]") {
    AdjacencyInfo a = surrounded();
    a.rightBottom = kNone;
    REQUIRE(pm2d::selectTexture(a, BarrierKind::Structure) == TextureTag::InsideArcTopLeft);

    a = surrounded();
    a.rightTop = kNone;
    REQUIRE(pm2d::selectTexture(a, BarrierKind::Interior) == TextureTag::InsideArcBottomLeft);

    a = surrounded();
    a.leftBottom = kNone;
    REQUIRE(pm2d::selectTexture(a, BarrierKind::Structure) == TextureTag::InsideArcTopRight);

    a = surrounded();
    a.leftTop = kNone;
    REQUIRE(pm2d::selectTexture(a, BarrierKind::Structure) == TextureTag::InsideArcBottomRight);
}

TEST_CASE("Border cells touching a structure pick connector tags", "[stage][texture]") {
    AdjacencyInfo a = surrounded();
    a.right = kStructure;
    a.rightBottom = kNone;
    REQUIRE(pm2d::selectTexture(a, BarrierKind::Border) == TextureTag::BorderVerticalLeftTopConnector);
    // Same neighbourhood on a structure keeps the inner arc.
    REQUIRE(pm2d::selectTexture(a, BarrierKind::Structure) == TextureTag::InsideArcTopLeft);

    a = surrounded();
    a.bottom = kStructure;
    a.leftBottom = kNone;
    REQUIRE(pm2d::selectTexture(a, BarrierKind::Border) == TextureTag::BorderHorizontalRightTopConnector);
}

TEST_CASE("Fully surrounded border next to a structure becomes a single line", "[stage][texture]") {
    AdjacencyInfo a = surrounded();
    a.left = kStructure;
    REQUIRE(pm2d::selectTexture(a, BarrierKind::Border) == TextureTag::BorderSingleLineVerticalRight);

    a = surrounded();
    a.top = kStructure;
    REQUIRE(pm2d::selectTexture(a, BarrierKind::Border) == TextureTag::BorderSingleLineHorizontalDown);

    REQUIRE(pm2d::selectTexture(surrounded(), BarrierKind::Border) == TextureTag::Default);
    REQUIRE(pm2d::selectTexture(surrounded(kStructure), BarrierKind::Interior) == TextureTag::Default);
    REQUIRE(pm2d::selectTexture(AdjacencyInfo{}, BarrierKind::Border) == TextureTag::Default);
}

TEST_CASE("Only border barriers accept border connector tags", "[stage][barrier]") {
    REQUIRE(pm2d::makeBarrier(BarrierKind::Border, TextureTag::BorderVerticalLeftTopConnector).has_value());
    REQUIRE_FALSE(pm2d::makeBarrier(BarrierKind::Structure, TextureTag::BorderVerticalLeftTopConnector).has_value());
    REQUIRE_FALSE(pm2d::makeBarrier(BarrierKind::Door, TextureTag::BorderSingleLineHorizontalUp).has_value());
    REQUIRE_FALSE(pm2d::makeBarrier(BarrierKind::Interior, TextureTag::BorderHorizontalLeftTopConnector).has_value());

    auto door = pm2d::makeBarrier(BarrierKind::Door, TextureTag::StraightHorizontalDown);
    REQUIRE(door.has_value());
    REQUIRE(pm2d::sameColor(door->color, door->originalColor));
    REQUIRE_FALSE(pm2d::sameColor(door->color, pm2d::barrierColor(BarrierKind::Structure)));
}
