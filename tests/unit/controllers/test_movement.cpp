#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "controllers/Movement.h"

using Catch::Approx;
using pm2d::Actor;
using pm2d::Direction;
using pm2d::Grid;
using pm2d::Tile;
namespace movement = pm2d::movement;

namespace {
// 10x6 board lifted 48px for the HUD: world spans x [0, 240), y up to 192.
Grid hudBoard() { return Grid(10, 6, 24.0f, Vector2{0.0f, 48.0f}); }

Actor actorAt(Vector2 pos) {
    Actor a;
    a.position = pos;
    a.size = 24.0f;
    return a;
}
}

TEST_CASE("Actors leaving one side reappear on the opposite side", "[movement][wrap]") {
    Grid grid = hudBoard();

    Actor left = actorAt(Vector2{-24.0f, 96.0f});
    REQUIRE(movement::wrapAround(left, grid));
    REQUIRE(left.position.x == Approx(240.0f));
    REQUIRE(left.position.y == Approx(96.0f));

    Actor right = actorAt(Vector2{240.0f, 96.0f});
    REQUIRE(movement::wrapAround(right, grid));
    REQUIRE(right.position.x == Approx(-24.0f));

    Actor below = actorAt(Vector2{48.0f, -24.0f});
    REQUIRE(movement::wrapAround(below, grid));
    REQUIRE(below.position.y == Approx(192.0f));

    Actor above = actorAt(Vector2{48.0f, 192.0f});
    REQUIRE(movement::wrapAround(above, grid));
    REQUIRE(above.position.y == Approx(-24.0f));
}

TEST_CASE("Partially visible actors do not wrap", "[movement][wrap]") {
    Grid grid = hudBoard();
    Actor a = actorAt(Vector2{-23.0f, 96.0f});
    REQUIRE_FALSE(movement::wrapAround(a, grid));
    REQUIRE(a.position.x == Approx(-23.0f));

    Actor b = actorAt(Vector2{239.0f, 96.0f});
    REQUIRE_FALSE(movement::wrapAround(b, grid));
}

TEST_CASE("Alignment snaps onto the cell and refreshes the tile", "[movement]") {
    Grid grid = hudBoard();
    Actor a = actorAt(Vector2{24.5f, 95.5f});
    auto tile = movement::alignToTile(a, grid);
    REQUIRE(tile.has_value());
    REQUIRE(*tile == Tile{1, 2});
    REQUIRE(a.tile == Tile{1, 2});
    REQUIRE(a.position.x == Approx(24.0f));
    REQUIRE(a.position.y == Approx(96.0f));

    Actor between = actorAt(Vector2{30.0f, 96.0f});
    between.tile = Tile{1, 2};
    REQUIRE_FALSE(movement::alignToTile(between, grid).has_value());
    REQUIRE(between.position.x == Approx(30.0f));
}

TEST_CASE("Advancing stops on the next cell instead of skipping it", "[movement]") {
    Grid grid = hudBoard();
    Actor a = actorAt(grid.cellPixelPosition(1, 2));
    movement::commit(a, Direction::Right, 180.0f);

    movement::advance(a, grid, 0.1f);
    REQUIRE(a.position.x == Approx(42.0f));

    movement::advance(a, grid, 0.5f);
    REQUIRE(a.position.x == Approx(48.0f));
    REQUIRE(a.position.y == Approx(96.0f));

    movement::commit(a, Direction::Down, 180.0f);
    movement::advance(a, grid, 1.0f);
    REQUIRE(a.position.y == Approx(72.0f));

    movement::advance(a, grid, 0.0f);
    REQUIRE(a.position.y == Approx(72.0f));
}

TEST_CASE("Actors keep walking across boards with fractional geometry", "[movement]") {
    struct Geometry { float cell; Vector2 origin; };
    const Geometry geometry[] = {
        {24.3f, Vector2{0.0f, 0.0f}},
        {20.0f, Vector2{33.3f, 0.0f}},
        {22.5f, Vector2{0.0f, 48.0f}},
    };

    for (const auto& g : geometry) {
        Grid grid(28, 31, g.cell, g.origin);
        Actor a = actorAt(grid.cellPixelPosition(3, 5));
        a.tile = Tile{3, 5};

        auto walk = [&](Direction d, int frames) {
            movement::commit(a, d, 180.0f);
            for (int i = 0; i < frames; ++i) {
                const float before = a.position.x;
                movement::advance(a, grid, 1.0f / 60.0f);
                movement::alignToTile(a, grid);
                if (d == Direction::Right) REQUIRE(a.position.x > before);
                else REQUIRE(a.position.x < before);
            }
        };

        walk(Direction::Right, 120);
        REQUIRE(a.tile.col >= 13);
        const int farthest = a.tile.col;

        walk(Direction::Left, 60);
        REQUIRE(a.tile.col <= farthest - 5);
        REQUIRE(a.tile.row == 5);
    }
}

TEST_CASE("Only barriers on the board block a step", "[movement]") {
    Grid grid = hudBoard();
    grid.set(2, 2, pm2d::BarrierCell{});
    grid.set(1, 3, pm2d::DotCell{});

    REQUIRE(movement::isBlocked(grid, Tile{1, 2}, Direction::Right));
    REQUIRE_FALSE(movement::isBlocked(grid, Tile{1, 2}, Direction::Left));
    REQUIRE_FALSE(movement::isBlocked(grid, Tile{1, 2}, Direction::Up));
    REQUIRE_FALSE(movement::isBlocked(grid, Tile{1, 2}, Direction::None));
    REQUIRE_FALSE(movement::isBlocked(grid, Tile{9, 2}, Direction::Right));
}

TEST_CASE("Committing and stopping set velocity and facing", "[movement]") {
    Actor a;
    movement::commit(a, Direction::Up, 100.0f);
    REQUIRE(a.velocity.x == Approx(0.0f));
    REQUIRE(a.velocity.y == Approx(100.0f));
    REQUIRE(a.direction == Direction::Up);
    REQUIRE(a.facing == Direction::Up);
    REQUIRE(a.moving);

    movement::stop(a);
    REQUIRE(a.velocity.y == Approx(0.0f));
    REQUIRE(a.direction == Direction::None);
    REQUIRE(a.facing == Direction::Up);
    REQUIRE_FALSE(a.moving);
}

TEST_CASE("Walking frames cycle only while moving", "[movement][animation]") {
    Actor a;
    movement::commit(a, Direction::Left, 100.0f);
    movement::animate(a, 0.25f, 4, 0.1f, false);
    REQUIRE(a.frame == 2);

    movement::animate(a, 0.2f, 4, 0.1f, false);
    REQUIRE(a.frame == 0);

    movement::animate(a, 0.1f, 4, 0.1f, false);
    movement::stop(a);
    movement::animate(a, 0.5f, 4, 0.1f, false);
    REQUIRE(a.frame == 1);

    movement::animate(a, 0.5f, 4, 0.1f, true);
    REQUIRE(a.frame == 0);
}
