#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "controllers/PlayerController.h"
#include "pm2d_test_helpers.h"

using Catch::Approx;
using pm2d::Direction;
using pm2d::DotKind;
using pm2d::Player;
using pm2d::PlayerController;
using pm2d::Tile;

namespace {
Player playerOn(const pm2d::Stage& stage) {
    Player p;
    p.tile = stage.playerTile;
    p.position = stage.playerSpawn;
    p.size = stage.grid.cellSize();
    return p;
}

// One cell of travel per update at 180 px/s.
constexpr float kCellStep = 0.2f;
}

TEST_CASE("Player eats dots along the corridor and stops at the wall", "[player]") {
    auto stage = pm2d::testing::corridorStage();
    Player player = playerOn(stage);
    PlayerController pc(player, stage.grid, 180.0f);

    REQUIRE_FALSE(player.hasMoved);
    pc.handleInput(Direction::Right);
    REQUIRE(player.hasMoved);

    auto first = pc.update(0.0f);
    REQUIRE(first.onTile);
    REQUIRE_FALSE(first.dotConsumed.has_value());
    REQUIRE(player.direction == Direction::Right);

    int points = 0;
    for (int col = 2; col <= 7; ++col) {
        auto r = pc.update(kCellStep);
        REQUIRE(player.tile == Tile{col, 4});
        REQUIRE(r.dotConsumed == std::optional<DotKind>(DotKind::Regular));
        REQUIRE(r.points == pm2d::kDotPoints);
        REQUIRE(std::holds_alternative<std::monostate>(stage.grid.get(col, 4)));
        points += r.points;
    }
    REQUIRE(points == 60);

    auto power = pc.update(kCellStep);
    REQUIRE(player.tile == Tile{8, 4});
    REQUIRE(power.dotConsumed == std::optional<DotKind>(DotKind::PowerUp));
    REQUIRE(power.points == pm2d::kPowerUpPoints);
    REQUIRE(player.direction == Direction::None);
    REQUIRE_FALSE(player.moving);
    REQUIRE(stage.grid.dotCount() == 0);

    auto idle = pc.update(kCellStep);
    REQUIRE(player.position.x == Approx(8 * 24.0f));
    REQUIRE_FALSE(idle.dotConsumed.has_value());
}

TEST_CASE("A blocked direction is ignored while the player stands still", "[player]") {
    auto stage = pm2d::testing::corridorStage();
    Player player = playerOn(stage);
    PlayerController pc(player, stage.grid, 180.0f);

    pc.handleInput(Direction::Up);
    pc.update(kCellStep);
    REQUIRE(player.direction == Direction::None);
    REQUIRE(player.position.y == Approx(stage.playerSpawn.y));

    pc.handleInput(Direction::None);
    REQUIRE(player.buffered == Direction::Up);
}

TEST_CASE("A buffered turn is taken at the first open cell", "[player]") {
    auto stage = pm2d::testing::compileOrThrow({
        "BBBBB",
        "BpFFB",
        "BBBFB",
        "BBBBB",
    }, pm2d::testing::fixtureOptions(5, 4));
    Player player = playerOn(stage);
    PlayerController pc(player, stage.grid, 180.0f);

    pc.handleInput(Direction::Right);
    pc.update(0.0f);
    pc.handleInput(Direction::Down);

    pc.update(kCellStep);
    REQUIRE(player.tile == Tile{2, 2});
    REQUIRE(player.direction == Direction::Right);

    pc.update(kCellStep);
    REQUIRE(player.tile == Tile{3, 2});
    REQUIRE(player.direction == Direction::Down);
    REQUIRE(player.facing == Direction::Down);

    auto last = pc.update(kCellStep);
    REQUIRE(player.tile == Tile{3, 1});
    REQUIRE(last.dotConsumed.has_value());
    REQUIRE(player.direction == Direction::None);
    REQUIRE(stage.grid.dotCount() == 0);
}

TEST_CASE("Walking frames advance while the player moves", "[player][animation]") {
    auto stage = pm2d::testing::corridorStage();
    Player player = playerOn(stage);
    PlayerController pc(player, stage.grid, 180.0f);

    pc.handleInput(Direction::Right);
    pc.update(0.0f);
    pc.update(0.1f);
    REQUIRE(player.frame == 1);

    pc.stop();
    REQUIRE_FALSE(player.moving);
}
