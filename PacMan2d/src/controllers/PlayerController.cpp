#include "controllers/PlayerController.h"
#include "controllers/Movement.h"

namespace pm2d {

PlayerController::PlayerController(Player& player, Grid& grid, float speed)
    : player_(player), grid_(grid), speed_(speed) {}

void PlayerController::handleInput(Direction mostRecent) {
    if (mostRecent == Direction::None) return;
    player_.buffered = mostRecent;
    player_.hasMoved = true;
}

void PlayerController::stop() {
    movement::stop(player_);
}

void PlayerController::applyBufferedWhenStopped() {
    if (player_.direction != Direction::None || player_.buffered == Direction::None) return;
    if (!movement::isBlocked(grid_, player_.tile, player_.buffered)) {
        movement::commit(player_, player_.buffered, speed_);
    }
}

TileEntryResult PlayerController::update(float dt) {
    movement::advance(player_, grid_, dt);
    movement::wrapAround(player_, grid_);
    applyBufferedWhenStopped();

    TileEntryResult result;
    if (auto tile = movement::alignToTile(player_, grid_)) {
        result = enterTile(*tile);
    }
    movement::animate(player_, dt, kPlayerWalkFrames, kWalkFrameSeconds, false);
    return result;
}

TileEntryResult PlayerController::enterTile(Tile tile) {
    TileEntryResult result;
    result.onTile = true;

    if (const auto* dot = std::get_if<DotCell>(&grid_.get(tile))) {
        result.dotConsumed = dot->kind;
        result.points = dot->kind == DotKind::PowerUp ? kPowerUpPoints : kDotPoints;
        grid_.clear(tile.col, tile.row);
    }

    const Direction wanted = player_.buffered;
    if (wanted != Direction::None && wanted != player_.direction && !movement::isBlocked(grid_, tile, wanted)) {
        movement::commit(player_, wanted, speed_);
    }
    if (player_.direction != Direction::None && movement::isBlocked(grid_, tile, player_.direction)) {
        movement::stop(player_);
    }
    return result;
}

} // namespace pm2d
