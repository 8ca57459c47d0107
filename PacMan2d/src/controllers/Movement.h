#pragma once
#include "actors/Actor.h"
#include "stage/Grid.h"
#include <optional>

namespace pm2d::movement {

// Moves the actor by velocity * dt. Travel along the moving axis stops on the
// next cell position it would otherwise pass, so tile entry is never skipped.
void advance(Actor& actor, const Grid& grid, float dt);

// Tunnel wrap: once the bounding box has fully left one side of the world the
// actor reappears just outside the opposite side. Returns true on a teleport.
bool wrapAround(Actor& actor, const Grid& grid);

// On a match (1 px tolerance) snaps the actor onto the cell and updates its tile.
std::optional<Tile> alignToTile(Actor& actor, const Grid& grid);

// Barrier in the neighbouring cell. Cells outside the board never block.
bool isBlocked(const Grid& grid, Tile from, Direction d);

void commit(Actor& actor, Direction d, float speed);
void stop(Actor& actor);

// Cycles the walking frame every interval while moving.
void animate(Actor& actor, float dt, int frameCount, float interval, bool resetWhenIdle);

} // namespace pm2d::movement
