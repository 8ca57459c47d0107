#include "actors/Ghost.h"

namespace pm2d {

Ghost makeGhost(GhostType type, Tile tile, Vector2 position, float size) {
    Ghost g;
    g.type = type;
    g.tile = tile;
    g.position = position;
    g.startTile = tile;
    g.startPosition = position;
    g.size = size;
    g.facing = traitsOf(type).initialDirection;
    return g;
}

} // namespace pm2d
