#pragma once
#include "core/Direction.h"
#include <raylib.h>

namespace pm2d {

// State shared by the player and the ghosts. position is the bottom-left corner
// of the actor's bounding box in board pixels; tile is only refreshed while the
// actor sits on a cell's pixel position.
struct Actor {
    Tile tile{};
    Vector2 position{};
    Vector2 velocity{};
    Direction direction{Direction::None};
    Direction facing{Direction::Right};
    bool moving{false};
    int frame{0};
    float frameTimer{0.0f};
    float size{24.0f};

    Rectangle bounds() const { return Rectangle{position.x, position.y, size, size}; }
};

struct Player : Actor {
    Direction buffered{Direction::None};
    bool hasMoved{false};
    bool dying{false};
};

} // namespace pm2d
