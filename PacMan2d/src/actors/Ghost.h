#pragma once
#include "actors/Actor.h"
#include "actors/GhostType.h"

namespace pm2d {

struct Ghost : Actor {
    GhostType type{GhostType::Blinky};
    Tile startTile{};
    Vector2 startPosition{};

    bool activated{false};
    float activationTimer{0.0f};

    bool frightened{false};
    float frightenedTimer{0.0f};
    bool blinking{false};
    int blinkFrame{1};
    float blinkTimer{0.0f};

    bool eaten{false};

    const GhostTraits& traits() const { return traitsOf(type); }
};

// Fresh ghost parked on its spawn, not yet activated.
Ghost makeGhost(GhostType type, Tile tile, Vector2 position, float size);

} // namespace pm2d
