#pragma once
#include "core/Direction.h"
#include <raylib.h>

namespace pm2d {

enum class GhostType { Blinky, Pinky, Inky, Clyde };

enum class TargetStrategy {
    Direct,        // player's tile
    Ambush,        // two tiles ahead of the player's facing
    Jitter,        // player's tile nudged by -1..1 on each axis
    ShyOfPlayer    // player's tile, or the top-left corner when within kShyDistance
};

struct GhostTraits {
    const char* name;
    float activationDelay;
    Direction initialDirection;
    float errorChance;
    TargetStrategy strategy;
    Color color;
};

inline constexpr int kShyDistance = 8;
inline constexpr int kAmbushLead = 2;

const GhostTraits& traitsOf(GhostType type) noexcept;
const char* to_string(GhostType type) noexcept;

} // namespace pm2d
