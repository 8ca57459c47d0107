#pragma once
#include "actors/Ghost.h"
#include "controllers/RandomSource.h"
#include "stage/Grid.h"
#include <vector>

namespace pm2d {

inline constexpr float kGhostSubStep = 1.0f / 60.0f;
inline constexpr float kBlinkThresholdSeconds = 3.0f;
inline constexpr float kBlinkIntervalSeconds = 0.3f;
inline constexpr int kGhostWalkFrames = 2;
inline constexpr float kGhostWalkFrameSeconds = 0.06f;

class GhostController {
public:
    GhostController(Ghost& ghost, Grid& grid, const Player& player, RandomSource& rng, float speed);

    // Frightened countdown, activation countdown, then fixed sub-steps of
    // movement with a decision on every cell the ghost lands on.
    void update(float dt);

    void frighten(float seconds);
    void clearFrightened();
    // Restarts the activation delay from zero; the ghost holds still until it elapses.
    void resetActivation();

    // Decision engine: picks and commits the next direction from the given cell.
    Direction decide(Tile from);

    // Where the ghost is heading when it is not frightened.
    Tile targetTile();

    Ghost& ghost() { return ghost_; }
    const Ghost& ghost() const { return ghost_; }

private:
    void tickFrightened(float dt);
    bool tickActivation(float dt);
    std::vector<Direction> candidateDirections(Tile from) const;
    Direction pickRandom(const std::vector<Direction>& options);
    Direction pickTowards(Tile from, Tile target, const std::vector<Direction>& options);

    Ghost& ghost_;
    Grid& grid_;
    const Player& player_;
    RandomSource& rng_;
    float speed_;
};

} // namespace pm2d
