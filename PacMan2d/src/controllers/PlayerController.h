#pragma once
#include "actors/Actor.h"
#include "stage/Grid.h"
#include <optional>

namespace pm2d {

// What happened when the player settled on a cell this frame.
struct TileEntryResult {
    bool onTile{false};
    std::optional<DotKind> dotConsumed{};
    int points{0};
};

inline constexpr int kDotPoints = 10;
inline constexpr int kPowerUpPoints = 50;
inline constexpr int kPlayerWalkFrames = 4;
inline constexpr float kWalkFrameSeconds = 0.06f;

class PlayerController {
public:
    PlayerController(Player& player, Grid& grid, float speed);

    // Most recent direction key this frame, or None when nothing was pressed.
    void handleInput(Direction mostRecent);

    TileEntryResult update(float dt);

    void stop();

private:
    void applyBufferedWhenStopped();
    TileEntryResult enterTile(Tile tile);

    Player& player_;
    Grid& grid_;
    float speed_;
};

} // namespace pm2d
