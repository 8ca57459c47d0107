#pragma once
#include <raylib.h>
#include <string>

namespace pm2d {

// Snapshot of the tunables the gameplay core consumes. The core never reads the
// configuration store directly; the front end builds one of these at startup.
struct GameSettings {
    int cols{28};
    int rows{31};
    float cellSize{24.0f};
    Vector2 origin{0.0f, 48.0f};

    float playerSpeed{180.0f};
    float ghostSpeed{180.0f};
    float frightenedSeconds{10.0f};
    int startingLives{3};
    int extraLifeScore{10000};

    std::string stagePath{"assets/stages/classic.json"};

    static GameSettings fromConfiguration();
};

} // namespace pm2d
