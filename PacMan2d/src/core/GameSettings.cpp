#include "core/GameSettings.h"
#include "services/configuration/ConfigurationManager.h"
#include <algorithm>

namespace pm2d {

GameSettings GameSettings::fromConfiguration() {
    GameSettings s;
    s.cols = static_cast<int>(ConfigurationManager::getInt("stage::cols", s.cols));
    s.rows = static_cast<int>(ConfigurationManager::getInt("stage::rows", s.rows));
    s.cellSize = static_cast<float>(ConfigurationManager::getDouble("stage::cell_size", s.cellSize));
    s.origin.x = static_cast<float>(ConfigurationManager::getDouble("stage::origin_x", s.origin.x));
    s.origin.y = static_cast<float>(ConfigurationManager::getDouble("stage::origin_y", s.origin.y));
    s.stagePath = ConfigurationManager::getString("stage::path", s.stagePath);

    s.playerSpeed = static_cast<float>(ConfigurationManager::getDouble("gameplay::player_speed", s.playerSpeed));
    s.ghostSpeed = static_cast<float>(ConfigurationManager::getDouble("gameplay::ghost_speed", s.ghostSpeed));
    s.frightenedSeconds = static_cast<float>(ConfigurationManager::getDouble("gameplay::frightened_seconds", s.frightenedSeconds));
    s.startingLives = static_cast<int>(ConfigurationManager::getInt("gameplay::starting_lives", s.startingLives));
    s.extraLifeScore = static_cast<int>(ConfigurationManager::getInt("gameplay::extra_life_score", s.extraLifeScore));

    s.cols = std::max(s.cols, 1);
    s.rows = std::max(s.rows, 1);
    s.cellSize = std::max(s.cellSize, 1.0f);
    s.startingLives = std::max(s.startingLives, 1);
    return s;
}

} // namespace pm2d
