// PacMan2d.cpp : Defines the entry point for the application.
//

#include "raylib.h"
#include "games/PacMan.h"
#include "session/SessionState.h"
#include "services/configuration/ConfigurationManager.h"
#include "services/configuration/paths.h"
#include "services/logger/LogManager.h"
#include <algorithm>
#include <filesystem>
#include <string>

int main()
{
    pm2d::logging::LogManager::init({"PacMan2d", pm2d::logging::Level::info, "[%H:%M:%S] [%^%l%$] %v"});
    pm2d::logging::LogManager::info("Starting PacMan2d");

    if (!pm2d::ConfigurationManager::load()) {
        pm2d::logging::LogManager::warn("Configuration file missing or invalid; using defaults");
        std::error_code ec;
        if (!std::filesystem::exists(pm2d::paths::configFilePath(), ec)) {
            if (pm2d::ConfigurationManager::save()) {
                pm2d::logging::LogManager::info("Wrote default configuration to '{}'", pm2d::paths::configFilePath());
            }
        }
    }

    std::string levelName = pm2d::ConfigurationManager::getString("logging::level", "info");
    if (auto level = pm2d::logging::level_from_string(levelName)) {
        pm2d::logging::LogManager::reconfigure({"PacMan2d", *level, "[%H:%M:%S] [%^%l%$] %v"});
    } else {
        pm2d::logging::LogManager::warn("Unknown logging level '{}', keeping info", levelName);
    }

    constexpr int kDefaultWidth = 672;
    constexpr int kDefaultHeight = 864;
    int width = static_cast<int>(pm2d::ConfigurationManager::getInt("window::width", kDefaultWidth));
    int height = static_cast<int>(pm2d::ConfigurationManager::getInt("window::height", kDefaultHeight));
    int fps = static_cast<int>(pm2d::ConfigurationManager::getInt("window::target_fps", 60));
    std::string title = pm2d::ConfigurationManager::getString("window::title", "Pac-Man");
    width = std::max(width, 320);
    height = std::max(height, 240);

    SetConfigFlags(FLAG_VSYNC_HINT);
    InitWindow(width, height, title.c_str());
    SetTargetFPS(std::max(fps, 1));

    pm2d::SessionState session;
    pm2d::games::PacMan game(session);
    game.init(width, height);
    if (!game.ready()) {
        pm2d::logging::LogManager::error("Stage failed to load: {}", game.loadError());
    }

    while (!WindowShouldClose())
    {
        game.update(GetFrameTime(), GetScreenWidth(), GetScreenHeight(), true);

        BeginDrawing();
        game.render(GetScreenWidth(), GetScreenHeight());
        EndDrawing();
    }

    game.unload();
    CloseWindow();
    pm2d::logging::LogManager::info("PacMan2d exiting, high score {}", session.highScore);
    pm2d::logging::LogManager::shutdown();
    return 0;
}
