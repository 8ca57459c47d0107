#pragma once
#include "games/Game.h"
#include "controllers/GameController.h"
#include "controllers/RandomSource.h"
#include "core/GameSettings.h"
#include "session/SessionState.h"
#include <raylib.h>
#include <memory>
#include <string>

namespace pm2d::games {

// raylib front end: polls the keyboard, steps the GameController and draws
// read-only snapshots of the board.
class PacMan final : public Game {
public:
    explicit PacMan(SessionState& session) : session_(session) {}
    ~PacMan() override = default;

    const char* id() const override { return "pac-man"; }
    const char* name() const override { return "Pac-Man"; }

    void init(int width, int height) override;
    void update(float dt, int width, int height, bool acceptInput) override;
    void render(int width, int height) override;
    void unload() override;
    void onResize(int width, int height) override;

    bool ready() const { return controller_ != nullptr; }
    const std::string& loadError() const { return loadError_; }

private:
    Direction pollDirection() const;
    Rectangle toScreen(Vector2 boardPos, float size) const;

    void drawBoard() const;
    void drawPlayer() const;
    void drawGhosts() const;
    void drawHud() const;

    SessionState& session_;
    GameSettings settings_{};
    RaylibRandom rng_{};
    std::unique_ptr<GameController> controller_{};
    std::string loadError_{};

    int width_{0};
    int height_{0};
};

} // namespace pm2d::games
