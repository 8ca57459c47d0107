#pragma once
#include "controllers/GameController.h"
#include "pm2d_test_helpers.h"

namespace pm2d::testing {

// GameController wired to a scripted random source; the controller is not movable
// so the fixture builds it in place.
struct GameFixture {
    explicit GameFixture(Stage stage, GameSettings settings = corridorSettings())
        : game(std::move(stage), std::move(settings), session, rng) {}
    GameFixture() : GameFixture(corridorStage()) {}

    SessionState session{};
    ScriptedRandom rng{};
    GameController game;

    // Parks a ghost on the player so the next update resolves the contact.
    Ghost& touchPlayer(std::size_t index) {
        Ghost& g = game.ghosts()[index];
        g.position = game.player().position;
        return g;
    }

    // Sets the player walking right and advances one cell per call after the first.
    void walkRight(int cells) {
        game.handleInput(Direction::Right);
        game.update(0.0f);
        for (int i = 0; i < cells; ++i) game.update(0.2f);
    }
};

} // namespace pm2d::testing
