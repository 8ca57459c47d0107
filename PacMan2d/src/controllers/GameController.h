#pragma once
#include "actors/Ghost.h"
#include "controllers/GhostController.h"
#include "controllers/PlayerController.h"
#include "controllers/RandomSource.h"
#include "core/GameSettings.h"
#include "session/SessionState.h"
#include "stage/StageCompiler.h"
#include <memory>
#include <vector>

namespace pm2d {

enum class GameMode { Normal, Dying, StageComplete, GameOver };

const char* to_string(GameMode mode) noexcept;

inline constexpr int kFirstGhostPoints = 200;
inline constexpr int kMaxGhostPoints = 1600;
inline constexpr int kDeathFrameCount = 12;
inline constexpr float kDeathFrameSeconds = 0.1f;
inline constexpr float kStageCompleteSeconds = 2.0f;
inline constexpr float kStageFlashSeconds = 0.3f;
inline constexpr Vector2 kOffBoard{-100.0f, -100.0f};

// Owns the compiled stage and every actor, and drives them once per frame.
// Controllers hold references into this object, so it is neither copied nor moved.
class GameController {
public:
    GameController(Stage stage, GameSettings settings, SessionState& session, RandomSource& rng);
    GameController(const GameController&) = delete;
    GameController& operator=(const GameController&) = delete;

    void handleInput(Direction mostRecent);
    void update(float dt);

    // Starts a new run on a freshly compiled copy of the stage.
    void restart();

    GameMode mode() const { return mode_; }
    bool gameOver() const { return mode_ == GameMode::GameOver; }
    int score() const { return score_; }
    int lives() const { return lives_; }
    int level() const { return level_; }
    int ghostPoints() const { return ghostPoints_; }
    bool ghostsActive() const { return ghostsActive_; }
    bool flashOn() const { return flashOn_; }
    const Grid& grid() const { return stage_.grid; }
    const Stage& stage() const { return stage_; }
    const SessionState& session() const { return session_; }

    // Mutable access lets tools and scripted scenarios place actors directly.
    Player& player() { return player_; }
    const Player& player() const { return player_; }
    std::vector<Ghost>& ghosts() { return ghosts_; }
    const std::vector<Ghost>& ghosts() const { return ghosts_; }

private:
    void spawnActors();
    void updateNormal(float dt);
    void updateDying(float dt);
    void updateStageComplete(float dt);

    void applyTileEntry(const TileEntryResult& entry);
    void powerUpEaten();
    void resolveGhostCollisions();
    void eatGhost(std::size_t index);
    void killPlayer();
    void finishDeath();
    void removeGhostsFromBoard();
    void enterStageComplete();
    void setBarrierFlash(bool on);
    void rebuildStage();
    void addScore(int points);

    Stage stage_;
    GameSettings settings_;
    SessionState& session_;
    RandomSource& rng_;

    Player player_{};
    std::vector<Ghost> ghosts_{};
    std::unique_ptr<PlayerController> playerController_{};
    std::vector<GhostController> ghostControllers_{};

    GameMode mode_{GameMode::Normal};
    int score_{0};
    int lives_{3};
    int level_{1};
    int ghostPoints_{kFirstGhostPoints};
    bool ghostsActive_{false};
    bool extraLifeAwarded_{false};

    float deathFrameTimer_{0.0f};
    float stageCompleteTimer_{0.0f};
    float flashTimer_{0.0f};
    bool flashOn_{false};
};

} // namespace pm2d
