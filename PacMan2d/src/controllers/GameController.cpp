#include "controllers/GameController.h"
#include "controllers/Movement.h"
#include "services/logger/LogManager.h"
#include <algorithm>
#include <utility>

namespace pm2d {

using logging::LogManager;

const char* to_string(GameMode mode) noexcept {
    switch (mode) {
        case GameMode::Normal: return "Normal";
        case GameMode::Dying: return "Dying";
        case GameMode::StageComplete: return "StageComplete";
        case GameMode::GameOver: return "GameOver";
        default: return "Unknown";
    }
}

GameController::GameController(Stage stage, GameSettings settings, SessionState& session, RandomSource& rng)
    : stage_(std::move(stage)), settings_(std::move(settings)), session_(session), rng_(rng) {
    lives_ = settings_.startingLives;
    spawnActors();
}

void GameController::spawnActors() {
    const float size = stage_.grid.cellSize();

    player_ = Player{};
    player_.tile = stage_.playerTile;
    player_.position = stage_.playerSpawn;
    player_.size = size;
    playerController_ = std::make_unique<PlayerController>(player_, stage_.grid, settings_.playerSpeed);

    ghostControllers_.clear();
    ghosts_.clear();
    ghosts_.reserve(stage_.ghostSpawns.size());
    for (const auto& sp : stage_.ghostSpawns) {
        ghosts_.push_back(makeGhost(sp.type, sp.tile, sp.position, size));
    }
    ghostControllers_.reserve(ghosts_.size());
    for (auto& g : ghosts_) {
        ghostControllers_.emplace_back(g, stage_.grid, player_, rng_, settings_.ghostSpeed);
    }
    ghostsActive_ = false;
}

void GameController::handleInput(Direction mostRecent) {
    if (mode_ != GameMode::Normal) return;
    playerController_->handleInput(mostRecent);
}

void GameController::update(float dt) {
    switch (mode_) {
        case GameMode::StageComplete: updateStageComplete(dt); break;
        case GameMode::Dying: updateDying(dt); break;
        case GameMode::Normal: updateNormal(dt); break;
        case GameMode::GameOver: default: break;
    }
}

void GameController::updateNormal(float dt) {
    applyTileEntry(playerController_->update(dt));

    if (player_.hasMoved) ghostsActive_ = true;
    if (ghostsActive_) {
        for (auto& gc : ghostControllers_) gc.update(dt);
    }

    resolveGhostCollisions();
    if (score_ > session_.highScore) session_.highScore = score_;
    if (mode_ != GameMode::Normal) return;

    if (stage_.grid.dotCount() == 0) {
        enterStageComplete();
    }

    if (!extraLifeAwarded_ && score_ >= settings_.extraLifeScore) {
        extraLifeAwarded_ = true;
        ++lives_;
        LogManager::info("Extra life at {} points, lives now {}", score_, lives_);
    }
}

void GameController::applyTileEntry(const TileEntryResult& entry) {
    if (!entry.dotConsumed) return;
    addScore(entry.points);
    if (*entry.dotConsumed == DotKind::PowerUp) powerUpEaten();
}

void GameController::powerUpEaten() {
    ghostPoints_ = kFirstGhostPoints;
    int frightened = 0;
    for (auto& gc : ghostControllers_) {
        const Ghost& g = gc.ghost();
        if (g.activated && !g.eaten) {
            gc.frighten(settings_.frightenedSeconds);
            ++frightened;
        }
    }
    LogManager::debug("Power-up eaten, {} ghost(s) frightened", frightened);
}

void GameController::resolveGhostCollisions() {
    const Rectangle playerBounds = player_.bounds();
    for (std::size_t i = 0; i < ghosts_.size(); ++i) {
        const Ghost& g = ghosts_[i];
        if (!CheckCollisionRecs(playerBounds, g.bounds())) continue;
        if (!g.activated) {
            killPlayer();
            return;
        }
        if (g.frightened && !g.eaten) {
            eatGhost(i);
        } else if (!g.frightened && !g.eaten) {
            killPlayer();
            return;
        }
    }
}

void GameController::eatGhost(std::size_t index) {
    GhostController& gc = ghostControllers_[index];
    Ghost& g = gc.ghost();
    g.eaten = true;
    gc.clearFrightened();
    movement::stop(g);
    g.position = g.startPosition;
    g.tile = g.startTile;
    gc.resetActivation();

    addScore(ghostPoints_);
    LogManager::info("{} eaten for {} points", to_string(g.type), ghostPoints_);
    ghostPoints_ = std::min(ghostPoints_ * 2, kMaxGhostPoints);
}

void GameController::killPlayer() {
    LogManager::info("Player caught at ({},{}), lives {}", player_.tile.col, player_.tile.row, lives_);
    mode_ = GameMode::Dying;
    player_.dying = true;
    player_.frame = 0;
    player_.frameTimer = 0.0f;
    playerController_->stop();
    deathFrameTimer_ = 0.0f;
    removeGhostsFromBoard();
}

void GameController::removeGhostsFromBoard() {
    for (auto& g : ghosts_) {
        movement::stop(g);
        g.tile = Tile{-1, -1};
        g.position = kOffBoard;
    }
}

void GameController::updateDying(float dt) {
    deathFrameTimer_ += dt;
    while (deathFrameTimer_ >= kDeathFrameSeconds && player_.frame < kDeathFrameCount - 1) {
        deathFrameTimer_ -= kDeathFrameSeconds;
        ++player_.frame;
    }
    if (player_.frame >= kDeathFrameCount - 1) {
        finishDeath();
    }
}

void GameController::finishDeath() {
    --lives_;
    if (lives_ <= 0) {
        lives_ = 0;
        mode_ = GameMode::GameOver;
        LogManager::info("Game over with {} points (high score {})", score_, session_.highScore);
        return;
    }
    LogManager::info("Life lost, {} remaining", lives_);
    spawnActors();
    mode_ = GameMode::Normal;
}

void GameController::enterStageComplete() {
    LogManager::info("Stage {} cleared with {} points", level_, score_);
    mode_ = GameMode::StageComplete;
    playerController_->stop();
    removeGhostsFromBoard();
    stageCompleteTimer_ = kStageCompleteSeconds;
    flashTimer_ = 0.0f;
    flashOn_ = false;
}

void GameController::setBarrierFlash(bool on) {
    stage_.grid.forEachCell([on](Tile, CellContent& cell) {
        auto* barrier = std::get_if<BarrierCell>(&cell);
        if (!barrier || barrier->kind == BarrierKind::Door) return;
        barrier->color = on ? WHITE : barrier->originalColor;
    });
}

void GameController::updateStageComplete(float dt) {
    stageCompleteTimer_ -= dt;
    flashTimer_ -= dt;
    if (flashTimer_ <= 0.0f) {
        flashTimer_ += kStageFlashSeconds;
        flashOn_ = !flashOn_;
        setBarrierFlash(flashOn_);
    }
    if (stageCompleteTimer_ <= 0.0f) {
        rebuildStage();
    }
}

void GameController::rebuildStage() {
    StageCompiler compiler(stage_.options);
    StageResult result = compiler.compile(stage_.source);
    if (!result.ok()) {
        // The same source compiled before, so this only happens if the stage data was corrupted in memory.
        LogManager::critical("Stage rebuild failed: {}", result.message);
        mode_ = GameMode::GameOver;
        return;
    }
    stage_ = std::move(*result.stage);
    spawnActors();
    ghostPoints_ = kFirstGhostPoints;
    flashOn_ = false;
    ++level_;
    mode_ = GameMode::Normal;
    LogManager::debug("Stage rebuilt for level {}", level_);
}

void GameController::restart() {
    score_ = 0;
    lives_ = settings_.startingLives;
    level_ = 0;
    extraLifeAwarded_ = false;
    rebuildStage();
}

void GameController::addScore(int points) {
    score_ += points;
}

} // namespace pm2d
