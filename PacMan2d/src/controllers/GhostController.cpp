#include "controllers/GhostController.h"
#include "controllers/Movement.h"
#include <algorithm>
#include <limits>

namespace pm2d {

GhostController::GhostController(Ghost& ghost, Grid& grid, const Player& player, RandomSource& rng, float speed)
    : ghost_(ghost), grid_(grid), player_(player), rng_(rng), speed_(speed) {}

void GhostController::frighten(float seconds) {
    ghost_.frightened = true;
    ghost_.frightenedTimer = seconds;
    ghost_.blinking = false;
    ghost_.blinkFrame = 1;
    ghost_.blinkTimer = 0.0f;
}

void GhostController::clearFrightened() {
    ghost_.frightened = false;
    ghost_.frightenedTimer = 0.0f;
    ghost_.blinking = false;
    ghost_.blinkFrame = 1;
    ghost_.blinkTimer = 0.0f;
}

void GhostController::resetActivation() {
    ghost_.activated = false;
    ghost_.activationTimer = 0.0f;
}

void GhostController::tickFrightened(float dt) {
    if (!ghost_.frightened || ghost_.eaten) return;
    ghost_.frightenedTimer -= dt;
    if (ghost_.frightenedTimer <= kBlinkThresholdSeconds) {
        ghost_.blinking = true;
        ghost_.blinkTimer += dt;
        if (ghost_.blinkTimer >= kBlinkIntervalSeconds) {
            ghost_.blinkTimer = 0.0f;
            ghost_.blinkFrame = ghost_.blinkFrame == 1 ? 2 : 1;
        }
    }
    if (ghost_.frightenedTimer <= 0.0f) {
        clearFrightened();
    }
}

bool GhostController::tickActivation(float dt) {
    if (ghost_.activated) return true;
    ghost_.activationTimer += dt;
    if (ghost_.activationTimer < ghost_.traits().activationDelay) return false;
    ghost_.activated = true;
    ghost_.eaten = false;
    movement::commit(ghost_, ghost_.traits().initialDirection, speed_);
    return true;
}

void GhostController::update(float dt) {
    tickFrightened(dt);
    if (!tickActivation(dt)) return;

    float remaining = dt;
    while (remaining > 0.0f) {
        const float stepDt = std::min(kGhostSubStep, remaining);
        movement::advance(ghost_, grid_, stepDt);
        movement::wrapAround(ghost_, grid_);
        if (auto tile = movement::alignToTile(ghost_, grid_)) {
            decide(*tile);
        }
        remaining -= stepDt;
    }
    movement::animate(ghost_, dt, kGhostWalkFrames, kGhostWalkFrameSeconds, true);
}

std::vector<Direction> GhostController::candidateDirections(Tile from) const {
    std::vector<Direction> out;
    out.reserve(kMoveDirections.size());
    for (Direction d : kMoveDirections) {
        if (!movement::isBlocked(grid_, from, d)) out.push_back(d);
    }
    if (out.size() > 1 && ghost_.moving) {
        const Direction back = opposite(ghost_.direction);
        out.erase(std::remove(out.begin(), out.end(), back), out.end());
    }
    return out;
}

Direction GhostController::pickRandom(const std::vector<Direction>& options) {
    if (options.size() == 1) return options.front();
    return options[static_cast<std::size_t>(rng_.nextInt(static_cast<int>(options.size())))];
}

Direction GhostController::pickTowards(Tile from, Tile target, const std::vector<Direction>& options) {
    int best = std::numeric_limits<int>::max();
    std::vector<Direction> tied;
    for (Direction d : options) {
        const int dist = manhattan(step(from, d), target);
        if (dist < best) {
            best = dist;
            tied.clear();
        }
        if (dist == best) tied.push_back(d);
    }
    return pickRandom(tied);
}

Tile GhostController::targetTile() {
    const Tile playerTile = player_.tile;
    switch (ghost_.traits().strategy) {
        case TargetStrategy::Ambush:
            return step(playerTile, player_.facing, kAmbushLead);
        case TargetStrategy::Jitter: {
            const int dc = rng_.nextInt(3) - 1;
            const int dr = rng_.nextInt(3) - 1;
            return Tile{playerTile.col + dc, playerTile.row + dr};
        }
        case TargetStrategy::ShyOfPlayer:
            if (manhattan(ghost_.tile, playerTile) <= kShyDistance) {
                return Tile{0, grid_.rows() - 1};
            }
            return playerTile;
        case TargetStrategy::Direct:
        default:
            return playerTile;
    }
}

Direction GhostController::decide(Tile from) {
    const auto options = candidateDirections(from);
    if (options.empty()) {
        movement::stop(ghost_);
        return Direction::None;
    }

    Direction chosen;
    if (ghost_.frightened) {
        chosen = pickRandom(options);
    } else {
        const Tile target = targetTile();
        if (rng_.nextUnit() < ghost_.traits().errorChance) {
            chosen = pickRandom(options);
        } else {
            chosen = pickTowards(from, target, options);
        }
    }
    movement::commit(ghost_, chosen, speed_);
    return chosen;
}

} // namespace pm2d
