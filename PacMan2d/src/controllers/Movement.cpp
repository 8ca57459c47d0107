#include "controllers/Movement.h"
#include <cmath>

namespace pm2d::movement {
namespace {

// Fraction of a cell within which a position counts as sitting on the cell.
constexpr float kOnCellTolerance = 1e-3f;

// Next canonical cell coordinate along one axis in the direction of travel.
float nextCellCoordinate(float pos, float origin, float cell, float velocity) {
    float rel = (pos - origin) / cell;
    // Snapped positions with non-integer geometry divide to e.g. 2.9999998.
    const float nearest = std::round(rel);
    if (std::fabs(rel - nearest) < kOnCellTolerance) rel = nearest;
    float next = velocity > 0.0f ? std::floor(rel) + 1.0f : std::ceil(rel) - 1.0f;
    return next * cell + origin;
}

float advanceAxis(float pos, float origin, float cell, float velocity, float dt) {
    if (velocity == 0.0f) return pos;
    float target = pos + velocity * dt;
    float stopAt = nextCellCoordinate(pos, origin, cell, velocity);
    if (velocity > 0.0f && target > stopAt) return stopAt;
    if (velocity < 0.0f && target < stopAt) return stopAt;
    return target;
}

Vector2 unitVector(Direction d) {
    switch (d) {
        case Direction::Left: return Vector2{-1.0f, 0.0f};
        case Direction::Right: return Vector2{1.0f, 0.0f};
        case Direction::Up: return Vector2{0.0f, 1.0f};
        case Direction::Down: return Vector2{0.0f, -1.0f};
        case Direction::None: default: return Vector2{0.0f, 0.0f};
    }
}

} // namespace

void advance(Actor& actor, const Grid& grid, float dt) {
    if (dt <= 0.0f) return;
    const float cell = grid.cellSize();
    const Vector2 origin = grid.origin();
    actor.position.x = advanceAxis(actor.position.x, origin.x, cell, actor.velocity.x, dt);
    actor.position.y = advanceAxis(actor.position.y, origin.y, cell, actor.velocity.y, dt);
}

bool wrapAround(Actor& actor, const Grid& grid) {
    const float worldW = grid.cols() * grid.cellSize() + grid.origin().x;
    const float worldH = grid.rows() * grid.cellSize() + grid.origin().y;
    bool teleported = false;

    if (actor.position.x + actor.size <= 0.0f) {
        actor.position.x = worldW;
        teleported = true;
    } else if (actor.position.x >= worldW) {
        actor.position.x = -actor.size;
        teleported = true;
    }

    if (actor.position.y + actor.size <= 0.0f) {
        actor.position.y = worldH;
        teleported = true;
    } else if (actor.position.y >= worldH) {
        actor.position.y = -actor.size;
        teleported = true;
    }
    return teleported;
}

std::optional<Tile> alignToTile(Actor& actor, const Grid& grid) {
    auto tile = grid.findAlignedTile(actor.position);
    if (!tile) return std::nullopt;
    actor.position = grid.cellPixelPosition(*tile);
    actor.tile = *tile;
    return tile;
}

bool isBlocked(const Grid& grid, Tile from, Direction d) {
    if (d == Direction::None) return false;
    return grid.hasBarrier(step(from, d));
}

void commit(Actor& actor, Direction d, float speed) {
    if (d == Direction::None) {
        stop(actor);
        return;
    }
    Vector2 u = unitVector(d);
    actor.velocity = Vector2{u.x * speed, u.y * speed};
    actor.direction = d;
    actor.facing = d;
    actor.moving = true;
}

void stop(Actor& actor) {
    actor.velocity = Vector2{0.0f, 0.0f};
    actor.direction = Direction::None;
    actor.moving = false;
}

void animate(Actor& actor, float dt, int frameCount, float interval, bool resetWhenIdle) {
    if (!actor.moving) {
        if (resetWhenIdle) {
            actor.frame = 0;
            actor.frameTimer = 0.0f;
        }
        return;
    }
    actor.frameTimer += dt;
    while (actor.frameTimer >= interval) {
        actor.frameTimer -= interval;
        actor.frame = (actor.frame + 1) % frameCount;
    }
}

} // namespace pm2d::movement
