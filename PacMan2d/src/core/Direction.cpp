#include "core/Direction.h"
#include <cstdlib>

namespace pm2d {

Direction opposite(Direction d) noexcept {
    switch (d) {
        case Direction::Left: return Direction::Right;
        case Direction::Right: return Direction::Left;
        case Direction::Up: return Direction::Down;
        case Direction::Down: return Direction::Up;
        case Direction::None: default: return Direction::None;
    }
}

Tile step(Tile from, Direction d, int distance) noexcept {
    switch (d) {
        case Direction::Left: return Tile{from.col - distance, from.row};
        case Direction::Right: return Tile{from.col + distance, from.row};
        case Direction::Up: return Tile{from.col, from.row + distance};
        case Direction::Down: return Tile{from.col, from.row - distance};
        case Direction::None: default: return from;
    }
}

int manhattan(Tile a, Tile b) noexcept {
    return std::abs(a.col - b.col) + std::abs(a.row - b.row);
}

const char* to_string(Direction d) noexcept {
    switch (d) {
        case Direction::Left: return "Left";
        case Direction::Right: return "Right";
        case Direction::Up: return "Up";
        case Direction::Down: return "Down";
        case Direction::None: return "None";
        default: return "Unknown";
    }
}

} // namespace pm2d
