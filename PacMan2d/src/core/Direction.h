#pragma once
#include <array>
#include <compare>

namespace pm2d {

// Order matters: candidate enumeration and random picks walk this order.
enum class Direction { Left, Right, Up, Down, None };

inline constexpr std::array<Direction, 4> kMoveDirections = {
    Direction::Left, Direction::Right, Direction::Up, Direction::Down
};

// Logical grid coordinate. Row 0 is the bottom row of the board.
struct Tile {
    int col{0};
    int row{0};

    friend bool operator==(const Tile&, const Tile&) = default;
    friend auto operator<=>(const Tile&, const Tile&) = default;
};

Direction opposite(Direction d) noexcept;
Tile step(Tile from, Direction d, int distance = 1) noexcept;
int manhattan(Tile a, Tile b) noexcept;
const char* to_string(Direction d) noexcept;

} // namespace pm2d
