#include "actors/GhostType.h"
#include <array>

namespace pm2d {
namespace {

constexpr std::array<GhostTraits, 4> kTraits = {{
    {"Blinky", 0.0f, Direction::Left,  0.3f, TargetStrategy::Direct,      Color{255, 0, 0, 255}},
    {"Pinky",  3.0f, Direction::Right, 0.5f, TargetStrategy::Ambush,      Color{255, 184, 255, 255}},
    {"Inky",   6.0f, Direction::Up,    0.6f, TargetStrategy::Jitter,      Color{0, 255, 255, 255}},
    {"Clyde",  9.0f, Direction::Down,  0.7f, TargetStrategy::ShyOfPlayer, Color{255, 184, 82, 255}},
}};

} // namespace

const GhostTraits& traitsOf(GhostType type) noexcept {
    return kTraits[static_cast<std::size_t>(type)];
}

const char* to_string(GhostType type) noexcept {
    return traitsOf(type).name;
}

} // namespace pm2d
