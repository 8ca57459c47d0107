#pragma once
#include "actors/GhostType.h"
#include <raylib.h>
#include <variant>

namespace pm2d {

enum class BarrierKind { Border, Structure, Interior, Door };

// Sprite orientation chosen from a barrier's neighbourhood. Default means the
// cell is not materialised as a barrier at all.
enum class TextureTag {
    Default,
    StraightHorizontalDown,
    StraightHorizontalUp,
    StraightVerticalLeft,
    StraightVerticalRight,
    OuterArcTopLeft,
    OuterArcTopRight,
    OuterArcBottomLeft,
    OuterArcBottomRight,
    InsideArcTopLeft,
    InsideArcTopRight,
    InsideArcBottomLeft,
    InsideArcBottomRight,
    BorderVerticalLeftTopConnector,
    BorderVerticalLeftBottomConnector,
    BorderVerticalRightTopConnector,
    BorderVerticalRightBottomConnector,
    BorderHorizontalLeftTopConnector,
    BorderHorizontalRightTopConnector,
    BorderHorizontalLeftBottomConnector,
    BorderHorizontalRightBottomConnector,
    BorderSingleLineVerticalLeft,
    BorderSingleLineVerticalRight,
    BorderSingleLineHorizontalUp,
    BorderSingleLineHorizontalDown,
};

enum class DotKind { Regular, PowerUp };

struct BarrierCell {
    BarrierKind kind{BarrierKind::Border};
    TextureTag tag{TextureTag::Default};
    Color color{BLUE};
    Color originalColor{BLUE};
};

struct DotCell {
    DotKind kind{DotKind::Regular};
};

// Spawn markers. The actors themselves are owned by the game controller.
struct PlayerCell {
    Vector2 spawnPosition{};
};

struct GhostCell {
    GhostType type{GhostType::Blinky};
    Vector2 spawnPosition{};
};

using CellContent = std::variant<std::monostate, BarrierCell, DotCell, PlayerCell, GhostCell>;

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

inline bool sameColor(Color a, Color b) noexcept {
    return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a;
}

inline bool samePosition(Vector2 a, Vector2 b) noexcept {
    return a.x == b.x && a.y == b.y;
}

inline bool operator==(const BarrierCell& a, const BarrierCell& b) noexcept {
    return a.kind == b.kind && a.tag == b.tag && sameColor(a.color, b.color) && sameColor(a.originalColor, b.originalColor);
}
inline bool operator==(const DotCell& a, const DotCell& b) noexcept { return a.kind == b.kind; }
inline bool operator==(const PlayerCell& a, const PlayerCell& b) noexcept {
    return samePosition(a.spawnPosition, b.spawnPosition);
}
inline bool operator==(const GhostCell& a, const GhostCell& b) noexcept {
    return a.type == b.type && samePosition(a.spawnPosition, b.spawnPosition);
}

const char* to_string(BarrierKind kind) noexcept;
const char* to_string(TextureTag tag) noexcept;

// Tags that only a Border barrier may carry.
bool isBorderOnlyTag(TextureTag tag) noexcept;

} // namespace pm2d
