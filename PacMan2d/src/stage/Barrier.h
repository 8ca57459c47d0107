#pragma once
#include "stage/CellContent.h"
#include <optional>

namespace pm2d {

// Door barriers render pink; every other kind draws in the maze blue.
Color barrierColor(BarrierKind kind) noexcept;

bool isTagAllowed(BarrierKind kind, TextureTag tag) noexcept;

// Returns nullopt when the tag is outside the kind's whitelist.
std::optional<BarrierCell> makeBarrier(BarrierKind kind, TextureTag tag);

} // namespace pm2d
