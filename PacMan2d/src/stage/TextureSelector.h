#pragma once
#include "stage/Adjacency.h"

namespace pm2d {

// Pure mapping from a barrier's neighbourhood to its sprite orientation.
// Rule groups run in order and a later match replaces an earlier one:
// straight segments, outer arcs, inner arcs, border/structure connectors,
// then the fully surrounded single-line connectors.
TextureTag selectTexture(const AdjacencyInfo& n, BarrierKind kind) noexcept;

} // namespace pm2d
