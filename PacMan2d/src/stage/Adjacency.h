#pragma once
#include "core/Direction.h"
#include "stage/CellContent.h"
#include <map>

namespace pm2d {

using BarrierPoints = std::map<Tile, BarrierKind>;

struct Neighbour {
    bool present{false};
    BarrierKind kind{BarrierKind::Border};
};

// Eight-way neighbourhood of one barrier. "top" is row + 1.
struct AdjacencyInfo {
    Neighbour left;
    Neighbour right;
    Neighbour top;
    Neighbour bottom;
    Neighbour leftTop;
    Neighbour rightTop;
    Neighbour leftBottom;
    Neighbour rightBottom;
};

// Cells on the board edge see synthetic Border neighbours on their outward sides.
AdjacencyInfo computeAdjacency(Tile at, const BarrierPoints& points, int cols, int rows);

} // namespace pm2d
