#include "stage/Adjacency.h"

namespace pm2d {
namespace {

Neighbour lookup(const BarrierPoints& points, Tile at, int dc, int dr) {
    auto it = points.find(Tile{at.col + dc, at.row + dr});
    if (it == points.end()) return {};
    return Neighbour{true, it->second};
}

constexpr Neighbour kEdge{true, BarrierKind::Border};

} // namespace

AdjacencyInfo computeAdjacency(Tile at, const BarrierPoints& points, int cols, int rows) {
    AdjacencyInfo a;
    a.left = lookup(points, at, -1, 0);
    a.right = lookup(points, at, 1, 0);
    a.top = lookup(points, at, 0, 1);
    a.bottom = lookup(points, at, 0, -1);
    a.leftBottom = lookup(points, at, -1, -1);
    a.rightBottom = lookup(points, at, 1, -1);
    a.leftTop = lookup(points, at, -1, 1);
    a.rightTop = lookup(points, at, 1, 1);

    if (at.col == 0) {
        a.left = a.leftTop = a.leftBottom = kEdge;
    }
    if (at.col == cols - 1) {
        a.right = a.rightTop = a.rightBottom = kEdge;
    }
    if (at.row == 0) {
        a.bottom = a.leftBottom = a.rightBottom = kEdge;
    }
    if (at.row == rows - 1) {
        a.top = a.leftTop = a.rightTop = kEdge;
    }
    return a;
}

} // namespace pm2d
