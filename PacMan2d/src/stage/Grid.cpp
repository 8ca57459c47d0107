#include "stage/Grid.h"
#include <cmath>
#include <stdexcept>
#include <string>

namespace pm2d {

Grid::Grid(int cols, int rows, float cellSize, Vector2 origin)
    : cols_(cols), rows_(rows), cellSize_(cellSize), origin_(origin) {
    if (cols <= 0 || rows <= 0) {
        throw std::invalid_argument("grid dimensions must be positive");
    }
    cells_.resize(static_cast<std::size_t>(cols) * static_cast<std::size_t>(rows));
}

bool Grid::contains(int col, int row) const noexcept {
    return col >= 0 && col < cols_ && row >= 0 && row < rows_;
}

std::size_t Grid::index(int col, int row) const {
    if (!contains(col, row)) {
        throw std::out_of_range("grid cell (" + std::to_string(col) + "," + std::to_string(row) + ") outside "
                                + std::to_string(cols_) + "x" + std::to_string(rows_) + " board");
    }
    return static_cast<std::size_t>(row) * static_cast<std::size_t>(cols_) + static_cast<std::size_t>(col);
}

const CellContent& Grid::get(int col, int row) const { return cells_[index(col, row)]; }

void Grid::set(int col, int row, CellContent content) { cells_[index(col, row)] = std::move(content); }

Vector2 Grid::cellPixelPosition(int col, int row) const noexcept {
    return Vector2{ col * cellSize_ + origin_.x, row * cellSize_ + origin_.y };
}

std::optional<Tile> Grid::findAlignedTile(Vector2 pos, float epsilon) const {
    int col = static_cast<int>(std::lround((pos.x - origin_.x) / cellSize_));
    int row = static_cast<int>(std::lround((pos.y - origin_.y) / cellSize_));
    if (!contains(col, row)) return std::nullopt;
    Vector2 cell = cellPixelPosition(col, row);
    if (std::fabs(pos.x - cell.x) <= epsilon && std::fabs(pos.y - cell.y) <= epsilon) {
        return Tile{col, row};
    }
    return std::nullopt;
}

bool Grid::hasBarrier(Tile t) const {
    if (!contains(t)) return false;
    return std::holds_alternative<BarrierCell>(get(t));
}

int Grid::dotCount() const {
    int n = 0;
    for (const auto& c : cells_) {
        if (std::holds_alternative<DotCell>(c)) ++n;
    }
    return n;
}

bool operator==(const Grid& a, const Grid& b) {
    return a.cols_ == b.cols_ && a.rows_ == b.rows_ && a.cellSize_ == b.cellSize_
        && samePosition(a.origin_, b.origin_) && a.cells_ == b.cells_;
}

} // namespace pm2d
