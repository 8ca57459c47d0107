#pragma once
#include "core/Direction.h"
#include "stage/CellContent.h"
#include <raylib.h>
#include <optional>
#include <utility>
#include <vector>

namespace pm2d {

// Fixed-size board. One content slot per cell, row 0 at the bottom.
// Indexing outside the board throws std::out_of_range.
class Grid {
public:
    Grid(int cols, int rows, float cellSize, Vector2 origin);

    int cols() const { return cols_; }
    int rows() const { return rows_; }
    float cellSize() const { return cellSize_; }
    Vector2 origin() const { return origin_; }

    bool contains(int col, int row) const noexcept;
    bool contains(Tile t) const noexcept { return contains(t.col, t.row); }

    const CellContent& get(int col, int row) const;
    const CellContent& get(Tile t) const { return get(t.col, t.row); }
    void set(int col, int row, CellContent content);
    void set(Tile t, CellContent content) { set(t.col, t.row, std::move(content)); }
    void clear(int col, int row) { set(col, row, std::monostate{}); }

    Vector2 cellPixelPosition(int col, int row) const noexcept;
    Vector2 cellPixelPosition(Tile t) const noexcept { return cellPixelPosition(t.col, t.row); }

    // Cell whose pixel position lies within epsilon of pos on both axes.
    std::optional<Tile> findAlignedTile(Vector2 pos, float epsilon = 1.0f) const;

    // Cells outside the board are open so actors can leave through tunnels.
    bool hasBarrier(Tile t) const;

    int dotCount() const;

    template <typename Fn>
    void forEachCell(Fn&& fn) {
        for (int row = 0; row < rows_; ++row)
            for (int col = 0; col < cols_; ++col)
                fn(Tile{col, row}, cells_[index(col, row)]);
    }

    template <typename Fn>
    void forEachCell(Fn&& fn) const {
        for (int row = 0; row < rows_; ++row)
            for (int col = 0; col < cols_; ++col)
                fn(Tile{col, row}, cells_[index(col, row)]);
    }

    friend bool operator==(const Grid& a, const Grid& b);

private:
    std::size_t index(int col, int row) const;

    int cols_{0};
    int rows_{0};
    float cellSize_{0.0f};
    Vector2 origin_{};
    std::vector<CellContent> cells_{};
};

} // namespace pm2d
