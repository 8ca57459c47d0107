#pragma once
#include <string>
#include <vector>

namespace pm2d {

// Character map of a stage as authored: rows listed top to bottom. Lookups
// through symbolAt() use board coordinates, where row 0 is the bottom row.
class SymbolGrid {
public:
    SymbolGrid() = default;
    explicit SymbolGrid(std::vector<std::string> topDownRows);

    int cols() const { return cols_; }
    int rows() const { return static_cast<int>(rows_.size()); }

    // Cells beyond a short row read as ' '.
    char symbolAt(int col, int row) const;

    const std::vector<std::string>& topDownRows() const { return rows_; }

    friend bool operator==(const SymbolGrid&, const SymbolGrid&) = default;

private:
    std::vector<std::string> rows_{};
    int cols_{0};
};

} // namespace pm2d
