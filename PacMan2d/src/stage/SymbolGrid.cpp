#include "stage/SymbolGrid.h"
#include <algorithm>
#include <utility>

namespace pm2d {

SymbolGrid::SymbolGrid(std::vector<std::string> topDownRows) : rows_(std::move(topDownRows)) {
    for (const auto& r : rows_) cols_ = std::max(cols_, static_cast<int>(r.size()));
}

char SymbolGrid::symbolAt(int col, int row) const {
    if (col < 0 || col >= cols_ || row < 0 || row >= rows()) return ' ';
    const std::string& line = rows_[static_cast<std::size_t>(rows() - row - 1)];
    if (col >= static_cast<int>(line.size())) return ' ';
    return line[static_cast<std::size_t>(col)];
}

} // namespace pm2d
