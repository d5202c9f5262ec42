#include "sim/GridModel.h"
#include "services/logger/LogManager.h"
#include <algorithm>
#include <cmath>

namespace pacduo::sim {

using logging::LogManager;

GridModel::GridModel(int width, int height, std::vector<CellKind> cells, float cellSize)
    : width_(std::max(0, width)),
      height_(std::max(0, height)),
      cellSize_(cellSize > 0.0f ? cellSize : 1.0f),
      originX_((std::max(0, width) - 1) / 2),
      originY_((std::max(0, height) - 1) / 2),
      cells_(std::move(cells)) {
    const std::size_t expected = static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_);
    if (cells_.size() != expected) {
        LogManager::error("GridModel: {} cells supplied for a {}x{} grid, padding with walls",
                          cells_.size(), width_, height_);
        cells_.resize(expected, CellKind::Blocked);
    }
    if (cellSize <= 0.0f) {
        LogManager::warn("GridModel: cell size {} is not positive, using 1.0", cellSize);
    }
}

GridModel GridModel::fromWalkability(const std::vector<std::vector<bool>>& rows, float cellSize) {
    int height = static_cast<int>(rows.size());
    int width = 0;
    for (const auto& row : rows) width = std::max(width, static_cast<int>(row.size()));

    std::vector<CellKind> cells(static_cast<std::size_t>(width) * static_cast<std::size_t>(height), CellKind::Blocked);
    for (int y = 0; y < height; ++y) {
        const auto& row = rows[static_cast<std::size_t>(y)];
        for (int x = 0; x < static_cast<int>(row.size()); ++x) {
            if (row[static_cast<std::size_t>(x)]) {
                cells[static_cast<std::size_t>(y * width + x)] = CellKind::Open;
            }
        }
    }
    return GridModel(width, height, std::move(cells), cellSize);
}

CellKind GridModel::kind(GridCell cell) const {
    if (!inBounds(cell)) return CellKind::Blocked;
    return cells_[static_cast<std::size_t>(cell.y * width_ + cell.x)];
}

bool GridModel::isWalkable(GridCell cell, Traversal traversal) const {
    switch (kind(cell)) {
        case CellKind::Open: return true;
        case CellKind::Gate: return traversal == Traversal::Pursuer;
        case CellKind::Blocked: break;
    }
    return false;
}

std::vector<GridCell> GridModel::walkableNeighbors(GridCell cell, Traversal traversal) const {
    std::vector<GridCell> out;
    out.reserve(dir::kAll.size());
    for (const GridCell& d : dir::kAll) {
        GridCell n = cell + d;
        if (isWalkable(n, traversal)) out.push_back(n);
    }
    return out;
}

Vector2 GridModel::toWorld(GridCell cell) const {
    return Vector2{ static_cast<float>(cell.x - originX_) * cellSize_,
                    static_cast<float>(cell.y - originY_) * cellSize_ };
}

GridCell GridModel::toGrid(Vector2 point) const {
    return GridCell{ static_cast<int>(std::lround(point.x / cellSize_)) + originX_,
                     static_cast<int>(std::lround(point.y / cellSize_)) + originY_ };
}

int GridModel::walkableCount(Traversal traversal) const {
    int count = 0;
    for (int y = 0; y < height_; ++y) {
        for (int x = 0; x < width_; ++x) {
            if (isWalkable({x, y}, traversal)) ++count;
        }
    }
    return count;
}

} // namespace pacduo::sim
