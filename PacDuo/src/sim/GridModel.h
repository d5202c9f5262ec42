#pragma once
#include "pacduo/grid_cell.h"
#include <raylib.h>
#include <cstdint>
#include <vector>

namespace pacduo::sim {

// Who is asking. Gate cells (the pursuer home door) are open to pursuers only.
enum class Traversal { Pursuer, Player };

enum class CellKind : std::uint8_t { Blocked, Open, Gate };

// Walkability table plus grid <-> world mapping. Immutable after construction.
// Cell (0,0) is the bottom-left corner; world +y points up.
class GridModel {
public:
    // cells are row-major with row 0 at the bottom; a size mismatch is padded
    // with blocked cells (logged).
    GridModel(int width, int height, std::vector<CellKind> cells, float cellSize = 1.0f);

    // rows[y][x] == true means walkable. Short rows are padded with blocked cells.
    static GridModel fromWalkability(const std::vector<std::vector<bool>>& rows, float cellSize = 1.0f);

    int width() const { return width_; }
    int height() const { return height_; }
    float cellSize() const { return cellSize_; }

    bool inBounds(GridCell cell) const {
        return cell.x >= 0 && cell.y >= 0 && cell.x < width_ && cell.y < height_;
    }

    CellKind kind(GridCell cell) const;
    bool isGate(GridCell cell) const { return kind(cell) == CellKind::Gate; }

    // Pursuer view: gates count as walkable.
    bool isWalkable(GridCell cell) const { return isWalkable(cell, Traversal::Pursuer); }
    bool isWalkable(GridCell cell, Traversal traversal) const;

    // Walkable up/down/left/right neighbors, always in that order.
    std::vector<GridCell> walkableNeighbors(GridCell cell, Traversal traversal = Traversal::Pursuer) const;

    Vector2 toWorld(GridCell cell) const;
    GridCell toGrid(Vector2 point) const;

    int walkableCount(Traversal traversal = Traversal::Pursuer) const;

private:
    int width_{0};
    int height_{0};
    float cellSize_{1.0f};
    int originX_{0};
    int originY_{0};
    std::vector<CellKind> cells_{};
};

} // namespace pacduo::sim
