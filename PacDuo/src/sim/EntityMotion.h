#pragma once
#include "pacduo/grid_cell.h"
#include "sim/GridModel.h"
#include <raylib.h>

namespace pacduo::sim {

// Discrete cell-to-cell movement shared by players and pursuers.
// Idle: currentCell == targetCell and position() == grid.toWorld(currentCell).
// Moving: interpolating toward the adjacent targetCell.
class EntityMotion {
public:
    EntityMotion(const GridModel& grid, GridCell spawnCell, float speed, Traversal traversal);

    // Starts a one-cell move. Fails when already moving, when direction is not a
    // unit step or when the neighbor is not walkable for this entity.
    bool beginMove(GridCell direction);

    // Interpolates toward the target. Returns true on the tick the target cell
    // is entered; the entity is then idle with its position snapped.
    bool advance(float dt);

    // Jumps to `cell` and stops. Directions are cleared unless keepDirections.
    void teleport(GridCell cell, bool keepDirections = false);

    // Liveness is caller policy; motion keeps working for dead entities.
    void die() { alive_ = false; }
    void revive() { alive_ = true; }

    GridCell currentCell() const { return currentCell_; }
    GridCell targetCell() const { return targetCell_; }
    Vector2 position() const { return position_; }
    bool isMoving() const { return moving_; }
    bool alive() const { return alive_; }

    GridCell currentDirection() const { return currentDirection_; }
    void setCurrentDirection(GridCell direction) { currentDirection_ = direction; }
    GridCell bufferedDirection() const { return bufferedDirection_; }
    void setBufferedDirection(GridCell direction) { bufferedDirection_ = direction; }

    float speed() const { return speed_; }
    void setSpeed(float cellsPerSecond);

    GridCell spawnCell() const { return spawnCell_; }
    void setSpawnCell(GridCell cell) { spawnCell_ = cell; }

    Traversal traversal() const { return traversal_; }
    const GridModel& grid() const { return grid_; }

private:
    const GridModel& grid_;
    Traversal traversal_;
    GridCell spawnCell_{};
    GridCell currentCell_{};
    GridCell targetCell_{};
    Vector2 position_{};
    Vector2 targetPosition_{};
    GridCell currentDirection_{};
    GridCell bufferedDirection_{};
    float speed_{0.0f};
    bool moving_{false};
    bool alive_{true};
};

} // namespace pacduo::sim
