#include "sim/EntityMotion.h"
#include <raymath.h>
#include <algorithm>

namespace pacduo::sim {

namespace {
// Fraction of a cell treated as "arrived".
constexpr float kArriveEpsilon = 0.001f;

bool isUnitStep(GridCell d) {
    return (d.x == 0 && (d.y == 1 || d.y == -1)) || (d.y == 0 && (d.x == 1 || d.x == -1));
}
} // namespace

EntityMotion::EntityMotion(const GridModel& grid, GridCell spawnCell, float speed, Traversal traversal)
    : grid_(grid),
      traversal_(traversal),
      spawnCell_(spawnCell),
      currentCell_(spawnCell),
      targetCell_(spawnCell),
      position_(grid.toWorld(spawnCell)),
      targetPosition_(position_),
      speed_(std::max(0.0f, speed)) {}

bool EntityMotion::beginMove(GridCell direction) {
    if (moving_ || !isUnitStep(direction)) return false;
    GridCell next = currentCell_ + direction;
    if (!grid_.isWalkable(next, traversal_)) return false;

    targetCell_ = next;
    targetPosition_ = grid_.toWorld(next);
    currentDirection_ = direction;
    moving_ = true;
    return true;
}

bool EntityMotion::advance(float dt) {
    if (!moving_) return false;
    float step = speed_ * grid_.cellSize() * std::max(0.0f, dt);
    position_ = Vector2MoveTowards(position_, targetPosition_, step);
    if (Vector2Distance(position_, targetPosition_) > kArriveEpsilon * grid_.cellSize()) {
        return false;
    }
    currentCell_ = targetCell_;
    position_ = grid_.toWorld(currentCell_);
    moving_ = false;
    return true;
}

void EntityMotion::teleport(GridCell cell, bool keepDirections) {
    currentCell_ = cell;
    targetCell_ = cell;
    position_ = grid_.toWorld(cell);
    targetPosition_ = position_;
    moving_ = false;
    if (!keepDirections) {
        currentDirection_ = dir::None;
        bufferedDirection_ = dir::None;
    }
}

void EntityMotion::setSpeed(float cellsPerSecond) {
    speed_ = std::max(0.0f, cellsPerSecond);
}

} // namespace pacduo::sim
