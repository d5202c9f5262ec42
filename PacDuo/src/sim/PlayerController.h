#pragma once
#include "pacduo/grid_cell.h"
#include "sim/EntityMotion.h"

namespace pacduo::sim {

// Buffered turning for a player entity: a requested turn waits for the next
// cell boundary, and a blocked turn keeps the player going straight.
class PlayerController {
public:
    explicit PlayerController(EntityMotion& motion) : motion_(motion) {}

    // Held keys re-buffer every tick; None leaves the buffer untouched.
    void setDesiredDirection(GridCell direction);

    // Returns true when a cell was entered this tick.
    bool tick(float dt);

    EntityMotion& motion() { return motion_; }
    const EntityMotion& motion() const { return motion_; }

private:
    void chooseMove();

    EntityMotion& motion_;
};

} // namespace pacduo::sim
