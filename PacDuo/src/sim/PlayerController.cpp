#include "sim/PlayerController.h"

namespace pacduo::sim {

void PlayerController::setDesiredDirection(GridCell direction) {
    if (!direction.isZero()) {
        motion_.setBufferedDirection(direction);
    }
}

bool PlayerController::tick(float dt) {
    if (!motion_.isMoving()) {
        chooseMove();
    }
    return motion_.advance(dt);
}

void PlayerController::chooseMove() {
    GridCell buffered = motion_.bufferedDirection();
    if (!buffered.isZero() && motion_.beginMove(buffered)) {
        motion_.setBufferedDirection(dir::None);
        return;
    }
    GridCell current = motion_.currentDirection();
    if (!current.isZero() && motion_.beginMove(current)) {
        return;
    }
    // Both blocked: stop, keep the buffer for a later opening
    motion_.setCurrentDirection(dir::None);
}

} // namespace pacduo::sim
