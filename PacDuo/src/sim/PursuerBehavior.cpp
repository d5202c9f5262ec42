#include "sim/PursuerBehavior.h"
#include "sim/PathSearch.h"
#include "services/logger/LogManager.h"

namespace pacduo::sim {

using logging::LogManager;

PursuerBehavior::PursuerBehavior(int id, EntityMotion& motion, const PursuerTuning& tuning, RandomSource& rng)
    : id_(id),
      motion_(motion),
      grid_(motion.grid()),
      tuning_(tuning),
      rng_(rng),
      chaseSpeed_(tuning.baseSpeed) {
    // Offset the random-decision clock so pursuers do not roll in lockstep
    randomTimer_ = rng_.nextFloat() * tuning_.randomDecisionInterval;
    recomputeTimer_ = tuning_.recomputeInterval;
    leftHome_ = !tuning_.home.contains(motion_.currentCell());
    applySpeed();
}

void PursuerBehavior::setTargets(const EntityMotion* playerOne, const EntityMotion* playerTwo) {
    players_ = {playerOne, playerTwo};
}

bool PursuerBehavior::tick(float dt) {
    if (respawning_) {
        respawnRemaining_ -= dt;
        if (respawnRemaining_ <= 0.0f) {
            finishRespawn();
        }
        return false;
    }

    updateHomeFlag();

    if (tuning_.randomDecisionInterval > 0.0f) {
        randomTimer_ += dt;
        if (randomTimer_ >= tuning_.randomDecisionInterval) {
            randomTimer_ = 0.0f;
            if (rng_.nextFloat() < tuning_.randomDecisionChance) {
                randomOverride_ = true;
                recomputeTimer_ = tuning_.recomputeInterval;
            }
        }
    }

    recomputeTimer_ += dt;
    if (recomputeTimer_ >= tuning_.recomputeInterval) {
        recomputeTimer_ = 0.0f;
        recomputePlan();
    }

    if (!motion_.isMoving()) {
        followPlan();
    }
    return motion_.advance(dt);
}

void PursuerBehavior::setScared(bool scared) {
    // A pursuer that was eaten stays scared until its respawn completes
    if (respawning_) return;
    scared_ = scared;
    plan_.clear();
    recomputeTimer_ = tuning_.recomputeInterval;
    applySpeed();
}

void PursuerBehavior::setChaseSpeed(float cellsPerSecond) {
    chaseSpeed_ = cellsPerSecond;
    applySpeed();
}

ContactOutcome PursuerBehavior::onPlayerContact() {
    if (respawning_) return ContactOutcome::None;
    if (!scared_) return ContactOutcome::PlayerCaught;

    motion_.teleport(motion_.spawnCell());
    plan_.clear();
    randomOverride_ = false;
    respawning_ = true;
    respawnRemaining_ = tuning_.respawnDelay;
    LogManager::debug("Pursuer {} eaten, back in {:.1f}s", id_, tuning_.respawnDelay);
    return ContactOutcome::Eaten;
}

void PursuerBehavior::respawn() {
    motion_.teleport(motion_.spawnCell());
    respawning_ = false;
    respawnRemaining_ = 0.0f;
    scared_ = false;
    plan_.clear();
    lastTarget_.reset();
    randomOverride_ = false;
    recomputeTimer_ = tuning_.recomputeInterval;
    randomTimer_ = rng_.nextFloat() * tuning_.randomDecisionInterval;
    leftHome_ = !tuning_.home.contains(motion_.currentCell());
    applySpeed();
}

void PursuerBehavior::finishRespawn() {
    respawning_ = false;
    respawnRemaining_ = 0.0f;
    scared_ = false;
    plan_.clear();
    recomputeTimer_ = tuning_.recomputeInterval;
    leftHome_ = !tuning_.home.contains(motion_.currentCell());
    applySpeed();
    LogManager::debug("Pursuer {} active again", id_);
}

void PursuerBehavior::applySpeed() {
    motion_.setSpeed(scared_ ? tuning_.scaredSpeed : chaseSpeed_);
}

void PursuerBehavior::updateHomeFlag() {
    if (leftHome_ || tuning_.home.contains(motion_.currentCell())) return;
    leftHome_ = true;
    plan_.clear();
    recomputeTimer_ = tuning_.recomputeInterval;
}

void PursuerBehavior::recomputePlan() {
    if (randomOverride_) {
        randomOverride_ = false;
        plan_.clear();
        planRandomStep();
        return;
    }
    if (!leftHome_) {
        planEgress();
        return;
    }
    planChaseOrFlee();
}

void PursuerBehavior::planEgress() {
    GridCell origin = motion_.isMoving() ? motion_.targetCell() : motion_.currentCell();
    plan_.clear();
    PathResult result = findPath(grid_, origin, tuning_.homeExit, tuning_.maxSearchIterations, motion_.traversal());
    if (!result.path.empty()) {
        plan_.assign(result.path.begin(), result.path.end());
        return;
    }
    if (auto step = greedyStepToward(grid_, origin, tuning_.homeExit, motion_.traversal())) {
        plan_.push_back(*step);
    }
}

void PursuerBehavior::planChaseOrFlee() {
    GridCell origin = motion_.isMoving() ? motion_.targetCell() : motion_.currentCell();
    GridCell target = selectTarget().value_or(origin);

    if (scared_) {
        plan_.clear();
        lastTarget_ = target;
        if (auto step = fleeStepFrom(grid_, origin, target, motion_.traversal())) {
            plan_.push_back(*step);
        }
        return;
    }

    if (lastTarget_ && *lastTarget_ == target && !plan_.empty()) {
        return;
    }
    lastTarget_ = target;
    plan_.clear();

    PathResult result = findPath(grid_, origin, target, tuning_.maxSearchIterations, motion_.traversal());
    if (result.reachedGoal) {
        plan_.assign(result.path.begin(), result.path.end());
        // Already beside the target: close the last step directly
        if (plan_.empty() && isAdjacent(origin, target) && grid_.isWalkable(target, motion_.traversal())) {
            plan_.push_back(target);
        }
        return;
    }
    if (auto step = greedyStepToward(grid_, origin, target, motion_.traversal())) {
        plan_.push_back(*step);
    }
}

std::optional<GridCell> PursuerBehavior::selectTarget() const {
    const GridCell from = motion_.currentCell();
    const EntityMotion* best = nullptr;
    float bestDistance = 0.0f;
    for (const EntityMotion* player : players_) {
        if (!player || !player->alive()) continue;
        float d = cellDistance(from, player->currentCell());
        if (!best || d < bestDistance) {
            best = player;
            bestDistance = d;
        }
    }
    if (best) return best->currentCell();
    return lastTarget_;
}

void PursuerBehavior::followPlan() {
    if (plan_.empty()) {
        planRandomStep();
        if (plan_.empty()) return;
    }

    const GridCell current = motion_.currentCell();
    const GridCell next = plan_.front();
    if (!isAdjacent(current, next) || !grid_.isWalkable(next, motion_.traversal())) {
        LogManager::debug("Pursuer {}: stale plan step ({},{}) from ({},{}), replanning",
                          id_, next.x, next.y, current.x, current.y);
        plan_.clear();
        recomputeTimer_ = tuning_.recomputeInterval;
        return;
    }
    plan_.pop_front();
    motion_.beginMove(next - current);
}

void PursuerBehavior::planRandomStep() {
    GridCell origin = motion_.isMoving() ? motion_.targetCell() : motion_.currentCell();
    auto neighbors = grid_.walkableNeighbors(origin, motion_.traversal());
    if (neighbors.empty()) return;
    int index = rng_.nextInt(0, static_cast<int>(neighbors.size()) - 1);
    plan_.push_back(neighbors[static_cast<std::size_t>(index)]);
}

} // namespace pacduo::sim
