#include "sim/MatchWorld.h"
#include "services/logger/LogManager.h"

namespace pacduo::sim {

using logging::LogManager;

MatchWorld::MatchWorld(const GridModel& grid, const GameSettings& settings, persistence::ScoreStore& scoreStore,
                       std::unique_ptr<RandomSource> rng)
    : grid_(grid),
      settings_(settings),
      rng_(rng ? std::move(rng) : std::make_unique<RaylibRandomSource>(settings.randomSeed)),
      tunnels_(settings.tunnels.pairs, settings.tunnels.cooldown) {
    for (PlayerSlot slot : kPlayerSlots) {
        GridCell spawn = checkedSpawn(settings_.playerSpawns[slotIndex(slot)], Traversal::Player, "player spawn");
        players_[slotIndex(slot)] = std::make_unique<EntityMotion>(grid_, spawn, settings_.playerSpeed, Traversal::Player);
        controllers_[slotIndex(slot)] = std::make_unique<PlayerController>(*players_[slotIndex(slot)]);
    }

    std::vector<PursuerBehavior*> behaviors;
    int id = 0;
    for (const GridCell& cell : settings_.pursuerSpawns) {
        GridCell spawn = checkedSpawn(cell, Traversal::Pursuer, "pursuer spawn");
        auto& body = pursuerBodies_.emplace_back(
            std::make_unique<EntityMotion>(grid_, spawn, settings_.pursuer.baseSpeed, Traversal::Pursuer));
        auto& behavior = pursuers_.emplace_back(
            std::make_unique<PursuerBehavior>(id++, *body, settings_.pursuer, *rng_));
        behavior->setTargets(players_[0].get(), players_[1].get());
        behaviors.push_back(behavior.get());
    }

    pellets_ = std::make_unique<PelletField>(grid_, settings_.pellets, *rng_);
    orchestrator_ = std::make_unique<MatchOrchestrator>(
        settings_.match,
        std::array<EntityMotion*, 2>{players_[0].get(), players_[1].get()},
        std::move(behaviors), *pellets_, scoreStore);
}

GridCell MatchWorld::checkedSpawn(GridCell cell, Traversal traversal, const char* what) const {
    if (grid_.isWalkable(cell, traversal)) return cell;
    auto neighbors = grid_.walkableNeighbors(cell, traversal);
    if (!neighbors.empty()) {
        LogManager::warn("{} ({},{}) is blocked, using ({},{})", what, cell.x, cell.y, neighbors.front().x, neighbors.front().y);
        return neighbors.front();
    }
    LogManager::warn("{} ({},{}) is blocked and has no open neighbor", what, cell.x, cell.y);
    return cell;
}

void MatchWorld::start() {
    tunnels_.reset();
    orchestrator_->startMatch();
}

void MatchWorld::restart() {
    tunnels_.reset();
    orchestrator_->restartMatch();
}

void MatchWorld::step(float dt, const PlayerInputs& inputs) {
    orchestrator_->tickTimers(dt);

    for (PlayerSlot slot : kPlayerSlots) {
        if (inputs[slotIndex(slot)].swapRequested) {
            orchestrator_->initiateSwap(slot);
        }
    }

    if (!orchestrator_->gameplayActive()) return;

    tunnels_.tick(dt);
    movePlayers(dt, inputs);
    movePursuers(dt);
    collectPellets();
    resolveContacts();
}

void MatchWorld::movePlayers(float dt, const PlayerInputs& inputs) {
    for (PlayerSlot slot : kPlayerSlots) {
        EntityMotion& body = player(slot);
        if (!body.alive()) continue;
        PlayerController& controller = *controllers_[slotIndex(slot)];
        controller.setDesiredDirection(inputs[slotIndex(slot)].direction);
        if (controller.tick(dt)) {
            tunnels_.tryWrap(body);
        }
    }
}

void MatchWorld::movePursuers(float dt) {
    for (auto& behavior : pursuers_) {
        if (behavior->tick(dt)) {
            tunnels_.tryWrap(behavior->motion());
        }
    }
}

void MatchWorld::collectPellets() {
    for (PlayerSlot slot : kPlayerSlots) {
        EntityMotion& body = player(slot);
        if (!body.alive()) continue;
        while (auto pellet = pellets_->collectAt(body.currentCell(), slot)) {
            orchestrator_->onPelletCollected(slot, pellet->kind);
            if (!orchestrator_->gameplayActive()) return;
        }
    }
}

bool MatchWorld::inContact(const EntityMotion& a, const EntityMotion& b) {
    if (a.currentCell() == b.currentCell()) return true;
    return a.isMoving() && b.isMoving()
        && a.targetCell() == b.currentCell()
        && b.targetCell() == a.currentCell();
}

void MatchWorld::resolveContacts() {
    for (auto& behavior : pursuers_) {
        if (behavior->respawning()) continue;
        for (PlayerSlot slot : kPlayerSlots) {
            if (!orchestrator_->gameplayActive()) return;
            EntityMotion& body = player(slot);
            if (!body.alive() || !inContact(body, behavior->motion())) continue;

            ContactOutcome outcome = behavior->onPlayerContact();
            if (outcome == ContactOutcome::Eaten) {
                orchestrator_->onPursuerEaten(slot, behavior->id());
                break;
            }
            if (outcome == ContactOutcome::PlayerCaught) {
                orchestrator_->onPlayerCaught(slot);
            }
        }
    }
}

} // namespace pacduo::sim
