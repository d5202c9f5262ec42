#include "sim/MatchOrchestrator.h"
#include "services/logger/LogManager.h"
#include <algorithm>
#include <utility>

namespace pacduo::sim {

using logging::LogManager;

MatchOrchestrator::MatchOrchestrator(const MatchRules& rules,
                                     std::array<EntityMotion*, 2> players,
                                     std::vector<PursuerBehavior*> pursuers,
                                     PelletSpawner& spawner,
                                     persistence::ScoreStore& scoreStore)
    : rules_(rules),
      players_(players),
      pursuers_(std::move(pursuers)),
      spawner_(spawner),
      scoreStore_(scoreStore) {}

float MatchOrchestrator::pursuerSpeedForLevel(int level) const {
    return rules_.pursuerBaseSpeed + rules_.speedIncreasePerLevel * static_cast<float>(std::max(0, level - 1));
}

void MatchOrchestrator::startMatch() {
    state_ = MatchState{};
    state_.lives = std::max(0, rules_.startingLives);
    state_.currentLevel = 1;
    state_.highScore = std::max(0, scoreStore_.readHighScore());

    const float speed = pursuerSpeedForLevel(state_.currentLevel);
    for (PursuerBehavior* pursuer : pursuers_) {
        pursuer->setChaseSpeed(speed);
        pursuer->respawn();
    }
    for (EntityMotion* p : players_) {
        p->teleport(p->spawnCell());
        p->revive();
    }
    LogManager::info("Match started: {} lives, high score {}", state_.lives, state_.highScore);
    beginLevel();
}

void MatchOrchestrator::restartMatch() {
    LogManager::info("Match restart requested");
    startMatch();
    emit(MatchEventType::MatchRestarted);
}

void MatchOrchestrator::beginLevel() {
    spawner_.clearPellets();
    spawner_.spawnPellets();
    recountPellets();
    LogManager::info("Level {} started with {} pellets", state_.currentLevel, state_.totalPellets);
    emit(MatchEventType::LevelStarted, 0, state_.totalPellets);

    if (state_.totalPellets == 0) {
        LogManager::error("Level {} spawned no pellets, treating it as complete", state_.currentLevel);
        beginLevelTransition();
    }
}

void MatchOrchestrator::recountPellets() {
    state_.totalPellets = spawner_.countLive(PelletKind::Regular) + spawner_.countLive(PelletKind::Power);
    state_.pelletsCollected = 0;
}

void MatchOrchestrator::tickTimers(float dt) {
    if (state_.gameOver) return;

    if (state_.transitioningLevel) {
        state_.transitionRemaining -= dt;
        if (state_.transitionRemaining <= 0.0f) {
            advanceLevel();
        }
        return;
    }

    if (state_.powerUpActive) {
        state_.powerUpRemaining -= dt;
        if (state_.powerUpRemaining <= 0.0f) {
            endPowerUp();
        }
    }

    if (state_.swapWindowActive) {
        state_.swapWindowRemaining -= dt;
        if (state_.swapWindowRemaining <= 0.0f) {
            LogManager::debug("Swap window from player {} expired", slotNumber(state_.swapInitiator));
            closeSwapWindow(true);
        }
    } else if (state_.swapOnCooldown) {
        state_.swapCooldownRemaining -= dt;
        if (state_.swapCooldownRemaining <= 0.0f) {
            state_.swapOnCooldown = false;
            state_.swapCooldownRemaining = 0.0f;
        }
    }
}

void MatchOrchestrator::onPelletCollected(PlayerSlot player, PelletKind kind) {
    if (!gameplayActive()) return;
    if (state_.totalPellets <= 0) {
        LogManager::warn("Pellet collected by player {} on a level without pellets, ignored", slotNumber(player));
        return;
    }

    ++state_.pelletsCollected;
    const bool power = kind == PelletKind::Power;
    const int points = power ? rules_.powerPoints : rules_.regularPoints;
    addScore(player, points);
    emit(power ? MatchEventType::PowerPelletCollected : MatchEventType::PelletCollected, slotNumber(player), points);

    if (power) {
        startPowerUp();
        // Power pellets also make the swap available again
        state_.swapOnCooldown = false;
        state_.swapCooldownRemaining = 0.0f;
    }

    if (state_.pelletsCollected == state_.totalPellets) {
        beginLevelTransition();
    }
}

void MatchOrchestrator::onPursuerEaten(PlayerSlot player, int pursuerId) {
    if (!gameplayActive()) return;
    addScore(player, rules_.pursuerEatenPoints);
    LogManager::debug("Player {} ate pursuer {}", slotNumber(player), pursuerId);
    emit(MatchEventType::PursuerEaten, slotNumber(player), rules_.pursuerEatenPoints,
         "pursuer " + std::to_string(pursuerId));
}

void MatchOrchestrator::onPlayerCaught(PlayerSlot slot) {
    if (!gameplayActive()) return;
    EntityMotion& caught = player(slot);
    if (!caught.alive()) return;

    emit(MatchEventType::PlayerHit, slotNumber(slot), state_.lives);
    if (state_.lives > 0) {
        --state_.lives;
        respawnPlayer(slot);
        LogManager::info("Player {} caught, {} lives left", slotNumber(slot), state_.lives);
        return;
    }

    caught.die();
    LogManager::info("Player {} is out", slotNumber(slot));
    emit(MatchEventType::PlayerEliminated, slotNumber(slot));

    const PlayerSlot other = otherSlot(slot);
    if (player(other).alive()) {
        LogManager::info("Player {} is the last one standing", slotNumber(other));
        return;
    }

    closeSwapWindow(false);
    state_.gameOver = true;
    updateHighScore();
    LogManager::info("Game over at level {}, combined score {}", state_.currentLevel, state_.combinedScore());
    emit(MatchEventType::GameOver, 0, state_.combinedScore());
}

void MatchOrchestrator::initiateSwap(PlayerSlot slot) {
    if (!gameplayActive()) return;
    if (state_.swapOnCooldown) return;

    if (!state_.swapWindowActive) {
        state_.swapWindowActive = true;
        state_.swapInitiator = slot;
        state_.swapWindowRemaining = rules_.swapWindowDuration;
        emit(MatchEventType::SwapWindowOpened, slotNumber(slot));
        return;
    }
    // The other player has to answer
    if (state_.swapInitiator == slot) return;
    executeSwap();
}

void MatchOrchestrator::executeSwap() {
    EntityMotion& one = player(PlayerSlot::One);
    EntityMotion& two = player(PlayerSlot::Two);
    SwapMode mode = SwapMode::Normal;

    if (one.alive() != two.alive()) {
        mode = SwapMode::LastOneStanding;
        EntityMotion& living = one.alive() ? one : two;
        EntityMotion& fallen = one.alive() ? two : one;
        const GridCell cell = living.currentCell();
        fallen.teleport(cell);
        fallen.revive();
        living.teleport(cell);
        living.die();
        LogManager::info("Player {} tagged in at ({},{})",
                         one.alive() ? 1 : 2, cell.x, cell.y);
    } else {
        const GridCell a = one.currentCell();
        const GridCell b = two.currentCell();
        one.teleport(b);
        two.teleport(a);
        LogManager::debug("Players swapped positions");
    }

    const PlayerSlot completer = otherSlot(state_.swapInitiator);
    closeSwapWindow(false);
    state_.swapOnCooldown = true;
    state_.swapCooldownRemaining = rules_.swapCooldown;
    emit(MatchEventType::SwapExecuted, slotNumber(completer), static_cast<int>(mode));
}

void MatchOrchestrator::closeSwapWindow(bool emitEvent) {
    if (!state_.swapWindowActive) return;
    state_.swapWindowActive = false;
    state_.swapWindowRemaining = 0.0f;
    if (emitEvent) {
        emit(MatchEventType::SwapWindowClosed, slotNumber(state_.swapInitiator));
    }
}

void MatchOrchestrator::startPowerUp() {
    state_.powerUpActive = true;
    state_.powerUpRemaining = rules_.powerUpDuration;
    for (PursuerBehavior* pursuer : pursuers_) {
        pursuer->setScared(true);
    }
    emit(MatchEventType::PowerUpStarted, 0, static_cast<int>(rules_.powerUpDuration));
}

void MatchOrchestrator::endPowerUp() {
    if (!state_.powerUpActive) return;
    state_.powerUpActive = false;
    state_.powerUpRemaining = 0.0f;
    for (PursuerBehavior* pursuer : pursuers_) {
        pursuer->setScared(false);
    }
    emit(MatchEventType::PowerUpEnded);
}

void MatchOrchestrator::beginLevelTransition() {
    closeSwapWindow(true);
    state_.transitioningLevel = true;
    state_.transitionRemaining = rules_.levelTransitionDelay;
    LogManager::info("Level {} complete", state_.currentLevel);
    emit(MatchEventType::LevelComplete, 0, state_.currentLevel);
}

void MatchOrchestrator::advanceLevel() {
    state_.transitioningLevel = false;
    state_.transitionRemaining = 0.0f;
    spawner_.clearPellets();
    ++state_.currentLevel;
    if (state_.lives < rules_.maxLives) {
        ++state_.lives;
    }
    endPowerUp();

    const float speed = pursuerSpeedForLevel(state_.currentLevel);
    for (PursuerBehavior* pursuer : pursuers_) {
        pursuer->setChaseSpeed(speed);
        pursuer->respawn();
    }
    for (EntityMotion* p : players_) {
        p->teleport(p->spawnCell());
    }
    LogManager::debug("Pursuer speed for level {}: {:.2f}", state_.currentLevel, speed);
    beginLevel();
}

void MatchOrchestrator::respawnPlayer(PlayerSlot slot) {
    EntityMotion& p = player(slot);
    p.teleport(p.spawnCell());
    p.revive();
}

void MatchOrchestrator::addScore(PlayerSlot slot, int points) {
    state_.scores[slotIndex(slot)] += points;
    updateHighScore();
}

void MatchOrchestrator::updateHighScore() {
    const int combined = state_.combinedScore();
    if (combined <= state_.highScore) return;
    state_.highScore = combined;
    StatusCode status = scoreStore_.writeHighScore(combined);
    if (status != StatusCode::OK) {
        LogManager::warn("High score {} not persisted: {}", combined, to_string(status));
    }
    emit(MatchEventType::HighScoreChanged, 0, combined);
}

std::uint32_t MatchOrchestrator::subscribe(MatchEventSink* sink) {
    if (!sink) return 0;
    std::uint32_t id = nextSubscriptionId_++;
    subscriptions_.push_back(MatchEventSubscription{id, sink, true});
    return id;
}

void MatchOrchestrator::unsubscribe(std::uint32_t id) {
    for (auto& sub : subscriptions_) {
        if (sub.id == id) sub.active = false;
    }
    subscriptions_.erase(std::remove_if(subscriptions_.begin(), subscriptions_.end(),
                                        [](const MatchEventSubscription& s) { return !s.active; }),
                         subscriptions_.end());
}

void MatchOrchestrator::emit(MatchEventType type, int playerNumber, int value, std::string details) {
    MatchEvent event{type, playerNumber, state_.currentLevel, value, std::move(details)};
    // Index loop: a sink may subscribe while being notified
    for (std::size_t i = 0; i < subscriptions_.size(); ++i) {
        if (subscriptions_[i].active && subscriptions_[i].sink) {
            subscriptions_[i].sink->onMatchEvent(event);
        }
    }
}

} // namespace pacduo::sim
