#pragma once
#include "pacduo/match_events.h"
#include "services/persistence/HighScoreStore.h"
#include "sim/EntityMotion.h"
#include "sim/MatchState.h"
#include "sim/PelletField.h"
#include "sim/PlayerSlot.h"
#include "sim/PursuerBehavior.h"
#include <array>
#include <cstdint>
#include <vector>

namespace pacduo::sim {

struct MatchRules {
    int startingLives{3};
    int maxLives{5};
    float powerUpDuration{10.0f};
    float swapWindowDuration{3.0f};
    float swapCooldown{10.0f};
    float levelTransitionDelay{2.0f};
    float pursuerBaseSpeed{3.0f};
    float speedIncreasePerLevel{0.4f};
    int regularPoints{10};
    int powerPoints{50};
    int pursuerEatenPoints{200};
};

enum class SwapMode { Normal = 0, LastOneStanding = 1 };

// Authoritative match state machine: scoring, power-up, swap window and
// cooldown, shared lives, level progression and game over.
// Holds non-owning pointers to the players, pursuers, spawner and score store.
class MatchOrchestrator {
public:
    MatchOrchestrator(const MatchRules& rules,
                      std::array<EntityMotion*, 2> players,
                      std::vector<PursuerBehavior*> pursuers,
                      PelletSpawner& spawner,
                      persistence::ScoreStore& scoreStore);

    // Fresh MatchState, high score read from the store, first level spawned.
    void startMatch();
    // Full reset of state and entities; the only way out of game over.
    void restartMatch();

    // Power-up, swap and level-transition countdowns. Runs first in a tick.
    void tickTimers(float dt);

    void onPelletCollected(PlayerSlot player, PelletKind kind);
    void onPursuerEaten(PlayerSlot player, int pursuerId);
    void onPlayerCaught(PlayerSlot player);
    void initiateSwap(PlayerSlot player);

    // False while transitioning between levels or after game over.
    bool gameplayActive() const { return !state_.gameOver && !state_.transitioningLevel; }

    const MatchState& state() const { return state_; }
    const MatchRules& rules() const { return rules_; }
    float pursuerSpeedForLevel(int level) const;

    std::uint32_t subscribe(MatchEventSink* sink);
    void unsubscribe(std::uint32_t id);

private:
    void beginLevel();
    void recountPellets();
    void beginLevelTransition();
    void advanceLevel();
    void startPowerUp();
    void endPowerUp();
    void closeSwapWindow(bool emitEvent);
    void executeSwap();
    void respawnPlayer(PlayerSlot player);
    void addScore(PlayerSlot player, int points);
    void updateHighScore();
    void emit(MatchEventType type, int player = 0, int value = 0, std::string details = {});

    EntityMotion& player(PlayerSlot slot) { return *players_[slotIndex(slot)]; }

    MatchRules rules_{};
    std::array<EntityMotion*, 2> players_{};
    std::vector<PursuerBehavior*> pursuers_{};
    PelletSpawner& spawner_;
    persistence::ScoreStore& scoreStore_;
    MatchState state_{};

    std::vector<MatchEventSubscription> subscriptions_{};
    std::uint32_t nextSubscriptionId_{1};
};

} // namespace pacduo::sim
