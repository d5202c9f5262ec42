#pragma once
#include "pacduo/grid_cell.h"
#include "services/persistence/HighScoreStore.h"
#include "sim/EntityMotion.h"
#include "sim/GameSettings.h"
#include "sim/GridModel.h"
#include "sim/MatchOrchestrator.h"
#include "sim/PelletField.h"
#include "sim/PlayerController.h"
#include "sim/PlayerSlot.h"
#include "sim/PursuerBehavior.h"
#include "sim/RandomSource.h"
#include "sim/WrapTunnels.h"
#include <array>
#include <memory>
#include <vector>

namespace pacduo::sim {

struct PlayerInput {
    GridCell direction{};
    bool swapRequested{false};
};

using PlayerInputs = std::array<PlayerInput, 2>;

// Owns every entity of one match and runs the per-tick order:
// timers, swap requests, motion, tunnels, pellet pickup, contacts.
class MatchWorld {
public:
    // `grid` and `scoreStore` must outlive the world. A null rng uses a
    // raylib-backed source seeded from settings.randomSeed.
    MatchWorld(const GridModel& grid, const GameSettings& settings, persistence::ScoreStore& scoreStore,
               std::unique_ptr<RandomSource> rng = nullptr);

    MatchWorld(const MatchWorld&) = delete;
    MatchWorld& operator=(const MatchWorld&) = delete;

    void start();
    void step(float dt, const PlayerInputs& inputs);
    void restart();

    const GridModel& grid() const { return grid_; }
    const GameSettings& settings() const { return settings_; }
    const MatchState& state() const { return orchestrator_->state(); }
    MatchOrchestrator& orchestrator() { return *orchestrator_; }

    EntityMotion& player(PlayerSlot slot) { return *players_[slotIndex(slot)]; }
    const EntityMotion& player(PlayerSlot slot) const { return *players_[slotIndex(slot)]; }
    std::size_t pursuerCount() const { return pursuers_.size(); }
    PursuerBehavior& pursuer(std::size_t index) { return *pursuers_[index]; }
    const PursuerBehavior& pursuer(std::size_t index) const { return *pursuers_[index]; }
    const PelletField& pellets() const { return *pellets_; }
    PelletField& pellets() { return *pellets_; }
    const WrapTunnels& tunnels() const { return tunnels_; }

    // Same cell, or crossing the same edge head-on mid-move.
    static bool inContact(const EntityMotion& a, const EntityMotion& b);

private:
    void movePlayers(float dt, const PlayerInputs& inputs);
    void movePursuers(float dt);
    void collectPellets();
    void resolveContacts();
    GridCell checkedSpawn(GridCell cell, Traversal traversal, const char* what) const;

    const GridModel& grid_;
    GameSettings settings_;
    std::unique_ptr<RandomSource> rng_;
    std::array<std::unique_ptr<EntityMotion>, 2> players_{};
    std::array<std::unique_ptr<PlayerController>, 2> controllers_{};
    std::vector<std::unique_ptr<EntityMotion>> pursuerBodies_{};
    std::vector<std::unique_ptr<PursuerBehavior>> pursuers_{};
    std::unique_ptr<PelletField> pellets_{};
    WrapTunnels tunnels_;
    std::unique_ptr<MatchOrchestrator> orchestrator_{};
};

} // namespace pacduo::sim
