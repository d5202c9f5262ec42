#pragma once
#include "pacduo/grid_cell.h"
#include "sim/EntityMotion.h"
#include "sim/GridModel.h"
#include "sim/RandomSource.h"
#include <array>
#include <deque>
#include <optional>
#include <vector>

namespace pacduo::sim {

struct HomeArea {
    int minX{13};
    int maxX{18};
    int minY{15};
    int maxY{17};

    bool contains(GridCell cell) const {
        return cell.x >= minX && cell.x <= maxX && cell.y >= minY && cell.y <= maxY;
    }
};

struct PursuerTuning {
    float baseSpeed{3.0f};
    float scaredSpeed{2.5f};
    float recomputeInterval{0.3f};
    int maxSearchIterations{100};
    float randomDecisionInterval{3.0f};
    float randomDecisionChance{0.5f};
    float respawnDelay{6.0f};
    HomeArea home{};
    GridCell homeExit{16, 19};
};

enum class ContactOutcome { None, Eaten, PlayerCaught };

// Decision engine for one pursuer. Owns its plan; drives a non-owned EntityMotion.
class PursuerBehavior {
public:
    PursuerBehavior(int id, EntityMotion& motion, const PursuerTuning& tuning, RandomSource& rng);

    // Players this pursuer may chase. Either pointer may be null.
    void setTargets(const EntityMotion* playerOne, const EntityMotion* playerTwo);

    // Returns true when the pursuer entered a cell this tick.
    bool tick(float dt);

    void setScared(bool scared);
    // Level speed; applied whenever the pursuer is not scared.
    void setChaseSpeed(float cellsPerSecond);

    // Called when a living player shares a cell with this pursuer.
    ContactOutcome onPlayerContact();

    // Back to spawn, fully active, home egress re-armed.
    void respawn();

    int id() const { return id_; }
    bool scared() const { return scared_; }
    bool respawning() const { return respawning_; }
    float respawnRemaining() const { return respawnRemaining_; }
    bool leftHome() const { return leftHome_; }
    float chaseSpeed() const { return chaseSpeed_; }
    std::optional<GridCell> lastTarget() const { return lastTarget_; }

    // Copy of the queued cells; the plan itself is only consumed by tick().
    std::vector<GridCell> planSnapshot() const { return std::vector<GridCell>(plan_.begin(), plan_.end()); }

    EntityMotion& motion() { return motion_; }
    const EntityMotion& motion() const { return motion_; }

private:
    void updateHomeFlag();
    void recomputePlan();
    void planEgress();
    void planChaseOrFlee();
    std::optional<GridCell> selectTarget() const;
    void followPlan();
    void planRandomStep();
    void finishRespawn();
    void applySpeed();

    int id_{0};
    EntityMotion& motion_;
    const GridModel& grid_;
    PursuerTuning tuning_{};
    RandomSource& rng_;
    std::array<const EntityMotion*, 2> players_{nullptr, nullptr};

    std::deque<GridCell> plan_{};
    std::optional<GridCell> lastTarget_{};
    float chaseSpeed_{0.0f};
    float recomputeTimer_{0.0f};
    float randomTimer_{0.0f};
    float respawnRemaining_{0.0f};
    bool randomOverride_{false};
    bool scared_{false};
    bool respawning_{false};
    bool leftHome_{false};
};

} // namespace pacduo::sim
