#pragma once
#include "pacduo/grid_cell.h"
#include "sim/GridModel.h"
#include "sim/PlayerSlot.h"
#include "sim/RandomSource.h"
#include <optional>
#include <vector>

namespace pacduo::sim {

enum class PelletKind { Regular, Power };

struct Pellet {
    GridCell cell{};
    PlayerSlot owner{PlayerSlot::One};
    PelletKind kind{PelletKind::Regular};
};

// Level-start collaborator. The orchestrator recounts live pellets after
// spawnPellets() instead of trusting a return value.
class PelletSpawner {
public:
    virtual ~PelletSpawner() = default;
    virtual void spawnPellets() = 0;
    virtual void clearPellets() = 0;
    virtual int countLive(PelletKind kind) const = 0;
};

struct PelletSettings {
    int regularPerPlayer{122};
    int minSpawnX{2};
    int maxSpawnX{29};
    GridCell exclusionCenter{16, 16};
    int exclusionRadius{4};
    std::vector<GridCell> powerCorners{{3, 29}, {28, 29}, {3, 1}, {28, 1}};
    int cornerSearchRadius{5};
};

class PelletField final : public PelletSpawner {
public:
    PelletField(const GridModel& grid, PelletSettings settings, RandomSource& rng);

    void spawnPellets() override;
    void clearPellets() override;
    int countLive(PelletKind kind) const override;

    // Removes and returns one pellet at `cell` owned by `owner`, if any.
    std::optional<Pellet> collectAt(GridCell cell, PlayerSlot owner);

    const std::vector<Pellet>& pellets() const { return pellets_; }

    // Cells eligible for regular pellets, in row-major order.
    std::vector<GridCell> candidateCells() const;

    // Nearest player-walkable cell by expanding square rings, up to radius.
    std::optional<GridCell> nearestWalkable(GridCell from, int radius) const;

private:
    void spawnPowerPellets(std::vector<GridCell>& taken);
    void spawnRegularPellets(std::vector<GridCell>& taken);

    const GridModel& grid_;
    PelletSettings settings_{};
    RandomSource& rng_;
    std::vector<Pellet> pellets_{};
};

} // namespace pacduo::sim
