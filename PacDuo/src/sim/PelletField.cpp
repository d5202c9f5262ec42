#include "sim/PelletField.h"
#include "services/logger/LogManager.h"
#include <algorithm>
#include <cstdlib>

namespace pacduo::sim {

using logging::LogManager;

PelletField::PelletField(const GridModel& grid, PelletSettings settings, RandomSource& rng)
    : grid_(grid), settings_(std::move(settings)), rng_(rng) {}

void PelletField::spawnPellets() {
    std::vector<GridCell> taken;
    spawnPowerPellets(taken);
    spawnRegularPellets(taken);
    LogManager::debug("Pellets spawned: {} regular, {} power",
                      countLive(PelletKind::Regular), countLive(PelletKind::Power));
}

void PelletField::clearPellets() {
    pellets_.clear();
}

int PelletField::countLive(PelletKind kind) const {
    return static_cast<int>(std::count_if(pellets_.begin(), pellets_.end(),
                                          [kind](const Pellet& p) { return p.kind == kind; }));
}

std::optional<Pellet> PelletField::collectAt(GridCell cell, PlayerSlot owner) {
    auto it = std::find_if(pellets_.begin(), pellets_.end(), [&](const Pellet& p) {
        return p.cell == cell && p.owner == owner;
    });
    if (it == pellets_.end()) return std::nullopt;
    Pellet pellet = *it;
    pellets_.erase(it);
    return pellet;
}

std::vector<GridCell> PelletField::candidateCells() const {
    std::vector<GridCell> out;
    const GridCell c = settings_.exclusionCenter;
    const int r = settings_.exclusionRadius;
    for (int y = 0; y < grid_.height(); ++y) {
        for (int x = settings_.minSpawnX; x <= settings_.maxSpawnX; ++x) {
            GridCell cell{x, y};
            if (!grid_.isWalkable(cell, Traversal::Player)) continue;
            if (std::abs(x - c.x) <= r && std::abs(y - c.y) <= r) continue;
            out.push_back(cell);
        }
    }
    return out;
}

std::optional<GridCell> PelletField::nearestWalkable(GridCell from, int radius) const {
    if (grid_.isWalkable(from, Traversal::Player)) return from;
    for (int ring = 1; ring <= radius; ++ring) {
        for (int dy = -ring; dy <= ring; ++dy) {
            for (int dx = -ring; dx <= ring; ++dx) {
                if (std::max(std::abs(dx), std::abs(dy)) != ring) continue;
                GridCell cell{from.x + dx, from.y + dy};
                if (grid_.isWalkable(cell, Traversal::Player)) return cell;
            }
        }
    }
    return std::nullopt;
}

void PelletField::spawnPowerPellets(std::vector<GridCell>& taken) {
    for (const GridCell& corner : settings_.powerCorners) {
        GridCell cell = corner;
        if (!grid_.isWalkable(corner, Traversal::Player)) {
            auto fallback = nearestWalkable(corner, settings_.cornerSearchRadius);
            if (!fallback) {
                LogManager::warn("Power pellet corner ({},{}) has no walkable cell within {}, skipped",
                                 corner.x, corner.y, settings_.cornerSearchRadius);
                continue;
            }
            LogManager::warn("Power pellet corner ({},{}) is blocked, using ({},{})",
                             corner.x, corner.y, fallback->x, fallback->y);
            cell = *fallback;
        }
        for (PlayerSlot owner : kPlayerSlots) {
            pellets_.push_back(Pellet{cell, owner, PelletKind::Power});
        }
        taken.push_back(cell);
    }
}

void PelletField::spawnRegularPellets(std::vector<GridCell>& taken) {
    std::vector<GridCell> pool = candidateCells();
    pool.erase(std::remove_if(pool.begin(), pool.end(), [&](const GridCell& cell) {
        return std::find(taken.begin(), taken.end(), cell) != taken.end();
    }), pool.end());

    const int wanted = std::max(0, settings_.regularPerPlayer) * static_cast<int>(kPlayerSlots.size());
    if (static_cast<int>(pool.size()) < wanted) {
        LogManager::warn("Only {} pellet cells available for {} regular pellets", pool.size(), wanted);
    }

    for (PlayerSlot owner : kPlayerSlots) {
        for (int i = 0; i < settings_.regularPerPlayer && !pool.empty(); ++i) {
            int pick = rng_.nextInt(0, static_cast<int>(pool.size()) - 1);
            GridCell cell = pool[static_cast<std::size_t>(pick)];
            pool[static_cast<std::size_t>(pick)] = pool.back();
            pool.pop_back();
            pellets_.push_back(Pellet{cell, owner, PelletKind::Regular});
            taken.push_back(cell);
        }
    }
}

} // namespace pacduo::sim
