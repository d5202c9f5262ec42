#pragma once
#include "pacduo/grid_cell.h"
#include "sim/EntityMotion.h"
#include <vector>

namespace pacduo::sim {

struct TunnelPair {
    GridCell a{};
    GridCell b{};
};

// Side tunnels: entering one mouth puts the entity on the other, direction kept.
// A pair rests for `cooldown` seconds after each use.
class WrapTunnels {
public:
    WrapTunnels(std::vector<TunnelPair> pairs, float cooldown);

    void tick(float dt);

    // Call when `motion` has just entered a cell. Returns true if it wrapped.
    bool tryWrap(EntityMotion& motion);

    void reset();

    const std::vector<TunnelPair>& pairs() const { return pairs_; }

private:
    std::vector<TunnelPair> pairs_{};
    std::vector<float> resting_{};
    float cooldown_{0.5f};
};

} // namespace pacduo::sim
