#include "sim/WrapTunnels.h"
#include <algorithm>

namespace pacduo::sim {

WrapTunnels::WrapTunnels(std::vector<TunnelPair> pairs, float cooldown)
    : pairs_(std::move(pairs)),
      resting_(pairs_.size(), 0.0f),
      cooldown_(std::max(0.0f, cooldown)) {}

void WrapTunnels::tick(float dt) {
    for (float& r : resting_) {
        r = std::max(0.0f, r - dt);
    }
}

bool WrapTunnels::tryWrap(EntityMotion& motion) {
    if (motion.isMoving()) return false;
    const GridCell cell = motion.currentCell();
    for (std::size_t i = 0; i < pairs_.size(); ++i) {
        const TunnelPair& pair = pairs_[i];
        if (!(cell == pair.a) && !(cell == pair.b)) continue;
        if (resting_[i] > 0.0f) return false;
        motion.teleport(cell == pair.a ? pair.b : pair.a, true);
        resting_[i] = cooldown_;
        return true;
    }
    return false;
}

void WrapTunnels::reset() {
    std::fill(resting_.begin(), resting_.end(), 0.0f);
}

} // namespace pacduo::sim
