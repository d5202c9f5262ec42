#pragma once
#include "sim/PlayerSlot.h"
#include <array>

namespace pacduo::sim {

// Per-match aggregate. Mutated only by MatchOrchestrator.
// pelletsCollected <= totalPellets, lives >= 0, and the swap window and swap
// cooldown are never active together.
struct MatchState {
    int lives{3};
    int currentLevel{1};
    std::array<int, 2> scores{0, 0};
    int highScore{0};

    int totalPellets{0};
    int pelletsCollected{0};

    bool powerUpActive{false};
    float powerUpRemaining{0.0f};

    bool swapWindowActive{false};
    PlayerSlot swapInitiator{PlayerSlot::One};
    float swapWindowRemaining{0.0f};

    bool swapOnCooldown{false};
    float swapCooldownRemaining{0.0f};

    bool transitioningLevel{false};
    float transitionRemaining{0.0f};

    bool gameOver{false};

    int score(PlayerSlot slot) const { return scores[slotIndex(slot)]; }
    int combinedScore() const { return scores[0] + scores[1]; }
};

} // namespace pacduo::sim
