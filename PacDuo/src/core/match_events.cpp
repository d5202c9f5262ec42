#include "pacduo/match_events.h"

namespace pacduo {

const char* to_string(MatchEventType type) noexcept {
    switch (type) {
        case MatchEventType::LevelStarted: return "LevelStarted";
        case MatchEventType::PelletCollected: return "PelletCollected";
        case MatchEventType::PowerPelletCollected: return "PowerPelletCollected";
        case MatchEventType::PowerUpStarted: return "PowerUpStarted";
        case MatchEventType::PowerUpEnded: return "PowerUpEnded";
        case MatchEventType::SwapWindowOpened: return "SwapWindowOpened";
        case MatchEventType::SwapWindowClosed: return "SwapWindowClosed";
        case MatchEventType::SwapExecuted: return "SwapExecuted";
        case MatchEventType::LevelComplete: return "LevelComplete";
        case MatchEventType::PursuerEaten: return "PursuerEaten";
        case MatchEventType::PlayerHit: return "PlayerHit";
        case MatchEventType::PlayerEliminated: return "PlayerEliminated";
        case MatchEventType::HighScoreChanged: return "HighScoreChanged";
        case MatchEventType::GameOver: return "GameOver";
        case MatchEventType::MatchRestarted: return "MatchRestarted";
        default: return "Unknown";
    }
}

} // namespace pacduo
