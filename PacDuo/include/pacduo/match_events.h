#pragma once

// match_events.h
// Discrete events the match emits for presentation collaborators
// (HUD, audio cues, banners). Delivery is fire-and-forget.

#include <cstdint>
#include <string>

namespace pacduo {

enum class MatchEventType {
    LevelStarted,
    PelletCollected,
    PowerPelletCollected,
    PowerUpStarted,
    PowerUpEnded,
    SwapWindowOpened,
    SwapWindowClosed,
    SwapExecuted,
    LevelComplete,
    PursuerEaten,
    PlayerHit,
    PlayerEliminated,
    HighScoreChanged,
    GameOver,
    MatchRestarted
};

struct MatchEvent {
    MatchEventType type;
    int player{0};  // 1 or 2, 0 when not player-specific
    int level{0};
    int value{0};   // points, lives left, swap mode... depends on type
    std::string details{};
};

class MatchEventSink {
public:
    virtual ~MatchEventSink() = default;
    virtual void onMatchEvent(const MatchEvent& event) = 0;
};

struct MatchEventSubscription {
    std::uint32_t id{0};
    MatchEventSink* sink{nullptr};
    bool active{false};
};

const char* to_string(MatchEventType type) noexcept;

} // namespace pacduo
