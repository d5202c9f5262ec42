#pragma once
#include <array>
#include <cstddef>

namespace pacduo::sim {

enum class PlayerSlot { One = 0, Two = 1 };

inline constexpr std::array<PlayerSlot, 2> kPlayerSlots = {PlayerSlot::One, PlayerSlot::Two};

constexpr std::size_t slotIndex(PlayerSlot slot) { return static_cast<std::size_t>(slot); }
// 1-based number used in events and logs.
constexpr int slotNumber(PlayerSlot slot) { return static_cast<int>(slot) + 1; }
constexpr PlayerSlot otherSlot(PlayerSlot slot) { return slot == PlayerSlot::One ? PlayerSlot::Two : PlayerSlot::One; }

} // namespace pacduo::sim
