#pragma once

// grid_cell.h
// Integer cell coordinates and the four unit directions used on the maze grid.
// GridCell doubles as a direction/offset (like a 2D integer vector).

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <functional>

namespace pacduo {

struct GridCell {
    int x{0};
    int y{0};

    constexpr GridCell operator+(GridCell o) const { return {x + o.x, y + o.y}; }
    constexpr GridCell operator-(GridCell o) const { return {x - o.x, y - o.y}; }
    constexpr GridCell operator-() const { return {-x, -y}; }
    constexpr bool operator==(const GridCell&) const = default;

    constexpr bool isZero() const { return x == 0 && y == 0; }
};

namespace dir {
// +y is "up" (grid row 0 is the bottom of the maze).
inline constexpr GridCell None{0, 0};
inline constexpr GridCell Up{0, 1};
inline constexpr GridCell Down{0, -1};
inline constexpr GridCell Left{-1, 0};
inline constexpr GridCell Right{1, 0};

// Enumeration order matters: neighbor lists and tie-breaks follow it.
inline constexpr std::array<GridCell, 4> kAll = {Up, Down, Left, Right};
} // namespace dir

inline bool isAdjacent(GridCell a, GridCell b) {
    int dx = std::abs(a.x - b.x);
    int dy = std::abs(a.y - b.y);
    return (dx == 1 && dy == 0) || (dx == 0 && dy == 1);
}

// Euclidean distance in cells.
inline float cellDistance(GridCell a, GridCell b) {
    float dx = static_cast<float>(a.x - b.x);
    float dy = static_cast<float>(a.y - b.y);
    return std::sqrt(dx * dx + dy * dy);
}

struct GridCellHash {
    std::size_t operator()(const GridCell& c) const noexcept {
        return std::hash<long long>{}((static_cast<long long>(c.x) << 32) ^ static_cast<unsigned int>(c.y));
    }
};

} // namespace pacduo
