#pragma once
#include "pacduo/status_codes.h"
#include "sim/GridModel.h"
#include <optional>
#include <string>
#include <vector>

namespace pacduo::sim {

// ASCII maze: '#' wall, '.' or ' ' open floor, '-' home gate.
// The first text line is the top row of the grid.
class MazeLayout {
public:
    static std::optional<MazeLayout> parse(const std::vector<std::string>& lines, StatusCode* status = nullptr);
    static std::optional<MazeLayout> loadFile(const std::string& path, StatusCode* status = nullptr);

    // Compiled-in 32x31 two player maze.
    static MazeLayout builtIn();

    int width() const { return width_; }
    int height() const { return height_; }
    const std::vector<CellKind>& cells() const { return cells_; }

    GridModel toGrid(float cellSize) const;

private:
    MazeLayout() = default;

    int width_{0};
    int height_{0};
    std::vector<CellKind> cells_{};
};

// Loads `path` when non-empty, otherwise (or on failure, logged) the built-in maze.
MazeLayout loadMazeOrBuiltIn(const std::string& path);

} // namespace pacduo::sim
