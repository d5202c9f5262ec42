#include "sim/MazeLayout.h"
#include "services/logger/LogManager.h"
#include <array>
#include <filesystem>
#include <fstream>

namespace pacduo::sim {

namespace {

using logging::LogManager;

constexpr std::array<const char*, 31> kBuiltInMaze = {
    "################################",
    "###............##............###",
    "###.####.#####.##.#####.####.###",
    "###.####.#####.##.#####.####.###",
    "###.####.#####.##.#####.####.###",
    "###..........................###",
    "###.####.##.########.##.####.###",
    "###.####.##.########.##.####.###",
    "###......##....##....##......###",
    "########.#####.##.#####.########",
    "########.#####.##.#####.########",
    "########.##..........##.########",
    "########.##.###--###.##.########",
    "########.##.#......#.##.########",
    "............#......#............",
    "########.##.#......#.##.########",
    "########.##.########.##.########",
    "########.##..........##.########",
    "########.##.########.##.########",
    "########.##.########.##.########",
    "###............##............###",
    "###.####.#####.##.#####.####.###",
    "###.####.#####.##.#####.####.###",
    "###...##................##...###",
    "#####.##.##.########.##.##.#####",
    "#####.##.##.########.##.##.#####",
    "###......##....##....##......###",
    "###.##########.##.##########.###",
    "###.##########.##.##########.###",
    "###..........................###",
    "################################"
};

bool toCellKind(char c, CellKind& out) {
    switch (c) {
        case '#': out = CellKind::Blocked; return true;
        case '.':
        case ' ': out = CellKind::Open; return true;
        case '-': out = CellKind::Gate; return true;
        default: return false;
    }
}

void setStatus(StatusCode* status, StatusCode value) {
    if (status) *status = value;
}

} // namespace

std::optional<MazeLayout> MazeLayout::parse(const std::vector<std::string>& lines, StatusCode* status) {
    if (lines.empty() || lines.front().empty()) {
        setStatus(status, StatusCode::BAD_FORMAT);
        return std::nullopt;
    }
    const int width = static_cast<int>(lines.front().size());
    const int height = static_cast<int>(lines.size());

    MazeLayout layout;
    layout.width_ = width;
    layout.height_ = height;
    layout.cells_.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height), CellKind::Blocked);

    for (int row = 0; row < height; ++row) {
        const std::string& line = lines[static_cast<std::size_t>(row)];
        if (static_cast<int>(line.size()) != width) {
            LogManager::warn("MazeLayout: row {} has width {}, expected {}", row, line.size(), width);
            setStatus(status, StatusCode::BAD_FORMAT);
            return std::nullopt;
        }
        const int y = height - 1 - row;
        for (int x = 0; x < width; ++x) {
            CellKind kind;
            if (!toCellKind(line[static_cast<std::size_t>(x)], kind)) {
                LogManager::warn("MazeLayout: unexpected character '{}' at row {} column {}", line[static_cast<std::size_t>(x)], row, x);
                setStatus(status, StatusCode::BAD_FORMAT);
                return std::nullopt;
            }
            layout.cells_[static_cast<std::size_t>(y * width + x)] = kind;
        }
    }
    setStatus(status, StatusCode::OK);
    return layout;
}

std::optional<MazeLayout> MazeLayout::loadFile(const std::string& path, StatusCode* status) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        setStatus(status, StatusCode::NOT_FOUND);
        return std::nullopt;
    }
    std::ifstream in(path);
    if (!in) {
        setStatus(status, StatusCode::IO_ERROR);
        return std::nullopt;
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    // Trailing blank lines are not rows
    while (!lines.empty() && lines.back().empty()) lines.pop_back();
    return parse(lines, status);
}

MazeLayout MazeLayout::builtIn() {
    std::vector<std::string> lines(kBuiltInMaze.begin(), kBuiltInMaze.end());
    auto layout = parse(lines);
    return layout ? *layout : MazeLayout{};
}

GridModel MazeLayout::toGrid(float cellSize) const {
    return GridModel(width_, height_, cells_, cellSize);
}

MazeLayout loadMazeOrBuiltIn(const std::string& path) {
    if (path.empty()) {
        return MazeLayout::builtIn();
    }
    StatusCode status = StatusCode::OK;
    auto layout = MazeLayout::loadFile(path, &status);
    if (!layout) {
        LogManager::warn("Maze '{}' could not be loaded ({}), using built-in maze", path, to_string(status));
        return MazeLayout::builtIn();
    }
    LogManager::info("Maze '{}' loaded ({}x{})", path, layout->width(), layout->height());
    return *layout;
}

} // namespace pacduo::sim
