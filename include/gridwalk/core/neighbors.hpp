#pragma once

#include "gridwalk/core/grid.hpp"
#include <array>
#include <span>
#include <ranges>
#include <vector>

namespace gridwalk::core {

// Order matters: it is the tie-break for the path planner.
inline constexpr std::array<Cell, 4> kFourWay{{
    {0, 1},   // down
    {1, 0},   // right
    {-1, 0},  // left
    {0, -1}   // up
}};

inline constexpr std::array<Cell, 8> kEightWay{{
    {0, 1}, {1, 0}, {-1, 0}, {0, -1},
    {1, 1}, {-1, 1}, {1, -1}, {-1, -1}
}};

// Lazy view over the in-bounds cells adjacent to `cell`, in offset order.
// The grid and the offsets must outlive the view.
inline auto neighbors(const Grid& grid, Cell cell, std::span<const Cell> offsets) {
    return offsets
        | std::views::transform([cell](const Cell& d) { return Cell{cell.x + d.x, cell.y + d.y}; })
        | std::views::filter([&grid](const Cell& c) { return grid.in_bounds(c); });
}

std::vector<Cell> collect_neighbors(const Grid& grid, const Cell& cell,
                                    std::span<const Cell> offsets);

} // namespace gridwalk::core
