#include "gridwalk/core/neighbors.hpp"

namespace gridwalk::core {

std::vector<Cell> collect_neighbors(const Grid& grid, const Cell& cell,
                                    std::span<const Cell> offsets) {
    std::vector<Cell> result;
    for (const auto& next : neighbors(grid, cell, offsets)) {
        result.push_back(next);
    }
    return result;
}

} // namespace gridwalk::core
