#include "gridwalk/core/planner.hpp"
#include "gridwalk/core/neighbors.hpp"
#include <queue>
#include <unordered_map>
#include <algorithm>

namespace gridwalk::core {

namespace {

bool is_passable(Terrain terrain) noexcept {
    return terrain == Terrain::Empty || terrain == Terrain::Destination;
}

Path reconstruct_path(
    const std::unordered_map<Cell, std::optional<Cell>, CellHash>& came_from,
    const Cell& goal
) {
    Path path;
    std::optional<Cell> current = goal;

    while (current) {
        path.push_back(*current);
        current = came_from.at(*current);
    }

    std::reverse(path.begin(), path.end());
    return path;
}

} // namespace

std::optional<Path> find_path_to_nearest_destination(const Grid& grid, const Cell& start) {
    std::unordered_map<Cell, std::optional<Cell>, CellHash> came_from;
    std::queue<Cell> frontier;

    came_from.emplace(start, std::nullopt);
    Cell current = start;

    while (grid.terrain_at(current) != Terrain::Destination) {
        for (const auto& next : neighbors(grid, current, kFourWay)) {
            if (!is_passable(grid.terrain_at(next)) || came_from.contains(next)) {
                continue;
            }
            came_from.emplace(next, current);
            frontier.push(next);
        }

        if (frontier.empty()) {
            return std::nullopt;
        }

        current = frontier.front();
        frontier.pop();
    }

    return reconstruct_path(came_from, current);
}

std::optional<Cell> next_step_toward_nearest_destination(const Grid& grid, const Cell& start) {
    auto path = find_path_to_nearest_destination(grid, start);
    if (!path) {
        return std::nullopt;
    }

    return path->size() > 1 ? (*path)[1] : path->front();
}

std::optional<int> hop_distance_to_nearest_destination(const Grid& grid, const Cell& start) {
    auto path = find_path_to_nearest_destination(grid, start);
    if (!path) {
        return std::nullopt;
    }
    return static_cast<int>(path->size()) - 1;
}

Cell random_step(const Grid& grid, const Cell& from, std::mt19937_64& rng) {
    std::vector<Cell> candidates;
    for (const auto& next : neighbors(grid, from, kFourWay)) {
        if (grid.terrain_at(next) == Terrain::Empty) {
            candidates.push_back(next);
        }
    }

    if (candidates.empty()) {
        return from;
    }

    std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
    return candidates[pick(rng)];
}

} // namespace gridwalk::core
