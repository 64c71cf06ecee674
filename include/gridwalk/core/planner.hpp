#pragma once

#include "gridwalk/core/grid.hpp"
#include <optional>
#include <random>

namespace gridwalk::core {

// Breadth-first search over 4-way adjacency through Empty and Destination cells.
// Returns the path from `start` to the nearest Destination, both ends included,
// or std::nullopt when no Destination is reachable. Among equally near
// destinations the first one discovered in kFourWay order wins.
std::optional<Path> find_path_to_nearest_destination(const Grid& grid, const Cell& start);

// First hop of find_path_to_nearest_destination; `start` itself when it is
// already a Destination. std::nullopt means NoReachableDestination.
std::optional<Cell> next_step_toward_nearest_destination(const Grid& grid, const Cell& start);

std::optional<int> hop_distance_to_nearest_destination(const Grid& grid, const Cell& start);

// Uniform choice among the 4-way neighbors whose terrain is Empty.
// Returns `from` when there is none.
Cell random_step(const Grid& grid, const Cell& from, std::mt19937_64& rng);

} // namespace gridwalk::core
