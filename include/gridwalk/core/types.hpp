#pragma once

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/functional/hash.hpp>
#include <vector>
#include <string_view>
#include <optional>
#include <cstdint>
#include <functional>

namespace gridwalk::core {

// x is the column, y is the row.
struct Cell {
    int x;
    int y;

    constexpr bool operator==(const Cell& other) const noexcept {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Cell& other) const noexcept {
        return !(*this == other);
    }

    constexpr bool operator<(const Cell& other) const noexcept {
        if (x != other.x) return x < other.x;
        return y < other.y;
    }
};

using Tick = int;
using Path = std::vector<Cell>;

enum class StrategyKind {
    RandomWalk,
    ShortestPath,
    Route
};

constexpr std::string_view to_string(StrategyKind kind) noexcept {
    switch (kind) {
        case StrategyKind::RandomWalk: return "random";
        case StrategyKind::ShortestPath: return "shortest";
        case StrategyKind::Route: return "route";
    }
    return "unknown";
}

inline std::optional<StrategyKind> parse_strategy_kind(std::string_view name) {
    if (name == "random") return StrategyKind::RandomWalk;
    if (name == "shortest") return StrategyKind::ShortestPath;
    if (name == "route") return StrategyKind::Route;
    return std::nullopt;
}

struct AgentState {
    boost::uuids::uuid id;
    Cell pos;
    Cell spawn;
    bool at_destination = false;
    int moves = 0;
    int stalls = 0;

    bool operator==(const AgentState& other) const noexcept {
        return id == other.id;
    }
};

struct CellHash {
    std::size_t operator()(const Cell& cell) const noexcept {
        std::size_t seed = 0;
        boost::hash_combine(seed, cell.x);
        boost::hash_combine(seed, cell.y);
        return seed;
    }
};

// Lets boost::hash<Cell> and boost::hash<std::pair<Cell, ...>> work
inline std::size_t hash_value(const Cell& cell) {
    return CellHash{}(cell);
}

} // namespace gridwalk::core
