#pragma once

#include "gridwalk/core/grid.hpp"
#include "gridwalk/core/planner.hpp"
#include <boost/functional/hash.hpp>
#include <memory>
#include <random>
#include <unordered_map>
#include <optional>
#include <string_view>

namespace gridwalk::core {

class MovementStrategy {
public:
    virtual ~MovementStrategy() = default;

    virtual StrategyKind kind() const noexcept = 0;

    // The cell the agent occupies after this tick, or std::nullopt when the
    // strategy cannot decide (failure_kind() tells why).
    virtual std::optional<Cell> next_position(const Grid& grid, const AgentState& agent) = 0;

    virtual ErrorKind failure_kind() const noexcept { return ErrorKind::NoReachableDestination; }
};

using StrategyPtr = std::unique_ptr<MovementStrategy>;

class RandomWalkStrategy : public MovementStrategy {
public:
    explicit RandomWalkStrategy(std::mt19937_64& rng) : rng_(rng) {}

    StrategyKind kind() const noexcept override { return StrategyKind::RandomWalk; }
    // Never fails; staying put is a valid random-walk outcome.
    std::optional<Cell> next_position(const Grid& grid, const AgentState& agent) override;

private:
    std::mt19937_64& rng_;
};

class ShortestPathStrategy : public MovementStrategy {
public:
    StrategyKind kind() const noexcept override { return StrategyKind::ShortestPath; }
    std::optional<Cell> next_position(const Grid& grid, const AgentState& agent) override;
};

// Walks a fixed route one cell per tick, wrapping from the last cell to the first.
// Each agent keeps its own route index, so a route may pass a cell more than once.
// An agent the strategy has not seen yet joins at the first occurrence of its cell.
class RouteStrategy : public MovementStrategy {
public:
    explicit RouteStrategy(Path route) : route_(std::move(route)) {}

    // Pins an agent to a route index; route_[index] must be its current cell.
    void place(const boost::uuids::uuid& agent_id, std::size_t index);

    StrategyKind kind() const noexcept override { return StrategyKind::Route; }
    std::optional<Cell> next_position(const Grid& grid, const AgentState& agent) override;
    ErrorKind failure_kind() const noexcept override { return ErrorKind::OffRoute; }

    const Path& route() const noexcept { return route_; }

private:
    Path route_;
    std::unordered_map<boost::uuids::uuid, std::size_t, boost::hash<boost::uuids::uuid>> cursors_;
};

// A route is usable when it is non-empty and every cell is traversable.
bool validate_route(const Grid& grid, const Path& route);

// Parses "x,y;x,y;..." into a route. std::nullopt on malformed input.
std::optional<Path> parse_route(std::string_view text);

StrategyPtr make_strategy(StrategyKind kind, std::mt19937_64& rng, const Path& route = {});

} // namespace gridwalk::core
