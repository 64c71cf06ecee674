#pragma once

#include "gridwalk/core/grid.hpp"
#include <random>
#include <optional>
#include <vector>

namespace gridwalk::core {

struct World {
    Grid grid;
    std::vector<AgentState> agents;
    uint64_t rng_seed = 0;
    Tick current_tick = 0;

    int width() const noexcept { return grid.width(); }
    int height() const noexcept { return grid.height(); }

    bool is_valid_cell(const Cell& cell) const noexcept {
        return grid.in_bounds(cell);
    }

    bool is_free_cell(const Cell& cell) const noexcept {
        return grid.is_traversable(cell);
    }

    bool is_occupied(const Cell& cell) const noexcept {
        for (const auto& agent : agents) {
            if (agent.pos == cell) {
                return true;
            }
        }
        return false;
    }
};

class WorldBuilder {
public:
    explicit WorldBuilder(uint64_t seed) : rng_(seed), seed_(seed) {}

    WorldBuilder& with_grid(Grid grid);
    WorldBuilder& with_agent(Cell start);
    WorldBuilder& with_agents_at_spawn_points();
    WorldBuilder& with_random_agents(int n_agents);

    // Fails when no grid was given, an explicit start is out of bounds or on a
    // Wall, or there are fewer free cells than requested random agents.
    std::optional<World> build();

private:
    std::mt19937_64 rng_;
    uint64_t seed_;
    std::optional<Grid> grid_;
    std::vector<Cell> starts_;
    bool at_spawn_points_ = false;
    int random_agents_ = 0;

    std::vector<Cell> find_free_cells() const;
};

class WorldManager {
public:
    explicit WorldManager(World world) : world_(std::move(world)) {}

    const World& get_world() const { return world_; }
    World& get_world() { return world_; }
    const Grid& get_grid() const { return world_.grid; }

    void advance_tick() { world_.current_tick++; }

    bool move_agent(const boost::uuids::uuid& agent_id, const Cell& new_pos);
    bool apply_move(AgentState& agent, const Cell& new_pos);

    bool all_agents_at_destination() const;
    int count_active_agents() const;

    std::optional<Cell> get_agent_position(const boost::uuids::uuid& agent_id) const;

private:
    World world_;
};

} // namespace gridwalk::core
