#include "gridwalk/core/world.hpp"
#include <spdlog/spdlog.h>
#include <unordered_set>
#include <algorithm>

namespace gridwalk::core {

WorldBuilder& WorldBuilder::with_grid(Grid grid) {
    grid_ = std::move(grid);
    return *this;
}

WorldBuilder& WorldBuilder::with_agent(Cell start) {
    starts_.push_back(start);
    return *this;
}

WorldBuilder& WorldBuilder::with_agents_at_spawn_points() {
    at_spawn_points_ = true;
    return *this;
}

WorldBuilder& WorldBuilder::with_random_agents(int n_agents) {
    random_agents_ = n_agents;
    return *this;
}

std::vector<Cell> WorldBuilder::find_free_cells() const {
    std::vector<Cell> free_cells;
    for (int y = 0; y < grid_->height(); ++y) {
        for (int x = 0; x < grid_->width(); ++x) {
            if (grid_->is_traversable({x, y})) {
                free_cells.push_back({x, y});
            }
        }
    }
    return free_cells;
}

std::optional<World> WorldBuilder::build() {
    if (!grid_) {
        return std::nullopt;
    }

    std::vector<Cell> starts = starts_;
    if (at_spawn_points_) {
        auto spawns = grid_->spawn_points();
        starts.insert(starts.end(), spawns.begin(), spawns.end());
    }

    for (const auto& start : starts) {
        if (!grid_->is_traversable(start)) {
            spdlog::error("Agent start ({},{}) is not a traversable cell", start.x, start.y);
            return std::nullopt;
        }
    }

    if (random_agents_ > 0) {
        std::unordered_set<Cell, CellHash> used(starts.begin(), starts.end());
        auto free_cells = find_free_cells();
        std::erase_if(free_cells, [&used](const Cell& c) { return used.contains(c); });

        if (free_cells.size() < static_cast<size_t>(random_agents_)) {
            spdlog::error("Not enough free cells for {} agents: {}", random_agents_, free_cells.size());
            return std::nullopt;
        }

        std::shuffle(free_cells.begin(), free_cells.end(), rng_);
        starts.insert(starts.end(), free_cells.begin(), free_cells.begin() + random_agents_);
    }

    World world{*grid_, {}, seed_, 0};

    boost::uuids::basic_random_generator<std::mt19937_64> uuid_gen(rng_);

    for (const auto& start : starts) {
        AgentState agent;
        agent.id = uuid_gen();
        agent.pos = start;
        agent.spawn = start;
        agent.at_destination = grid_->terrain_at(start) == Terrain::Destination;
        world.agents.push_back(agent);
    }

    return world;
}

bool WorldManager::move_agent(const boost::uuids::uuid& agent_id, const Cell& new_pos) {
    auto it = std::find_if(world_.agents.begin(), world_.agents.end(),
        [&agent_id](const AgentState& a) { return a.id == agent_id; });

    if (it == world_.agents.end()) {
        return false;
    }

    return apply_move(*it, new_pos);
}

bool WorldManager::apply_move(AgentState& agent, const Cell& new_pos) {
    if (!world_.is_free_cell(new_pos)) {
        return false;
    }

    if (new_pos == agent.pos) {
        agent.stalls++;
    } else {
        agent.pos = new_pos;
        agent.moves++;
    }

    agent.at_destination = world_.grid.terrain_at(agent.pos) == Terrain::Destination;
    return true;
}

bool WorldManager::all_agents_at_destination() const {
    return std::all_of(world_.agents.begin(), world_.agents.end(),
        [](const AgentState& a) { return a.at_destination; });
}

int WorldManager::count_active_agents() const {
    return static_cast<int>(std::count_if(world_.agents.begin(), world_.agents.end(),
        [](const AgentState& a) { return !a.at_destination; }));
}

std::optional<Cell> WorldManager::get_agent_position(const boost::uuids::uuid& agent_id) const {
    auto it = std::find_if(world_.agents.begin(), world_.agents.end(),
        [&agent_id](const AgentState& a) { return a.id == agent_id; });

    if (it != world_.agents.end()) {
        return it->pos;
    }
    return std::nullopt;
}

} // namespace gridwalk::core
