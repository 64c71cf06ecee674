#include "gridwalk/simulation.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace gridwalk {

std::optional<FallbackPolicy> parse_fallback_policy(std::string_view name) {
    if (name == "stay") return FallbackPolicy::StayInPlace;
    if (name == "random") return FallbackPolicy::RandomWalk;
    return std::nullopt;
}

Simulation::Simulation(SimulationConfig config,
                       std::unique_ptr<ports::IMapLoader> map_loader)
    : config_(std::move(config))
    , map_loader_(std::move(map_loader))
    , rng_(config_.seed) {
}

Simulation::Simulation(SimulationConfig config)
    : config_(std::move(config))
    , rng_(config_.seed) {
}

std::optional<core::World> Simulation::build_world() {
    if (config_.world.has_value()) {
        return config_.world;
    }

    if (!map_loader_) {
        spdlog::error("No world provided");
        return std::nullopt;
    }

    auto grid = map_loader_->load(config_.map_path);
    if (!grid) {
        spdlog::error("Failed to load world from map");
        return std::nullopt;
    }

    core::WorldBuilder builder(config_.seed);
    builder.with_grid(*grid);

    if (config_.strategy == core::StrategyKind::Route && config_.num_agents > 0) {
        for (int i = 0; i < config_.num_agents; ++i) {
            builder.with_agent(config_.route[route_slot(static_cast<std::size_t>(i))]);
        }
    } else if (config_.num_agents > 0) {
        builder.with_random_agents(config_.num_agents);
    } else {
        builder.with_agents_at_spawn_points();
    }

    return builder.build();
}

// Spreads num_agents evenly along the route, sharing cells when there are
// more agents than route cells.
std::size_t Simulation::route_slot(std::size_t agent_index) const {
    return agent_index * config_.route.size() / static_cast<std::size_t>(config_.num_agents);
}

core::StrategyPtr Simulation::make_agent_strategy() {
    const bool spread_on_route = config_.strategy == core::StrategyKind::Route &&
                                 !config_.world && config_.num_agents > 0;
    if (!spread_on_route) {
        return core::make_strategy(config_.strategy, rng_, config_.route);
    }

    auto route = std::make_unique<core::RouteStrategy>(config_.route);
    const auto& agents = get_agents();
    for (std::size_t i = 0; i < agents.size(); ++i) {
        route->place(agents[i].id, route_slot(i));
    }
    return route;
}

bool Simulation::validate_agents(const core::World& world) const {
    for (const auto& agent : world.agents) {
        if (!world.grid.is_traversable(agent.pos)) {
            spdlog::error("Agent {} starts on ({},{}), which is not a traversable cell",
                          boost::uuids::to_string(agent.id), agent.pos.x, agent.pos.y);
            return false;
        }
    }
    return true;
}

bool Simulation::initialize() {
    spdlog::info("Initializing simulation with seed {}", config_.seed);

    if (config_.strategy == core::StrategyKind::Route && config_.route.empty()) {
        spdlog::error("Route strategy needs a route");
        return false;
    }

    auto world = build_world();
    if (!world) {
        spdlog::error("Failed to build world");
        return false;
    }

    if (config_.strategy == core::StrategyKind::Route &&
        !core::validate_route(world->grid, config_.route)) {
        spdlog::error("Route crosses a wall or leaves the grid");
        return false;
    }

    if (!validate_agents(*world)) {
        return false;
    }

    if (world->agents.empty()) {
        spdlog::warn("World has no agents");
    }

    initial_world_ = *world;
    world_manager_.emplace(std::move(*world));
    rng_.seed(config_.seed);
    strategy_ = make_agent_strategy();
    metrics_collector_.reset();
    last_report_ = {};

    spdlog::info("Initialized {} agents on a {}x{} grid using {} strategy",
                 get_agents().size(), get_grid().width(), get_grid().height(),
                 core::to_string(config_.strategy));
    initialized_ = true;
    return true;
}

bool Simulation::run() {
    if (!world_manager_) {
        spdlog::error("Simulation not initialized");
        return false;
    }

    spdlog::info("Starting simulation");
    metrics_collector_.start_timer();

    while (!is_complete()) {
        step_internal();
        world_manager_->advance_tick();
    }

    metrics_collector_.stop_timer();
    metrics_collector_.set_makespan(get_current_tick());

    if (get_current_tick() >= config_.max_ticks) {
        spdlog::warn("Reached maximum steps limit");
    }

    save_outputs();

    spdlog::info("Simulation completed in {} ticks", get_current_tick());
    return true;
}

void Simulation::step_internal() {
    if (config_.verbose) {
        log_tick_state();
    }

    auto& world = world_manager_->get_world();
    last_report_ = TickReport{world.current_tick, {}};

    core::TickTrace trace;
    trace.tick = world.current_tick;

    for (auto& agent : world.agents) {
        const core::Cell before = agent.pos;
        const bool was_at_destination = agent.at_destination;

        const core::Cell next = choose_next(agent);
        if (!world_manager_->apply_move(agent, next)) {
            spdlog::warn("Rejected move of agent {} to ({},{})",
                         boost::uuids::to_string(agent.id), next.x, next.y);
            agent.stalls++;
        }

        if (agent.pos != before) {
            metrics_collector_.record_move();
            trace.moves++;
        } else {
            metrics_collector_.record_stay();
        }

        if (agent.at_destination && !was_at_destination) {
            metrics_collector_.record_arrival();
            spdlog::info("Agent {} reached destination ({},{})",
                         boost::uuids::to_string(agent.id), agent.pos.x, agent.pos.y);
        }

        trace.agents.push_back({agent.id, agent.pos, agent.at_destination});
    }

    trace.active_agents = world_manager_->count_active_agents();
    trace.fallbacks = static_cast<int>(last_report_.failures.size());
    metrics_collector_.record_tick_trace(std::move(trace));
}

core::Cell Simulation::choose_next(const core::AgentState& agent) {
    const auto& grid = world_manager_->get_grid();

    if (auto next = strategy_->next_position(grid, agent)) {
        return *next;
    }

    const auto kind = strategy_->failure_kind();
    last_report_.failures.push_back({agent.id, agent.pos, kind});
    metrics_collector_.record_fallback();
    spdlog::debug("Agent {} at ({},{}): {}", boost::uuids::to_string(agent.id),
                  agent.pos.x, agent.pos.y, core::to_string(kind));

    if (config_.fallback == FallbackPolicy::RandomWalk) {
        return core::random_step(grid, agent.pos, rng_);
    }
    return agent.pos;
}

bool Simulation::check_termination() const {
    return config_.stop_when_all_arrived &&
           !world_manager_->get_world().agents.empty() &&
           world_manager_->all_agents_at_destination();
}

void Simulation::log_tick_state() const {
    spdlog::debug("Tick {}: {} agents not at a destination",
                  world_manager_->get_world().current_tick,
                  world_manager_->count_active_agents());
}

void Simulation::save_outputs() {
    if (!config_.metrics_output.empty()) {
        try {
            const std::vector<core::AgentState> none;
            emit_metrics_json(config_.metrics_output, metrics_collector_.get_snapshot(),
                              world_manager_ ? get_agents() : none);
            spdlog::info("Saved metrics to {}", config_.metrics_output.string());
        } catch (const std::exception& e) {
            spdlog::error("Failed to save metrics: {}", e.what());
        }
    }

    if (!config_.trace_output.empty()) {
        try {
            emit_trace_csv(config_.trace_output, metrics_collector_.get_traces());
            spdlog::info("Saved trace to {}", config_.trace_output.string());
        } catch (const std::exception& e) {
            spdlog::error("Failed to save trace: {}", e.what());
        }
    }
}

void Simulation::step() {
    if (!initialized_) {
        if (!initialize()) {
            return;
        }
    }

    if (!is_complete()) {
        step_internal();
        world_manager_->advance_tick();
        metrics_collector_.set_makespan(get_current_tick());
    }
}

void Simulation::reset() {
    if (!initialized_) {
        return;
    }

    world_manager_.emplace(*initial_world_);
    rng_.seed(config_.seed);
    strategy_ = make_agent_strategy();
    metrics_collector_.reset();
    last_report_ = {};
}

bool Simulation::is_complete() const {
    if (!world_manager_) {
        return false;
    }

    return check_termination() ||
           world_manager_->get_world().current_tick >= config_.max_ticks;
}

core::Tick Simulation::get_current_tick() const {
    return world_manager_ ? world_manager_->get_world().current_tick : 0;
}

const core::World& Simulation::get_world() const {
    if (!world_manager_) {
        throw std::logic_error("Simulation not initialized");
    }
    return world_manager_->get_world();
}

const core::Grid& Simulation::get_grid() const {
    return get_world().grid;
}

const std::vector<core::AgentState>& Simulation::get_agents() const {
    return get_world().agents;
}

ports::RenderState Simulation::render_state() const {
    ports::RenderState state;
    state.grid = &get_grid();
    state.agents = get_agents();
    state.metrics = get_metrics();
    state.current_tick = get_current_tick();
    state.simulation_complete = is_complete();
    return state;
}

} // namespace gridwalk
