#pragma once

#include "gridwalk/core/world.hpp"
#include "gridwalk/core/strategy.hpp"
#include "gridwalk/core/metrics.hpp"
#include "gridwalk/ports/imap_loader.hpp"
#include "gridwalk/ports/renderer.hpp"
#include <memory>
#include <filesystem>
#include <optional>
#include <random>
#include <string_view>

namespace gridwalk {

// What an agent does on a tick where its strategy cannot pick a cell.
enum class FallbackPolicy {
    StayInPlace,
    RandomWalk
};

std::optional<FallbackPolicy> parse_fallback_policy(std::string_view name);

struct SimulationConfig {
    std::filesystem::path map_path;
    std::optional<core::World> world;  // Allow direct world specification
    int num_agents = 0;                // 0 places one agent per spawn point
    uint64_t seed = 42;
    core::StrategyKind strategy = core::StrategyKind::ShortestPath;
    core::Path route;
    FallbackPolicy fallback = FallbackPolicy::StayInPlace;
    int max_ticks = 1000;
    bool stop_when_all_arrived = true;
    std::filesystem::path trace_output;
    std::filesystem::path metrics_output;
    bool verbose = false;
};

struct AgentFailure {
    boost::uuids::uuid agent_id;
    core::Cell pos;
    core::ErrorKind kind;
};

struct TickReport {
    core::Tick tick = 0;
    std::vector<AgentFailure> failures;
};

class Simulation {
public:
    Simulation(SimulationConfig config, std::unique_ptr<ports::IMapLoader> map_loader);

    // For a world supplied through config.world
    explicit Simulation(SimulationConfig config);

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    bool initialize();
    bool run();

    // Advances every agent by one tick, in agent order.
    void step();
    void reset();
    bool is_complete() const;

    // Writes the metrics and trace files named in the config, if any.
    void save_outputs();

    core::Tick get_current_tick() const;
    core::MetricsSnapshot get_metrics() const { return metrics_collector_.get_snapshot(); }
    const std::vector<core::TickTrace>& get_traces() const { return metrics_collector_.get_traces(); }
    const core::World& get_world() const;
    const core::Grid& get_grid() const;
    const std::vector<core::AgentState>& get_agents() const;
    const TickReport& last_report() const { return last_report_; }
    ports::RenderState render_state() const;

private:
    SimulationConfig config_;
    std::unique_ptr<ports::IMapLoader> map_loader_;

    std::optional<core::World> initial_world_;
    std::optional<core::WorldManager> world_manager_;
    std::mt19937_64 rng_;
    core::StrategyPtr strategy_;
    core::MetricsCollector metrics_collector_;
    TickReport last_report_;
    bool initialized_ = false;

    std::optional<core::World> build_world();
    bool validate_agents(const core::World& world) const;
    std::size_t route_slot(std::size_t agent_index) const;
    core::StrategyPtr make_agent_strategy();
    void step_internal();
    core::Cell choose_next(const core::AgentState& agent);
    bool check_termination() const;

    void log_tick_state() const;
};

} // namespace gridwalk
