#pragma once

#include "gridwalk/core/types.hpp"
#include <vector>
#include <chrono>
#include <filesystem>

namespace gridwalk::core {

struct MetricsSnapshot {
    uint64_t total_moves = 0;
    uint64_t total_stays = 0;
    uint64_t total_fallbacks = 0;
    uint64_t arrivals = 0;
    Tick makespan = 0;
    std::chrono::milliseconds wall_time{0};

    // Share of agent decisions that changed the agent's cell.
    double move_rate() const noexcept {
        const uint64_t decisions = total_moves + total_stays;
        return decisions > 0 ? static_cast<double>(total_moves) / static_cast<double>(decisions) : 0.0;
    }
};

// Where one agent stood at the end of a tick.
struct AgentSample {
    boost::uuids::uuid id;
    Cell pos;
    bool at_destination = false;
};

struct TickTrace {
    Tick tick = 0;
    std::vector<AgentSample> agents;
    int active_agents = 0;
    int moves = 0;
    int fallbacks = 0;
};

class MetricsCollector {
public:
    void record_move() { ++snapshot_.total_moves; }
    void record_stay() { ++snapshot_.total_stays; }
    void record_fallback() { ++snapshot_.total_fallbacks; }
    void record_arrival() { ++snapshot_.arrivals; }
    void set_makespan(Tick makespan) { snapshot_.makespan = makespan; }

    void record_tick_trace(TickTrace trace) { traces_.push_back(std::move(trace)); }

    const MetricsSnapshot& get_snapshot() const { return snapshot_; }
    const std::vector<TickTrace>& get_traces() const { return traces_; }

    void reset() { *this = MetricsCollector{}; }

    void start_timer() { started_ = std::chrono::steady_clock::now(); }
    void stop_timer();

private:
    MetricsSnapshot snapshot_;
    std::vector<TickTrace> traces_;
    std::chrono::steady_clock::time_point started_;
};

// Run totals followed by one entry per agent with its position and tallies.
void emit_metrics_json(const std::filesystem::path& path, const MetricsSnapshot& metrics,
                       const std::vector<AgentState>& agents = {});

// One row per agent per tick.
void emit_trace_csv(const std::filesystem::path& path, const std::vector<TickTrace>& traces);

} // namespace gridwalk::core
