#include "gridwalk/core/metrics.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <string>

namespace gridwalk::core {

namespace {

std::ofstream open_output(const std::filesystem::path& path, const char* what) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error(std::string("Failed to open ") + what + " file: " + path.string());
    }
    return file;
}

const char* json_bool(bool value) {
    return value ? "true" : "false";
}

} // namespace

void MetricsCollector::stop_timer() {
    snapshot_.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_);
}

void emit_metrics_json(const std::filesystem::path& path, const MetricsSnapshot& metrics,
                       const std::vector<AgentState>& agents) {
    auto file = open_output(path, "metrics");

    file << "{\n"
         << "  \"total_moves\": " << metrics.total_moves << ",\n"
         << "  \"total_stays\": " << metrics.total_stays << ",\n"
         << "  \"total_fallbacks\": " << metrics.total_fallbacks << ",\n"
         << "  \"arrivals\": " << metrics.arrivals << ",\n"
         << "  \"makespan\": " << metrics.makespan << ",\n"
         << "  \"wall_time_ms\": " << metrics.wall_time.count() << ",\n"
         << "  \"move_rate\": " << std::fixed << std::setprecision(4) << metrics.move_rate() << ",\n"
         << "  \"agents\": [";

    for (std::size_t i = 0; i < agents.size(); ++i) {
        const auto& agent = agents[i];
        file << (i == 0 ? "\n" : ",\n")
             << "    {\"id\": \"" << boost::uuids::to_string(agent.id) << "\""
             << ", \"x\": " << agent.pos.x
             << ", \"y\": " << agent.pos.y
             << ", \"moves\": " << agent.moves
             << ", \"stalls\": " << agent.stalls
             << ", \"at_destination\": " << json_bool(agent.at_destination) << "}";
    }
    file << (agents.empty() ? "]\n" : "\n  ]\n") << "}\n";
}

void emit_trace_csv(const std::filesystem::path& path, const std::vector<TickTrace>& traces) {
    auto file = open_output(path, "trace");

    file << "tick,agent_id,x,y,at_destination,active_agents,moves,fallbacks\n";
    for (const auto& trace : traces) {
        for (const auto& sample : trace.agents) {
            file << trace.tick << ','
                 << boost::uuids::to_string(sample.id) << ','
                 << sample.pos.x << ',' << sample.pos.y << ','
                 << (sample.at_destination ? 1 : 0) << ','
                 << trace.active_agents << ','
                 << trace.moves << ','
                 << trace.fallbacks << '\n';
        }
    }
}

} // namespace gridwalk::core
