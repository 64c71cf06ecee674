#include <catch2/catch_test_macros.hpp>
#include "gridwalk/core/metrics.hpp"
#include <boost/uuid/uuid_generators.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

using namespace gridwalk::core;

TEST_CASE("MetricsCollector operations", "[metrics]") {
    MetricsCollector collector;

    SECTION("Record individual metrics") {
        collector.record_move();
        collector.record_move();
        collector.record_stay();
        collector.record_fallback();
        collector.record_arrival();
        collector.set_makespan(42);

        auto snapshot = collector.get_snapshot();
        REQUIRE(snapshot.total_moves == 2);
        REQUIRE(snapshot.total_stays == 1);
        REQUIRE(snapshot.total_fallbacks == 1);
        REQUIRE(snapshot.arrivals == 1);
        REQUIRE(snapshot.makespan == 42);
    }

    SECTION("Reset clears all metrics") {
        collector.record_move();
        collector.record_fallback();
        collector.set_makespan(10);
        collector.record_tick_trace({0, {}, 0, 0, 0});

        collector.reset();

        auto snapshot = collector.get_snapshot();
        REQUIRE(snapshot.total_moves == 0);
        REQUIRE(snapshot.total_fallbacks == 0);
        REQUIRE(snapshot.makespan == 0);
        REQUIRE(collector.get_traces().empty());
    }

    SECTION("Tick traces") {
        boost::uuids::random_generator gen;
        auto agent1 = gen();
        auto agent2 = gen();

        collector.record_tick_trace({0, {{agent1, {0, 0}, false}, {agent2, {5, 5}, false}}, 2, 1, 0});
        collector.record_tick_trace({1, {{agent1, {1, 0}, false}, {agent2, {4, 5}, true}}, 1, 2, 0});

        const auto& traces = collector.get_traces();
        REQUIRE(traces.size() == 2);
        REQUIRE(traces[0].tick == 0);
        REQUIRE(traces[1].tick == 1);
        REQUIRE(traces[1].agents[1].pos == Cell{4, 5});
        REQUIRE(traces[1].agents[1].at_destination);
    }

    SECTION("Wall time measurement") {
        collector.start_timer();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        collector.stop_timer();

        REQUIRE(collector.get_snapshot().wall_time.count() >= 10);
    }
}

TEST_CASE("Metrics file output", "[metrics]") {
    namespace fs = std::filesystem;

    SECTION("JSON metrics output") {
        MetricsSnapshot metrics;
        metrics.total_moves = 30;
        metrics.total_stays = 10;
        metrics.total_fallbacks = 4;
        metrics.arrivals = 2;
        metrics.makespan = 25;
        metrics.wall_time = std::chrono::milliseconds(1234);

        fs::path temp_file = fs::temp_directory_path() / "gridwalk_test_metrics.json";
        emit_metrics_json(temp_file, metrics);

        REQUIRE(fs::exists(temp_file));

        std::ifstream file(temp_file);
        std::stringstream buffer;
        buffer << file.rdbuf();
        const std::string content = buffer.str();

        REQUIRE(content.find("\"total_moves\": 30") != std::string::npos);
        REQUIRE(content.find("\"total_fallbacks\": 4") != std::string::npos);
        REQUIRE(content.find("\"makespan\": 25") != std::string::npos);
        REQUIRE(content.find("\"wall_time_ms\": 1234") != std::string::npos);
        REQUIRE(content.find("\"move_rate\": 0.7500") != std::string::npos);
        REQUIRE(content.find("\"agents\": []") != std::string::npos);

        fs::remove(temp_file);
    }

    SECTION("JSON lists each agent's tallies") {
        boost::uuids::random_generator gen;
        AgentState walker{gen(), {3, 1}, {0, 1}, false, 3, 2};
        AgentState arrived{gen(), {4, 0}, {4, 2}, true, 2, 0};

        MetricsSnapshot metrics;
        metrics.total_moves = 5;
        metrics.total_stays = 2;

        fs::path temp_file = fs::temp_directory_path() / "gridwalk_test_agent_metrics.json";
        emit_metrics_json(temp_file, metrics, {walker, arrived});

        std::ifstream file(temp_file);
        std::stringstream buffer;
        buffer << file.rdbuf();
        const std::string content = buffer.str();

        REQUIRE(content.find("{\"id\": \"" + boost::uuids::to_string(walker.id) +
                             "\", \"x\": 3, \"y\": 1, \"moves\": 3, \"stalls\": 2, "
                             "\"at_destination\": false},") != std::string::npos);
        REQUIRE(content.find("{\"id\": \"" + boost::uuids::to_string(arrived.id) +
                             "\", \"x\": 4, \"y\": 0, \"moves\": 2, \"stalls\": 0, "
                             "\"at_destination\": true}\n  ]") != std::string::npos);

        fs::remove(temp_file);
    }

    SECTION("CSV trace output") {
        boost::uuids::random_generator gen;
        auto agent1 = gen();

        std::vector<TickTrace> traces = {
            {0, {{agent1, {0, 0}, false}}, 1, 0, 1},
            {1, {{agent1, {1, 0}, false}}, 1, 1, 0},
            {2, {{agent1, {2, 0}, true}}, 0, 1, 0}
        };

        fs::path temp_file = fs::temp_directory_path() / "gridwalk_test_trace.csv";
        emit_trace_csv(temp_file, traces);

        std::ifstream file(temp_file);
        std::string line;

        std::getline(file, line);
        REQUIRE(line == "tick,agent_id,x,y,at_destination,active_agents,moves,fallbacks");

        std::getline(file, line);
        REQUIRE(line == "0," + boost::uuids::to_string(agent1) + ",0,0,0,1,0,1");

        int rows = 1;
        std::string last;
        while (std::getline(file, line)) {
            last = line;
            ++rows;
        }
        REQUIRE(rows == 3);
        REQUIRE(last == "2," + boost::uuids::to_string(agent1) + ",2,0,1,0,1,0");

        fs::remove(temp_file);
    }

    SECTION("Unwritable path throws") {
        fs::path bad = "/nonexistent-dir/metrics.json";
        REQUIRE_THROWS_AS(emit_metrics_json(bad, MetricsSnapshot{}), std::runtime_error);
        REQUIRE_THROWS_AS(emit_trace_csv(bad, {}), std::runtime_error);
    }
}
