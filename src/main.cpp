#include "gridwalk/simulation.hpp"
#include "gridwalk/adapters/map_loader_file.hpp"
#include "gridwalk/adapters/text_renderer.hpp"
#include "gridwalk/adapters/tick_source_asio.hpp"
#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <filesystem>

namespace po = boost::program_options;
namespace fs = std::filesystem;

int main(int argc, char* argv[]) {
    try {
        // Setup logging
        auto console = spdlog::stdout_color_mt("console");
        spdlog::set_default_logger(console);

        po::options_description desc("Grid Walk - Options");
        desc.add_options()
            ("help,h", "Show help message")
            ("map,m", po::value<std::string>()->required(), "Path to map file")
            ("strategy", po::value<std::string>()->default_value("shortest"), "Movement strategy: random, shortest or route")
            ("route", po::value<std::string>(), "Route for the route strategy, \"x,y;x,y;...\"")
            ("agents,n", po::value<int>()->default_value(0), "Number of agents (0 = one per spawn point)")
            ("seed,s", po::value<uint64_t>()->default_value(1337), "Random seed")
            ("fallback", po::value<std::string>()->default_value("stay"), "When no destination is reachable: stay or random")
            ("max-ticks", po::value<int>()->default_value(300), "Maximum simulation ticks")
            ("tick-ms", po::value<int>()->default_value(0), "Tick period in ms (0 = run headless)")
            ("keep-running", "Do not stop when every agent stands on a destination")
            ("render,r", "Draw the grid after every tick")
            ("out-trace", po::value<std::string>()->default_value(""), "Output trace CSV file")
            ("out-metrics", po::value<std::string>()->default_value(""), "Output metrics JSON file")
            ("verbose,v", "Enable verbose logging")
            ("quiet,q", "Suppress info messages");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::cout << "Grid Walk\n";
            std::cout << "Agents walking a text map by random walk, shortest path or fixed route\n\n";
            std::cout << desc << "\n";
            std::cout << "Example:\n";
            std::cout << "  ./gridwalk_app --map maps/demo.txt --strategy shortest \\\n";
            std::cout << "                 --tick-ms 200 --render\n";
            return 0;
        }

        po::notify(vm);

        if (vm.count("verbose")) {
            spdlog::set_level(spdlog::level::debug);
        } else if (vm.count("quiet")) {
            spdlog::set_level(spdlog::level::warn);
        } else {
            spdlog::set_level(spdlog::level::info);
        }

        gridwalk::SimulationConfig config;
        config.map_path = vm["map"].as<std::string>();
        config.num_agents = vm["agents"].as<int>();
        config.seed = vm["seed"].as<uint64_t>();
        config.max_ticks = vm["max-ticks"].as<int>();
        config.stop_when_all_arrived = vm.count("keep-running") == 0;
        config.trace_output = vm["out-trace"].as<std::string>();
        config.metrics_output = vm["out-metrics"].as<std::string>();
        config.verbose = vm.count("verbose") > 0;

        auto strategy = gridwalk::core::parse_strategy_kind(vm["strategy"].as<std::string>());
        if (!strategy) {
            spdlog::error("Unknown strategy: {}", vm["strategy"].as<std::string>());
            return 1;
        }
        config.strategy = *strategy;

        auto fallback = gridwalk::parse_fallback_policy(vm["fallback"].as<std::string>());
        if (!fallback) {
            spdlog::error("Unknown fallback policy: {}", vm["fallback"].as<std::string>());
            return 1;
        }
        config.fallback = *fallback;

        if (vm.count("route")) {
            auto route = gridwalk::core::parse_route(vm["route"].as<std::string>());
            if (!route) {
                spdlog::error("Malformed route: {}", vm["route"].as<std::string>());
                return 1;
            }
            config.route = std::move(*route);
        }

        // Validate inputs
        if (!fs::exists(config.map_path)) {
            spdlog::error("Map file does not exist: {}", config.map_path.string());
            return 1;
        }

        if (config.num_agents < 0) {
            spdlog::error("Number of agents must not be negative");
            return 1;
        }

        const int tick_ms = vm["tick-ms"].as<int>();
        if (tick_ms < 0) {
            spdlog::error("Tick period must not be negative");
            return 1;
        }

        auto map_loader = std::make_unique<gridwalk::adapters::MapLoaderFile>();
        gridwalk::Simulation sim(config, std::move(map_loader));

        if (!sim.initialize()) {
            spdlog::error("Failed to initialize simulation");
            return 1;
        }

        const bool render = vm.count("render") > 0;

        if (tick_ms == 0 && !render) {
            if (!sim.run()) {
                spdlog::error("Simulation failed");
                return 1;
            }
        } else {
            gridwalk::adapters::TextRenderer renderer(std::cout, tick_ms > 0);
            gridwalk::adapters::TickSourceAsio ticks{std::chrono::milliseconds(tick_ms)};

            if (render) {
                renderer.render(sim.render_state());
            }

            ticks.run([&]() {
                sim.step();
                if (render) {
                    renderer.render(sim.render_state());
                }
                return !sim.is_complete();
            });

            if (ticks.terminated_by_signal()) {
                spdlog::info("Interrupted at tick {}", sim.get_current_tick());
            }
            sim.save_outputs();
        }

        auto metrics = sim.get_metrics();
        spdlog::info("=== Simulation Results ===");
        spdlog::info("Ticks: {}", sim.get_current_tick());
        spdlog::info("Moves: {}, stays: {}", metrics.total_moves, metrics.total_stays);
        spdlog::info("Arrivals: {}", metrics.arrivals);
        spdlog::info("Strategy failures: {}", metrics.total_fallbacks);

        return 0;

    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Use --help for usage information\n";
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}
