#include "phalanx/simulation.hpp"
#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cmath>
#include <iostream>
#include <filesystem>

namespace po = boost::program_options;
namespace fs = std::filesystem;

int main(int argc, char* argv[]) {
    try {
        // Setup logging
        auto console = spdlog::stdout_color_mt("console");
        spdlog::set_default_logger(console);

        po::options_description desc("Phalanx Formation Simulator - Options");
        desc.add_options()
            ("help,h", "Show help message")
            ("patterns,p", po::value<std::string>(), "Path to formation pattern file (built-ins if omitted)")
            ("seed,s", po::value<uint64_t>()->default_value(42), "Random seed")
            ("ticks,t", po::value<int>()->default_value(3600), "Number of simulation ticks")
            ("dt", po::value<double>()->default_value(1.0 / 60.0), "Fixed time step (s)")
            ("cap,c", po::value<std::size_t>()->default_value(60), "Enemy population cap")
            ("max-formations", po::value<std::size_t>()->default_value(3), "Concurrent formation ceiling")
            ("spawn-interval", po::value<double>()->default_value(5.0), "Seconds between formation spawn attempts")
            ("out-trace", po::value<std::string>()->default_value("trace.csv"), "Output trace CSV file")
            ("out-metrics", po::value<std::string>()->default_value("metrics.json"), "Output metrics JSON file")
            ("verbose,v", "Enable verbose logging")
            ("quiet,q", "Suppress info messages");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::cout << "Phalanx Formation Simulator\n";
            std::cout << "Enemy formation steering with per-agent force arbitration\n\n";
            std::cout << desc << "\n";
            std::cout << "Example:\n";
            std::cout << "  ./phalanx_sim --patterns data/patterns.txt --seed 7 --ticks 7200 \\\n";
            std::cout << "                --cap 80 --max-formations 4\n";
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

        phalanx::SimulationConfig config;
        if (vm.count("patterns")) {
            config.patterns_path = vm["patterns"].as<std::string>();
        }
        config.seed = vm["seed"].as<uint64_t>();
        config.max_ticks = vm["ticks"].as<int>();
        config.dt = vm["dt"].as<double>();
        config.population_cap = vm["cap"].as<std::size_t>();
        config.director.max_formations = vm["max-formations"].as<std::size_t>();
        config.director.spawn_interval = vm["spawn-interval"].as<double>();
        config.trace_output = vm["out-trace"].as<std::string>();
        config.metrics_output = vm["out-metrics"].as<std::string>();
        config.verbose = vm.count("verbose") > 0;

        // Validate inputs
        if (!config.patterns_path.empty() && !fs::exists(config.patterns_path)) {
            spdlog::error("Pattern file does not exist: {}", config.patterns_path.string());
            return 1;
        }

        if (config.max_ticks <= 0) {
            spdlog::error("Number of ticks must be positive");
            return 1;
        }

        if (!(config.dt > 0.0) || !std::isfinite(config.dt)) {
            spdlog::error("Time step must be positive");
            return 1;
        }

        if (!(config.director.spawn_interval > 0.0)) {
            spdlog::error("Spawn interval must be positive");
            return 1;
        }

        phalanx::Simulation sim(config);

        if (!sim.initialize()) {
            spdlog::error("Failed to initialize simulation");
            return 1;
        }

        spdlog::info("Running {} ticks, seed {}, cap {}",
                    config.max_ticks, config.seed, config.population_cap);

        if (!sim.run()) {
            spdlog::error("Simulation failed");
            return 1;
        }

        // Print summary
        auto metrics = sim.get_metrics();
        const auto& events = sim.get_events();
        spdlog::info("=== Simulation Results ===");
        spdlog::info("Ticks: {}", metrics.ticks);
        spdlog::info("Formations spawned: {}", metrics.formations_spawned);
        spdlog::info("Formations broken: {} (target reached {}, collapsed {}, reset {})",
                    metrics.formations_broken, metrics.broken_target_reached,
                    metrics.broken_collapsed, metrics.broken_reset);
        spdlog::info("Empty spawns: {}, suppressed by population gate: {}",
                    metrics.empty_spawns, metrics.spawns_suppressed);
        spdlog::info("Invalid patterns skipped: {}", metrics.invalid_pattern_skips);
        spdlog::info("Rejected forces: {}", metrics.rejected_forces);
        spdlog::info("Events: {} formed, {} broken", events.formed_count(), events.broken_count());
        spdlog::info("Wall time: {}ms", metrics.wall_time.count());

        if (metrics.membership_conflicts > 0) {
            spdlog::warn("Membership conflicts resolved: {}", metrics.membership_conflicts);
        }

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
