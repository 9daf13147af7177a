#pragma once

#include "phalanx/formation_director.hpp"
#include "phalanx/core/arena.hpp"
#include "phalanx/core/local_forces.hpp"
#include "phalanx/core/metrics.hpp"
#include "phalanx/adapters/arena_population.hpp"
#include "phalanx/adapters/event_log_sink.hpp"
#include "phalanx/ports/pattern_provider.hpp"
#include <filesystem>
#include <memory>
#include <random>

namespace phalanx {

struct SimulationConfig {
    std::filesystem::path patterns_path;  // empty: built-in patterns
    uint64_t seed = 42;
    int max_ticks = 3600;
    double dt = 1.0 / 60.0;

    std::size_t population_cap = 60;
    double agent_radius = 15.0;
    double ambient_spawn_interval = 0.5;  // independent enemies
    double wave_duration = 30.0;

    // The target circles the arena origin
    double player_orbit_radius = 200.0;
    double player_orbit_speed = 0.2;

    double chase_strength = 120.0;
    double max_speed = 250.0;
    double damping = 2.0;
    double contact_radius = 20.0;     // enemies touching the player are destroyed
    double weapon_interval = 0.25;
    double weapon_range = 300.0;

    DirectorConfig director;
    core::LocalForceConfig local_forces;

    std::filesystem::path trace_output;
    std::filesystem::path metrics_output;
    bool verbose = false;
};

// Headless arena: feeds the formation director and the local force
// producer, arbitrates every agent's forces and integrates the result.
class Simulation {
public:
    explicit Simulation(SimulationConfig config);
    Simulation(SimulationConfig config, std::unique_ptr<ports::IPatternProvider> patterns);

    bool initialize();
    bool run();

    void step();
    void reset();

    core::Tick get_current_tick() const { return current_tick_; }
    double get_time() const { return time_; }
    int get_wave() const;
    const core::Vec2& get_player_position() const { return player_; }

    core::MetricsSnapshot get_metrics() const { return metrics_collector_.get_snapshot(); }
    const core::MetricsCollector& get_metrics_collector() const { return metrics_collector_; }
    const core::Arena& get_arena() const { return arena_; }
    const FormationDirector* get_director() const { return director_.get(); }
    const adapters::EventLogSink& get_events() const { return events_; }

private:
    SimulationConfig config_;
    std::unique_ptr<ports::IPatternProvider> patterns_;

    core::Arena arena_;
    adapters::ArenaPopulation population_;
    adapters::EventLogSink events_;
    core::MetricsCollector metrics_collector_;
    core::LocalForceProducer local_forces_;
    std::unique_ptr<FormationDirector> director_;

    std::mt19937_64 rng_;
    core::Vec2 player_;
    double time_ = 0.0;
    double ambient_timer_ = 0.0;
    double weapon_timer_ = 0.0;
    core::Tick current_tick_ = 0;
    bool initialized_ = false;

    void create_director();
    void move_player();
    void spawn_ambient();
    void apply_chase();
    void arbitrate_and_integrate();
    void resolve_combat();
    void record_trace();

    void log_tick_state() const;
    void save_outputs();
};

} // namespace phalanx
