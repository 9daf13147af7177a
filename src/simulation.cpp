#include "phalanx/simulation.hpp"
#include "phalanx/adapters/pattern_library.hpp"
#include "phalanx/adapters/pattern_loader_file.hpp"
#include "phalanx/core/steering.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <numbers>

namespace phalanx {

Simulation::Simulation(SimulationConfig config)
    : Simulation(std::move(config), nullptr) {
}

Simulation::Simulation(SimulationConfig config, std::unique_ptr<ports::IPatternProvider> patterns)
    : config_(std::move(config))
    , patterns_(std::move(patterns))
    , arena_(config_.population_cap)
    , population_(arena_, config_.agent_radius)
    , local_forces_(config_.local_forces)
    , rng_(config_.seed) {
}

bool Simulation::initialize() {
    spdlog::info("Initializing simulation with seed {}", config_.seed);

    if (!(config_.dt > 0.0) || !std::isfinite(config_.dt)) {
        spdlog::error("Time step must be positive, got {}", config_.dt);
        return false;
    }

    if (!patterns_) {
        if (!config_.patterns_path.empty()) {
            auto loaded = adapters::PatternLoaderFile().load(config_.patterns_path);
            if (!loaded) {
                spdlog::error("Failed to load formation patterns");
                return false;
            }
            patterns_ = std::make_unique<adapters::PatternLibrary>(std::move(*loaded));
        } else {
            patterns_ = std::make_unique<adapters::PatternLibrary>(
                adapters::PatternLibrary::with_builtin_patterns());
        }
    }

    create_director();

    arena_.clear();
    player_ = core::Vec2::from_angle(0.0, config_.player_orbit_radius);
    time_ = 0.0;
    ambient_timer_ = 0.0;
    weapon_timer_ = 0.0;
    current_tick_ = 0;

    spdlog::info("Arena capacity {} agents, up to {} formations",
                 arena_.capacity(), director_->config().max_formations);
    initialized_ = true;
    return true;
}

bool Simulation::run() {
    if (!initialized_) {
        spdlog::error("Simulation not initialized");
        return false;
    }

    spdlog::info("Starting simulation");
    metrics_collector_.reset();
    metrics_collector_.start_timer();

    while (current_tick_ < static_cast<core::Tick>(config_.max_ticks)) {
        step();
    }

    metrics_collector_.stop_timer();
    metrics_collector_.set_ticks(current_tick_);

    save_outputs();

    spdlog::info("Simulation completed in {} ticks", current_tick_);
    return true;
}

void Simulation::step() {
    if (!initialized_) {
        if (!initialize()) {
            return;
        }
    }

    if (config_.verbose) {
        log_tick_state();
    }

    const double dt = config_.dt;
    time_ += dt;
    move_player();

    for (auto& agent : arena_.agents()) {
        agent.forces.reset();
    }

    // Formation deposits must precede every net force computation
    director_->update(dt, player_, get_wave());

    spawn_ambient();

    auto rejected = local_forces_.apply(arena_.agents(), dt);
    for (std::size_t i = 0; i < rejected; ++i) {
        metrics_collector_.record_rejected_force();
    }
    apply_chase();

    arbitrate_and_integrate();
    resolve_combat();
    arena_.sweep_dead();

    ++current_tick_;
    metrics_collector_.set_ticks(current_tick_);
    record_trace();
}

void Simulation::reset() {
    if (director_) {
        director_->reset();
        create_director();
    }

    arena_.clear();
    metrics_collector_.reset();
    events_.clear();
    rng_.seed(config_.seed);

    player_ = core::Vec2::from_angle(0.0, config_.player_orbit_radius);
    time_ = 0.0;
    ambient_timer_ = 0.0;
    weapon_timer_ = 0.0;
    current_tick_ = 0;
}

void Simulation::create_director() {
    auto director_config = config_.director;
    director_config.seed = config_.seed;
    director_ = std::make_unique<FormationDirector>(
        director_config, *patterns_, population_, events_, metrics_collector_);
}

int Simulation::get_wave() const {
    if (config_.wave_duration <= 0.0) return 1;
    return 1 + static_cast<int>(time_ / config_.wave_duration);
}

void Simulation::move_player() {
    player_ = core::Vec2::from_angle(time_ * config_.player_orbit_speed, config_.player_orbit_radius);
}

void Simulation::spawn_ambient() {
    ambient_timer_ += config_.dt;
    if (ambient_timer_ < config_.ambient_spawn_interval) return;
    ambient_timer_ = 0.0;

    std::uniform_real_distribution<double> angle_dist(0.0, 2.0 * std::numbers::pi);
    std::uniform_real_distribution<double> distance_dist(450.0, 650.0);

    auto position = player_ + core::Vec2::from_angle(angle_dist(rng_), distance_dist(rng_));
    if (!arena_.spawn(position, config_.agent_radius)) {
        spdlog::debug("Population cap reached, no ambient spawn");
    }
}

void Simulation::apply_chase() {
    for (auto& agent : arena_.agents()) {
        if (agent.is_dead || agent.is_managed()) continue;

        auto pull = core::seek(agent.position, player_, config_.chase_strength);
        if (!agent.forces.add_force(core::ForceSource::Local, pull.x, pull.y)) {
            metrics_collector_.record_rejected_force();
        }
    }
}

void Simulation::arbitrate_and_integrate() {
    const double dt = config_.dt;
    const double damping = std::clamp(1.0 - config_.damping * dt, 0.0, 1.0);

    for (auto& agent : arena_.agents()) {
        if (agent.is_dead) continue;

        if (core::update_weights(agent)) {
            metrics_collector_.record_membership_conflict();
        }

        auto net = agent.forces.compute_net_force();

        agent.velocity += net * dt;
        agent.velocity *= damping;

        const double speed = agent.velocity.length();
        if (speed > config_.max_speed) {
            agent.velocity *= config_.max_speed / speed;
        }

        agent.position += agent.velocity * dt;
    }
}

void Simulation::resolve_combat() {
    weapon_timer_ += config_.dt;
    const bool weapon_ready = weapon_timer_ >= config_.weapon_interval;

    core::Agent* nearest = nullptr;
    double nearest_distance = config_.weapon_range;

    for (auto& agent : arena_.agents()) {
        if (agent.is_dead) continue;

        const double d = core::distance(agent.position, player_);
        if (d <= config_.contact_radius + agent.radius) {
            agent.is_dead = true;
            continue;
        }

        if (weapon_ready && d <= nearest_distance) {
            nearest = &agent;
            nearest_distance = d;
        }
    }

    if (weapon_ready) {
        weapon_timer_ = 0.0;
        if (nearest) {
            nearest->is_dead = true;
        }
    }
}

void Simulation::record_trace() {
    core::TickTrace trace;
    trace.tick = current_tick_;
    trace.alive_agents = arena_.alive_count();
    trace.managed_agents = arena_.managed_count();
    trace.active_formations = director_ ? director_->active_count() : 0;
    metrics_collector_.record_tick_trace(trace);
}

void Simulation::log_tick_state() const {
    auto stats = director_->debug_stats();
    spdlog::debug("Tick {}: {} agents, {} formations ({} members), next spawn in {:.1f}s",
                  current_tick_, arena_.alive_count(), stats.active_formations,
                  stats.total_members, stats.next_spawn_in);
}

void Simulation::save_outputs() {
    if (!config_.metrics_output.empty()) {
        try {
            core::emit_metrics_json(config_.metrics_output, metrics_collector_.get_snapshot());
            spdlog::info("Saved metrics to {}", config_.metrics_output.string());
        } catch (const std::exception& e) {
            spdlog::error("Failed to save metrics: {}", e.what());
        }
    }

    if (!config_.trace_output.empty()) {
        try {
            core::emit_trace_csv(config_.trace_output, metrics_collector_.get_traces());
            spdlog::info("Saved trace to {}", config_.trace_output.string());
        } catch (const std::exception& e) {
            spdlog::error("Failed to save trace: {}", e.what());
        }
    }
}

} // namespace phalanx
