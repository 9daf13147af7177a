#pragma once

#include "phalanx/core/types.hpp"
#include <unordered_map>
#include <vector>

namespace phalanx::core {

struct LocalForceConfig {
    double grid_cell_size = 80.0;
    std::size_t max_neighbors = 12;

    // Radii as multiples of the agent radius
    double separation_radius_factor = 2.2;
    double neighbor_radius_factor = 2.2 * 1.8;
    double hard_overlap_factor = 1.6;

    double separation_strength = 600.0;
    double same_group_separation_scale = 0.15;
    double alignment_strength = 50.0;
    double cohesion_strength = 15.0;

    double same_group_collision_strength = 200.0;
    double other_collision_strength = 500.0;
};

struct LocalForces {
    Vec2 local;
    Vec2 collision;
};

// Flocking and overlap separation from nearby agents, one grid pass per
// agent. Managed agents only get separation; their formation or
// constellation supplies alignment and cohesion.
class LocalForceProducer {
public:
    explicit LocalForceProducer(LocalForceConfig config = {}) : config_(config) {}

    void rebuild_grid(const std::vector<Agent>& agents);

    LocalForces compute(const Agent& agent, const std::vector<Agent>& agents, double dt) const;

    // Deposits local and collision forces on every live agent. Returns the
    // number of contributions the arbiters rejected.
    std::size_t apply(std::vector<Agent>& agents, double dt);

    const LocalForceConfig& config() const { return config_; }

private:
    LocalForceConfig config_;
    std::unordered_map<Cell, std::vector<std::size_t>, CellHash> grid_;

    Cell cell_of(const Vec2& position) const;
};

} // namespace phalanx::core
