#include "phalanx/core/local_forces.hpp"
#include <algorithm>
#include <cmath>

namespace phalanx::core {

Cell LocalForceProducer::cell_of(const Vec2& position) const {
    return {static_cast<int>(std::floor(position.x / config_.grid_cell_size)),
            static_cast<int>(std::floor(position.y / config_.grid_cell_size))};
}

void LocalForceProducer::rebuild_grid(const std::vector<Agent>& agents) {
    grid_.clear();
    for (std::size_t i = 0; i < agents.size(); ++i) {
        if (agents[i].is_dead || !agents[i].position.is_finite()) continue;
        grid_[cell_of(agents[i].position)].push_back(i);
    }
}

LocalForces LocalForceProducer::compute(const Agent& agent, const std::vector<Agent>& agents, double dt) const {
    LocalForces out;
    if (agent.is_dead) return out;

    const double separation_radius = agent.radius * config_.separation_radius_factor;
    const double neighbor_radius = agent.radius * config_.neighbor_radius_factor;
    const double hard_overlap_radius = agent.radius * config_.hard_overlap_factor;

    const double separation_radius_sq = separation_radius * separation_radius;
    const double neighbor_radius_sq = neighbor_radius * neighbor_radius;
    const double hard_overlap_radius_sq = hard_overlap_radius * hard_overlap_radius;

    Vec2 separation, alignment, cohesion, collision;
    int neighbor_count = 0;
    std::size_t checked = 0;

    const Cell home = cell_of(agent.position);

    for (int dx = -1; dx <= 1 && checked < config_.max_neighbors; ++dx) {
        for (int dy = -1; dy <= 1 && checked < config_.max_neighbors; ++dy) {
            auto it = grid_.find({home.x + dx, home.y + dy});
            if (it == grid_.end()) continue;

            for (auto index : it->second) {
                if (index >= agents.size()) continue;
                const Agent& other = agents[index];
                if (other.id == agent.id || other.is_dead) continue;

                if (++checked > config_.max_neighbors) break;

                const Vec2 delta = agent.position - other.position;
                const double dist_sq = delta.length_squared();
                if (dist_sq > neighbor_radius_sq) continue;

                const bool same_group = agent.in_same_group(other);
                const double combined_radii = agent.radius + other.radius;

                // Emergency separation on actual overlap
                if (dist_sq < hard_overlap_radius_sq && dist_sq > 0.01) {
                    const double dist = std::sqrt(dist_sq);
                    const double penetration = std::max(0.0, combined_radii * 0.9 - dist);
                    if (penetration > 0.0) {
                        const double scale = same_group ? config_.same_group_collision_strength
                                                        : config_.other_collision_strength;
                        const double push = scale * (penetration / combined_radii);
                        collision += delta * (push * dt / dist);
                    }
                }

                if (dist_sq < separation_radius_sq && dist_sq > 0.1) {
                    const double dist = std::sqrt(dist_sq);
                    const double proximity = 1.0 - dist / separation_radius;
                    const double scale = same_group ? config_.same_group_separation_scale : 1.0;

                    if (scale * proximity >= 0.05) {
                        // quadratic falloff
                        const double force = config_.separation_strength * scale * proximity * proximity;
                        separation += delta * (force / dist);
                    }
                }

                alignment += other.velocity;
                cohesion += other.position;
                ++neighbor_count;
            }
        }
    }

    out.local = separation * dt;

    if (neighbor_count > 0 && !agent.is_managed()) {
        alignment = alignment / neighbor_count;
        const double align_mag = alignment.length();
        if (align_mag > 0.1) {
            out.local += alignment * (config_.alignment_strength * dt / align_mag);
        }

        const Vec2 to_center = cohesion / neighbor_count - agent.position;
        const double center_dist = to_center.length();
        if (center_dist > 0.1) {
            out.local += to_center * (config_.cohesion_strength * dt / center_dist);
        }
    }

    out.collision = collision;
    return out;
}

std::size_t LocalForceProducer::apply(std::vector<Agent>& agents, double dt) {
    rebuild_grid(agents);

    std::size_t rejected = 0;
    for (auto& agent : agents) {
        if (agent.is_dead) continue;

        auto forces = compute(agent, agents, dt);
        if (!agent.forces.add_force(ForceSource::Local, forces.local.x, forces.local.y)) ++rejected;
        if (!agent.forces.add_force(ForceSource::Collision, forces.collision.x, forces.collision.y)) ++rejected;
    }
    return rejected;
}

} // namespace phalanx::core
