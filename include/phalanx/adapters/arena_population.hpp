#pragma once

#include "phalanx/core/arena.hpp"
#include "phalanx/ports/population.hpp"

namespace phalanx::adapters {

class ArenaPopulation : public phalanx::ports::IAgentPopulation {
public:
    explicit ArenaPopulation(core::Arena& arena, double agent_radius = 15.0)
        : arena_(arena), agent_radius_(agent_radius) {}
    ~ArenaPopulation() override = default;

    std::optional<core::AgentId> recruit(const core::Vec2& position) override;
    core::Agent* find(const core::AgentId& id) override;
    phalanx::ports::PopulationCensus census() const override;

private:
    core::Arena& arena_;
    double agent_radius_;
};

} // namespace phalanx::adapters
