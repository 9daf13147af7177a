#pragma once

#include "phalanx/core/types.hpp"
#include <optional>

namespace phalanx::ports {

struct PopulationCensus {
    std::size_t alive = 0;
    std::size_t cap = 0;
};

class IAgentPopulation {
public:
    virtual ~IAgentPopulation() = default;

    // Hands over an agent placed at position, or nullopt when the cap is hit.
    virtual std::optional<core::AgentId> recruit(const core::Vec2& position) = 0;

    // nullptr once the agent no longer exists.
    virtual core::Agent* find(const core::AgentId& id) = 0;

    virtual PopulationCensus census() const = 0;
};

} // namespace phalanx::ports
