#pragma once

#include "phalanx/core/formation.hpp"
#include <memory>
#include <string>
#include <vector>

namespace phalanx::ports {

struct FormationFormedEvent {
    core::FormationId formation_id;
    core::Vec2 center;
    std::vector<core::AgentId> members;
    std::string pattern_id;
};

struct FormationBrokenEvent {
    core::FormationId formation_id;
    core::Vec2 center;
    std::vector<core::AgentId> members;
    core::BreakReason reason = core::BreakReason::None;
};

// Consumed by rendering and audio layers.
class IFormationEventSink {
public:
    virtual ~IFormationEventSink() = default;

    virtual void on_formation_formed(const FormationFormedEvent& event) = 0;
    virtual void on_formation_broken(const FormationBrokenEvent& event) = 0;
};

using EventSinkPtr = std::unique_ptr<IFormationEventSink>;

} // namespace phalanx::ports
