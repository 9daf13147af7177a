#pragma once

#include "phalanx/core/types.hpp"
#include "phalanx/core/pattern.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace phalanx::core {

enum class FormationState {
    Spawning,
    Active,
    Breaking,
    Inactive
};

enum class BreakReason {
    None,
    TargetReached,  // came within break distance of its target
    Collapsed,      // too few members survived
    Reset,          // director was reset
    EmptySpawn      // no member could be created
};

std::string_view to_string(BreakReason reason) noexcept;

struct FormationMember {
    AgentId agent_id;
    std::size_t slot_index = 0;
    bool is_leader = false;
    Vec2 last_slot;
};

struct Formation {
    FormationId id;
    PatternMetadata pattern;
    Vec2 center;
    double rotation = 0.0;
    double time = 0.0;
    bool active = false;
    FormationState state = FormationState::Spawning;
    BreakReason break_reason = BreakReason::None;
    std::vector<FormationMember> members;

    const std::string& pattern_id() const noexcept { return pattern.id; }
    int designed_size() const noexcept { return pattern.enemy_count; }

    std::size_t min_viable_size() const noexcept;
    bool is_viable() const noexcept { return members.size() >= min_viable_size(); }

    std::vector<AgentId> member_ids() const;

    // O(1) removal; member order is not meaningful, slots travel with members.
    void remove_member_at(std::size_t i);
};

} // namespace phalanx::core
