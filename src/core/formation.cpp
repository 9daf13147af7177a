#include "phalanx/core/formation.hpp"
#include <utility>

namespace phalanx::core {

std::string_view to_string(BreakReason reason) noexcept {
    switch (reason) {
        case BreakReason::None: return "none";
        case BreakReason::TargetReached: return "target_reached";
        case BreakReason::Collapsed: return "collapsed";
        case BreakReason::Reset: return "reset";
        case BreakReason::EmptySpawn: return "empty_spawn";
    }
    return "unknown";
}

std::size_t Formation::min_viable_size() const noexcept {
    const int designed = designed_size();
    if (designed <= 0) return 1;
    // ceil(30% of designed size)
    return static_cast<std::size_t>((designed * 3 + 9) / 10);
}

std::vector<AgentId> Formation::member_ids() const {
    std::vector<AgentId> ids;
    ids.reserve(members.size());
    for (const auto& member : members) {
        ids.push_back(member.agent_id);
    }
    return ids;
}

void Formation::remove_member_at(std::size_t i) {
    if (i >= members.size()) return;
    if (i != members.size() - 1) {
        members[i] = std::move(members.back());
    }
    members.pop_back();
}

} // namespace phalanx::core
