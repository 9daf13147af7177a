#pragma once

#include "phalanx/core/force_arbiter.hpp"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/functional/hash.hpp>
#include <variant>
#include <cstdint>

namespace phalanx::core {

using AgentId = boost::uuids::uuid;
using FormationId = boost::uuids::uuid;
using ConstellationId = boost::uuids::uuid;
using Tick = std::uint64_t;

using IdHash = boost::hash<boost::uuids::uuid>;

struct FormationMarker {
    FormationId formation_id;
    std::size_t slot_index = 0;
    bool is_leader = false;

    bool operator==(const FormationMarker& other) const noexcept = default;
};

struct ConstellationMarker {
    ConstellationId constellation_id;
    Vec2 anchor;

    bool operator==(const ConstellationMarker& other) const noexcept = default;
};

// An agent belongs to at most one group structure at a time.
using GroupMembership = std::variant<std::monostate, FormationMarker, ConstellationMarker>;

struct Agent {
    AgentId id;
    Vec2 position;
    Vec2 velocity;
    double radius = 15.0;
    bool is_dead = false;
    GroupMembership membership;
    ForceArbiter forces;

    bool operator==(const Agent& other) const noexcept {
        return id == other.id;
    }

    const FormationMarker* formation() const noexcept {
        return std::get_if<FormationMarker>(&membership);
    }

    const ConstellationMarker* constellation() const noexcept {
        return std::get_if<ConstellationMarker>(&membership);
    }

    bool is_managed() const noexcept {
        return !std::holds_alternative<std::monostate>(membership);
    }

    bool in_same_group(const Agent& other) const noexcept;
};

inline bool Agent::in_same_group(const Agent& other) const noexcept {
    if (auto mine = formation()) {
        auto theirs = other.formation();
        return theirs && theirs->formation_id == mine->formation_id;
    }
    if (auto mine = constellation()) {
        auto theirs = other.constellation();
        return theirs && theirs->constellation_id == mine->constellation_id;
    }
    return false;
}

inline MembershipFlags membership_flags(const Agent& agent) noexcept {
    return {agent.formation() != nullptr, agent.constellation() != nullptr};
}

// Syncs the agent's arbiter weights with its current membership.
inline bool update_weights(Agent& agent) {
    return agent.forces.update_weights(membership_flags(agent));
}

// Returns true when a constellation marker had to be cleared to make room.
inline bool assign_formation(Agent& agent, const FormationMarker& marker) {
    bool cleared_constellation = agent.constellation() != nullptr;
    agent.membership = marker;
    return cleared_constellation;
}

inline void clear_membership(Agent& agent) noexcept {
    agent.membership = std::monostate{};
}

struct Cell {
    int x;
    int y;

    bool operator==(const Cell& other) const noexcept {
        return x == other.x && y == other.y;
    }

    bool operator!=(const Cell& other) const noexcept {
        return !(*this == other);
    }
};

struct CellHash {
    std::size_t operator()(const Cell& cell) const noexcept {
        std::size_t seed = 0;
        boost::hash_combine(seed, cell.x);
        boost::hash_combine(seed, cell.y);
        return seed;
    }
};

} // namespace phalanx::core
