#pragma once

#include "phalanx/core/types.hpp"
#include <optional>
#include <unordered_map>
#include <vector>

namespace phalanx::core {

// Owns every live agent. Storage is a dense vector with swap-with-last
// removal; Agent pointers are only valid until the next spawn or sweep.
class Arena {
public:
    explicit Arena(std::size_t capacity) : capacity_(capacity) {}

    std::optional<AgentId> spawn(const Vec2& position, double radius = 15.0);

    Agent* find(const AgentId& id);
    const Agent* find(const AgentId& id) const;

    bool kill(const AgentId& id);
    std::size_t sweep_dead();
    void clear();

    std::vector<Agent>& agents() { return agents_; }
    const std::vector<Agent>& agents() const { return agents_; }

    std::size_t alive_count() const;
    std::size_t managed_count() const;
    std::size_t capacity() const { return capacity_; }
    void set_capacity(std::size_t capacity) { capacity_ = capacity; }

private:
    std::size_t capacity_;
    std::vector<Agent> agents_;
    std::unordered_map<AgentId, std::size_t, IdHash> index_;
    boost::uuids::random_generator uuid_gen_;

    void remove_at(std::size_t i);
};

} // namespace phalanx::core
