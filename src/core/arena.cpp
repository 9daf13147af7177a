#include "phalanx/core/arena.hpp"
#include <algorithm>

namespace phalanx::core {

std::optional<AgentId> Arena::spawn(const Vec2& position, double radius) {
    if (alive_count() >= capacity_) {
        return std::nullopt;
    }

    if (!position.is_finite()) {
        return std::nullopt;
    }

    Agent agent;
    agent.id = uuid_gen_();
    agent.position = position;
    agent.radius = radius;

    index_[agent.id] = agents_.size();
    agents_.push_back(std::move(agent));
    return agents_.back().id;
}

Agent* Arena::find(const AgentId& id) {
    auto it = index_.find(id);
    return it != index_.end() ? &agents_[it->second] : nullptr;
}

const Agent* Arena::find(const AgentId& id) const {
    auto it = index_.find(id);
    return it != index_.end() ? &agents_[it->second] : nullptr;
}

bool Arena::kill(const AgentId& id) {
    auto agent = find(id);
    if (!agent || agent->is_dead) {
        return false;
    }
    agent->is_dead = true;
    return true;
}

std::size_t Arena::sweep_dead() {
    std::size_t removed = 0;
    for (std::size_t i = agents_.size(); i-- > 0;) {
        if (agents_[i].is_dead) {
            remove_at(i);
            ++removed;
        }
    }
    return removed;
}

void Arena::clear() {
    agents_.clear();
    index_.clear();
}

std::size_t Arena::alive_count() const {
    return std::count_if(agents_.begin(), agents_.end(),
        [](const Agent& a) { return !a.is_dead; });
}

std::size_t Arena::managed_count() const {
    return std::count_if(agents_.begin(), agents_.end(),
        [](const Agent& a) { return !a.is_dead && a.is_managed(); });
}

void Arena::remove_at(std::size_t i) {
    index_.erase(agents_[i].id);

    if (i != agents_.size() - 1) {
        agents_[i] = std::move(agents_.back());
        index_[agents_[i].id] = i;
    }
    agents_.pop_back();
}

} // namespace phalanx::core
