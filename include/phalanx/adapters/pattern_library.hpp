#pragma once

#include "phalanx/ports/pattern_provider.hpp"
#include <unordered_map>
#include <vector>

namespace phalanx::adapters {

class PatternLibrary : public phalanx::ports::IPatternProvider {
public:
    PatternLibrary() = default;
    explicit PatternLibrary(std::vector<core::PatternDefinition> patterns);
    ~PatternLibrary() override = default;

    // The four geometric shapes: cubic swarm, pyramid squadron,
    // octahedron ring and line wedge.
    static PatternLibrary with_builtin_patterns();
    static std::vector<core::PatternDefinition> builtin_patterns();

    // Replaces any pattern with the same id. Invalid definitions are refused.
    bool add(core::PatternDefinition pattern);

    std::optional<std::string> select_pattern(int progression, std::mt19937_64& rng) override;
    std::optional<core::PatternMetadata> metadata(const std::string& pattern_id) const override;
    std::vector<core::SlotDescriptor> slots(
        const std::string& pattern_id,
        const core::Vec2& center,
        double rotation,
        double time
    ) const override;

    std::vector<const core::PatternDefinition*> available(int progression) const;
    const core::PatternDefinition* get(const std::string& pattern_id) const;
    std::size_t size() const { return order_.size(); }

private:
    std::unordered_map<std::string, core::PatternDefinition> patterns_;
    std::vector<std::string> order_;  // insertion order keeps selection deterministic
};

} // namespace phalanx::adapters
