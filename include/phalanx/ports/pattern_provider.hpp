#pragma once

#include "phalanx/core/pattern.hpp"
#include <concepts>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace phalanx::ports {

class IPatternProvider {
public:
    virtual ~IPatternProvider() = default;

    // Picks a pattern for the given progression signal (wave index).
    virtual std::optional<std::string> select_pattern(int progression, std::mt19937_64& rng) = 0;

    virtual std::optional<core::PatternMetadata> metadata(const std::string& pattern_id) const = 0;

    // Ordered slot positions. May be shorter than the pattern's enemy_count.
    virtual std::vector<core::SlotDescriptor> slots(
        const std::string& pattern_id,
        const core::Vec2& center,
        double rotation,
        double time
    ) const = 0;
};

template<typename T>
concept PatternProviderImpl = std::derived_from<T, IPatternProvider>;

using PatternProviderPtr = std::unique_ptr<IPatternProvider>;

} // namespace phalanx::ports
