#pragma once

#include "phalanx/core/pattern.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace phalanx::adapters {

// Reads formation pattern definitions from a text file:
//
//   // comment
//   pattern cubic_swarm
//   name Cubic Swarm
//   enemy_count 8
//   radius 60
//   rotation_speed 0.3
//   move_speed 80
//   break_distance 150
//   min_wave 1
//   spawn_weight 2
//   pulse 0.1 2.0
//   slot 1 1 leader
//   slot -1 1 type=fast
//   end
class PatternLoaderFile {
public:
    PatternLoaderFile() = default;

    std::optional<std::vector<core::PatternDefinition>> load(const std::filesystem::path& path) const;

private:
    using NumberedLine = std::pair<int, std::string>;

    std::vector<NumberedLine> read_lines(const std::filesystem::path& path) const;
    bool apply_line(core::PatternDefinition& def, const std::string& line, int line_no) const;
    bool validate(const core::PatternDefinition& def, bool has_enemy_count) const;
};

} // namespace phalanx::adapters
