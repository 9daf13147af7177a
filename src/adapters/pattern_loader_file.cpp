#include "phalanx/adapters/pattern_loader_file.hpp"
#include <fstream>
#include <sstream>

namespace phalanx::adapters {

std::optional<std::vector<core::PatternDefinition>> PatternLoaderFile::load(
    const std::filesystem::path& path
) const {
    namespace fs = std::filesystem;

    if (!fs::exists(path)) {
        spdlog::error("Pattern file does not exist: {}", path.string());
        return std::nullopt;
    }

    auto lines = read_lines(path);
    if (lines.empty()) {
        spdlog::error("Pattern file is empty: {}", path.string());
        return std::nullopt;
    }

    std::vector<core::PatternDefinition> patterns;
    std::optional<core::PatternDefinition> current;
    bool current_ok = true;
    bool has_enemy_count = false;

    for (const auto& [line_no, line] : lines) {
        std::istringstream in(line);
        std::string keyword;
        in >> keyword;

        if (keyword == "pattern") {
            if (current) {
                spdlog::error("{}:{}: pattern '{}' not closed with 'end'",
                              path.string(), line_no, current->meta.id);
            }
            std::string id;
            in >> id;
            if (id.empty()) {
                spdlog::error("{}:{}: pattern without an id", path.string(), line_no);
            }
            current = core::PatternDefinition{};
            current->meta.id = id;
            current->meta.name = id;
            current_ok = !id.empty();
            has_enemy_count = false;
            continue;
        }

        if (!current) {
            spdlog::error("{}:{}: '{}' outside of a pattern block", path.string(), line_no, keyword);
            continue;
        }

        if (keyword == "end") {
            if (current_ok && validate(*current, has_enemy_count)) {
                patterns.push_back(std::move(*current));
            } else {
                spdlog::error("{}:{}: rejected pattern '{}'", path.string(), line_no, current->meta.id);
            }
            current.reset();
            continue;
        }

        if (keyword == "enemy_count") {
            has_enemy_count = true;
        }

        if (!apply_line(*current, line, line_no)) {
            current_ok = false;
        }
    }

    if (current) {
        spdlog::error("{}: pattern '{}' not closed with 'end'", path.string(), current->meta.id);
    }

    if (patterns.empty()) {
        spdlog::error("No valid formation patterns in {}", path.string());
        return std::nullopt;
    }

    spdlog::info("Loaded {} formation patterns from {}", patterns.size(), path.string());
    return patterns;
}

std::vector<PatternLoaderFile::NumberedLine> PatternLoaderFile::read_lines(
    const std::filesystem::path& path
) const {
    std::vector<NumberedLine> lines;
    std::ifstream file(path);

    if (!file) {
        spdlog::error("Failed to open file: {}", path.string());
        return {};
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;

        // Trim whitespace
        line.erase(0, line.find_first_not_of(" \t\r"));
        line.erase(line.find_last_not_of(" \t\r") + 1);

        // Skip empty lines and comments
        if (line.empty() || line.starts_with("//")) {
            continue;
        }

        lines.emplace_back(line_no, line);
    }

    return lines;
}

bool PatternLoaderFile::apply_line(core::PatternDefinition& def, const std::string& line, int line_no) const {
    std::istringstream in(line);
    std::string key;
    in >> key;

    auto fail = [&](std::string_view what) {
        spdlog::error("line {}: {} in '{}'", line_no, what, line);
        return false;
    };

    if (key == "name") {
        std::string name;
        std::getline(in >> std::ws, name);
        if (name.empty()) return fail("empty name");
        def.meta.name = name;
        return true;
    }

    if (key == "slot") {
        core::SlotTemplate slot;
        if (!(in >> slot.offset.x >> slot.offset.y)) return fail("slot needs x and y");

        std::string flag;
        while (in >> flag) {
            if (flag == "leader") {
                slot.is_leader = true;
            } else if (flag.starts_with("type=")) {
                slot.type = flag.substr(5);
            } else {
                return fail("unknown slot flag");
            }
        }
        def.slots.push_back(std::move(slot));
        return true;
    }

    if (key == "pulse") {
        if (!(in >> def.pulse_amplitude >> def.pulse_frequency)) return fail("pulse needs amplitude and frequency");
        return true;
    }

    if (key == "enemy_count" || key == "min_wave") {
        int value = 0;
        if (!(in >> value)) return fail("expected an integer");
        (key == "enemy_count" ? def.meta.enemy_count : def.min_wave) = value;
        return true;
    }

    double* target = nullptr;
    if (key == "radius") target = &def.radius;
    else if (key == "rotation_speed") target = &def.meta.rotation_speed;
    else if (key == "move_speed") target = &def.meta.move_speed;
    else if (key == "break_distance") target = &def.meta.break_distance;
    else if (key == "spawn_weight") target = &def.spawn_weight;

    if (!target) return fail("unknown key");
    if (!(in >> *target)) return fail("expected a number");
    return true;
}

bool PatternLoaderFile::validate(const core::PatternDefinition& def, bool has_enemy_count) const {
    if (!has_enemy_count) {
        spdlog::error("Pattern '{}' is missing enemy_count", def.meta.id);
        return false;
    }

    if (!def.is_valid()) {
        spdlog::error("Pattern '{}' has invalid parameters", def.meta.id);
        return false;
    }

    if (def.slots.size() < static_cast<std::size_t>(def.meta.enemy_count)) {
        spdlog::warn("Pattern '{}' defines {} slots for {} enemies",
                     def.meta.id, def.slots.size(), def.meta.enemy_count);
    }

    return true;
}

} // namespace phalanx::adapters
