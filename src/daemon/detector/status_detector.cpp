#include "detector/status_detector.hpp"

#include "detector/screen_text.hpp"

#include <algorithm>
#include <regex>

namespace {

bool matches_any(const std::vector<std::regex>& patterns, const std::string& line) {
    return std::ranges::any_of(patterns, [&](const std::regex& re) {
        return std::regex_search(line, re);
    });
}

bool is_numbered_option(std::string_view s) {
    size_t i = 0;
    while (i < s.size() && s[i] == ' ') i++;
    size_t digits = 0;
    while (i < s.size() && s[i] >= '0' && s[i] <= '9') {
        i++;
        digits++;
    }
    return digits > 0 && i < s.size() && s[i] == '.';
}

// A prompt glyph followed by nothing, a space or a no-break space, but not by
// a numbered option (that is a selection cursor, not an input prompt).
bool is_prompt_line(const std::vector<std::string>& glyphs, const std::string& line) {
    for (auto& glyph : glyphs) {
        if (!line.starts_with(glyph)) continue;
        std::string_view rest(line);
        rest.remove_prefix(glyph.size());
        if (!rest.empty() && rest[0] != ' ' && !rest.starts_with("\xC2\xA0")) continue;
        if (is_numbered_option(screen::trim(rest))) continue;
        return true;
    }
    return false;
}

} // namespace

StatusDetector::StatusDetector(const RuleSet& rules)
    : rules_(rules) {}

Classification StatusDetector::classify(std::optional<AgentType> agent, std::string_view screen_text,
                                        const std::optional<Classification>& previous) const {
    if (!agent) return {};

    auto retained = [&]() -> Classification {
        if (previous && previous->status) {
            return {previous->status, previous->waiting_reason, {}};
        }
        return {AgentStatus::Running, std::nullopt, {}};
    };

    const RuleTable* table = rules_.table(*agent);
    if (!table) return retained();

    auto lines = screen::tail_lines(screen::strip_ansi(screen_text), table->scan_lines);

    Classification result;
    bool prompt = at_prompt(*table, lines);

    if (auto reason = waiting_reason(*table, lines, prompt)) {
        result.status = AgentStatus::Waiting;
        result.waiting_reason = std::move(reason);
    } else if (is_running(*table, lines)) {
        result.status = AgentStatus::Running;
    } else if (prompt) {
        result.status = AgentStatus::Idle;
    } else if (table->quiet_status) {
        result.status = table->quiet_status;
    } else {
        result = retained();
    }

    result.agent_modes = modes(*table, lines);
    return result;
}

bool StatusDetector::at_prompt(const RuleTable& table, const std::vector<std::string>& lines) const {
    if (table.prompt_glyphs.empty()) return false;

    int unknown = 0;
    for (auto& line : lines) {
        if (matches_any(table.skip_patterns, line)) continue;
        if (is_prompt_line(table.prompt_glyphs, line)) return true;
        if (++unknown > table.max_unknown_lines) return false;
    }
    return false;
}

std::optional<std::string> StatusDetector::waiting_reason(const RuleTable& table,
                                                          const std::vector<std::string>& lines,
                                                          bool prompt_visible) const {
    for (auto& line : lines) {
        for (auto& wp : table.waiting_patterns) {
            if (wp.unless_prompt && prompt_visible) continue;
            if (std::regex_search(line, wp.regex)) return wp.reason;
        }
    }
    return std::nullopt;
}

bool StatusDetector::is_running(const RuleTable& table, const std::vector<std::string>& lines) const {
    for (auto& line : lines) {
        auto lead = screen::first_codepoint(line);
        bool spinner = std::ranges::any_of(table.spinner_glyphs, [&](const std::string& g) { return lead == g; });
        if (spinner) {
            if (table.spinner_requires.empty()) return true;
            bool companion = std::ranges::any_of(table.spinner_requires, [&](const std::string& r) {
                return line.find(r) != std::string::npos;
            });
            if (companion) return true;
        }
        if (matches_any(table.running_patterns, line)) return true;
    }
    return false;
}

std::vector<std::string> StatusDetector::modes(const RuleTable& table,
                                               const std::vector<std::string>& lines) const {
    std::vector<std::string> found;
    for (auto& line : lines) {
        for (auto& mp : table.mode_patterns) {
            if (std::ranges::find(found, mp.mode) != found.end()) continue;
            if (std::regex_search(line, mp.regex)) found.push_back(mp.mode);
        }
    }
    return found;
}
