#pragma once

#include "models/tmux_pane.hpp"

#include <expected>
#include <optional>
#include <regex>
#include <string>
#include <vector>

struct WaitingPattern {
    std::string source;
    std::regex regex;
    std::string reason;
    // Ignored while an idle prompt is visible (a stale selection cursor).
    bool unless_prompt = false;
};

struct ModePattern {
    std::regex regex;
    std::string mode;
};

// Screen-scraping rules for one agent CLI.
struct RuleTable {
    AgentType agent = AgentType::Claude;

    std::vector<std::string> prompt_glyphs;
    // Busy-animation frames; only count as the first codepoint of a line.
    std::vector<std::string> spinner_glyphs;
    // When non-empty, a spinner line must also contain one of these.
    std::vector<std::string> spinner_requires;

    std::vector<std::regex> running_patterns;
    std::vector<WaitingPattern> waiting_patterns;
    // Footer and status lines the prompt walk looks past.
    std::vector<std::regex> skip_patterns;
    std::vector<ModePattern> mode_patterns;

    // Status implied by a screen with no signal at all (e.g. a UI without a prompt glyph).
    std::optional<AgentStatus> quiet_status;

    int scan_lines = 30;
    int max_unknown_lines = 3;
};

class RuleSet {
public:
    static RuleSet defaults();
    static std::expected<RuleSet, std::string> parse(const std::string& json_text);
    static std::expected<RuleSet, std::string> load(const std::string& path);

    const RuleTable* table(AgentType agent) const;
    int version() const { return version_; }

private:
    int version_ = 0;
    std::vector<RuleTable> tables_;
};
