#pragma once

#include "detector/rule_table.hpp"
#include "models/tmux_pane.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct Classification {
    std::optional<AgentStatus> status;
    std::optional<std::string> waiting_reason;
    std::vector<std::string> agent_modes;

    bool operator==(const Classification&) const = default;
};

// Pure classifier: the same capture, rule set and previous state always yield
// the same result. Debouncing across polls is left to the caller.
class StatusDetector {
public:
    explicit StatusDetector(const RuleSet& rules);

    Classification classify(std::optional<AgentType> agent, std::string_view screen,
                            const std::optional<Classification>& previous = std::nullopt) const;

private:
    bool at_prompt(const RuleTable& table, const std::vector<std::string>& lines) const;
    std::optional<std::string> waiting_reason(const RuleTable& table,
                                              const std::vector<std::string>& lines,
                                              bool prompt_visible) const;
    bool is_running(const RuleTable& table, const std::vector<std::string>& lines) const;
    std::vector<std::string> modes(const RuleTable& table, const std::vector<std::string>& lines) const;

    const RuleSet& rules_;
};
