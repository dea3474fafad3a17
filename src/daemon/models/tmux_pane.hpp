#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

enum class AgentType { Claude, Codex, OpenCode };

enum class AgentStatus { Running, Idle, Waiting };

std::string to_string(AgentType type);
std::string to_string(AgentStatus status);
std::optional<AgentType> agent_type_from_string(const std::string& s);
std::optional<AgentStatus> agent_status_from_string(const std::string& s);

// One tmux pane as seen by a single poll cycle.
struct TmuxPane {
    std::string pane_id;
    int pid = 0;
    std::string session_name;
    std::string window_name;
    std::string cwd;
    bool is_active = false;

    std::optional<AgentType> agent_type;
    std::optional<AgentStatus> agent_status;
    std::optional<std::string> waiting_reason;
    std::vector<std::string> agent_modes;

    std::optional<std::string> git_repo_root;
    std::optional<std::string> git_repo_name;
    std::optional<std::string> git_branch;

    // Repository root when known, otherwise the working directory.
    std::string group_key() const { return git_repo_root.value_or(cwd); }
    std::string group_name() const;
};

nlohmann::json to_json(const TmuxPane& pane);
