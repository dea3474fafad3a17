#include "models/tmux_pane.hpp"

#include <filesystem>

std::string to_string(AgentType type) {
    switch (type) {
        case AgentType::Claude: return "claude";
        case AgentType::Codex: return "codex";
        case AgentType::OpenCode: return "opencode";
    }
    return "unknown";
}

std::string to_string(AgentStatus status) {
    switch (status) {
        case AgentStatus::Running: return "running";
        case AgentStatus::Idle: return "idle";
        case AgentStatus::Waiting: return "waiting";
    }
    return "unknown";
}

std::optional<AgentType> agent_type_from_string(const std::string& s) {
    if (s == "claude") return AgentType::Claude;
    if (s == "codex") return AgentType::Codex;
    if (s == "opencode") return AgentType::OpenCode;
    return std::nullopt;
}

std::optional<AgentStatus> agent_status_from_string(const std::string& s) {
    if (s == "running") return AgentStatus::Running;
    if (s == "idle") return AgentStatus::Idle;
    if (s == "waiting") return AgentStatus::Waiting;
    return std::nullopt;
}

std::string TmuxPane::group_name() const {
    if (git_repo_name && !git_repo_name->empty()) return *git_repo_name;
    auto name = std::filesystem::path(group_key()).filename().string();
    return name.empty() ? group_key() : name;
}

nlohmann::json to_json(const TmuxPane& pane) {
    auto optional_text = [](const std::optional<std::string>& v) -> nlohmann::json {
        if (!v) return nullptr;
        return *v;
    };

    nlohmann::json j = {
        {"pane_id", pane.pane_id},
        {"pid", pane.pid},
        {"session_name", pane.session_name},
        {"window_name", pane.window_name},
        {"cwd", pane.cwd},
        {"is_active", pane.is_active},
        {"agent_type", pane.agent_type ? nlohmann::json(to_string(*pane.agent_type)) : nullptr},
        {"agent_status", pane.agent_status ? nlohmann::json(to_string(*pane.agent_status)) : nullptr},
        {"waiting_reason", optional_text(pane.waiting_reason)},
        {"agent_modes", pane.agent_modes},
        {"git_repo_root", optional_text(pane.git_repo_root)},
        {"git_repo_name", optional_text(pane.git_repo_name)},
        {"git_branch", optional_text(pane.git_branch)},
    };
    return j;
}
