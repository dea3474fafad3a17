#pragma once

#include <string>
#include <vector>

struct AgentHookSettings {
    // Event keys that produce a notification at all.
    std::vector<std::string> events;
    // Event keys that jump straight to the pane instead of toasting.
    std::vector<std::string> focus_events;
    bool include_body = true;

    bool enabled(const std::string& event) const;
    bool focuses(const std::string& event) const;
};

// The "hooks" section of config.json. The daemon ignores it; only the hook
// adapters read it.
struct HookSettings {
    AgentHookSettings claude{.events = {"Stop", "permission_prompt", "idle_prompt"}};
    AgentHookSettings codex{.events = {"agent-turn-complete"}};
    AgentHookSettings opencode{.events = {"session.status", "session.error", "permission.asked"}};

    static HookSettings load(const std::string& path);
};
