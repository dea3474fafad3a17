#pragma once

#include "hooks/hook_settings.hpp"

#include <cstddef>
#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

// Claude Code hook payload (read from stdin).
struct ClaudeHookEvent {
    std::string hook_event_name;
    std::string notification_type;
    std::string message;
    std::string cwd;

    // Notification hooks are configured by their sub-type, everything else by name.
    std::string event_key() const {
        return notification_type.empty() ? hook_event_name : notification_type;
    }
};

// Codex `notify` payload (passed as an argument).
struct CodexHookEvent {
    std::string type;
    std::string last_assistant_message;
    std::string cwd;
};

// OpenCode plugin event (passed as an argument).
struct OpenCodeHookEvent {
    std::string type;
    // properties.status.type, set for session.status only.
    std::string status_type;
    std::string directory;
};

using HookEvent = std::variant<ClaudeHookEvent, CodexHookEvent, OpenCodeHookEvent>;

// Values taken from the hook's environment.
struct HookEnv {
    std::string tmux_pane;
    std::string terminal_id;

    static HookEnv from_environment();
};

inline constexpr size_t kCodexBodyMaxBytes = 200;

std::expected<HookEvent, std::string> parse_hook_event(std::string_view agent, const std::string& payload);

// The daemon "send" request for the event, or nullopt when the event is not
// enabled (or is a non-idle session.status).
std::optional<nlohmann::json> to_send_request(const HookEvent& event, const HookSettings& settings,
                                              const HookEnv& env);

// Cuts at a UTF-8 boundary no later than `max_bytes` and appends "...".
std::string truncate_utf8(const std::string& s, size_t max_bytes);

nlohmann::json hook_result(const std::expected<void, std::string>& outcome);
