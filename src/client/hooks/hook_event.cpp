#include "hooks/hook_event.hpp"

#include <cstdlib>

using json = nlohmann::json;

namespace {

std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return v ? v : "";
}

std::string string_field(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return {};
    return j[key].get<std::string>();
}

json base_request(const HookEnv& env, const std::string& directory) {
    json req = {{"cmd", "send"}};
    if (!env.tmux_pane.empty()) req["tmux_pane"] = env.tmux_pane;
    if (!env.terminal_id.empty()) req["terminal_bundle_id"] = env.terminal_id;
    if (!directory.empty()) req["source_directory"] = directory;
    return req;
}

std::optional<json> claude_request(const ClaudeHookEvent& e, const AgentHookSettings& s, const HookEnv& env) {
    auto key = e.event_key();
    if (!s.enabled(key)) return std::nullopt;

    bool is_stop = e.hook_event_name == "Stop";
    auto req = base_request(env, e.cwd);
    req["badge"] = is_stop ? "Stop" : "Notification";
    req["badge_color"] = is_stop ? "green" : "blue";
    req["body"] = e.message;
    req["icon"] = "claude-code";
    req["force_focus"] = s.focuses(key);
    return req;
}

std::optional<json> codex_request(const CodexHookEvent& e, const AgentHookSettings& s, const HookEnv& env) {
    if (!s.enabled(e.type)) return std::nullopt;

    auto req = base_request(env, e.cwd);
    req["badge"] = "Stop";
    req["badge_color"] = "green";
    req["body"] = s.include_body ? truncate_utf8(e.last_assistant_message, kCodexBodyMaxBytes) : "";
    req["icon"] = "codex";
    req["force_focus"] = s.focuses(e.type);
    return req;
}

std::optional<json> opencode_request(const OpenCodeHookEvent& e, const AgentHookSettings& s, const HookEnv& env) {
    if (!s.enabled(e.type)) return std::nullopt;
    if (e.type == "session.status" && e.status_type != "idle") return std::nullopt;

    const char* badge = "Notification";
    const char* color = "gray";
    if (e.type == "session.status") {
        badge = "Stop";
        color = "green";
    } else if (e.type == "session.error") {
        badge = "Error";
        color = "red";
    } else if (e.type == "permission.asked") {
        badge = "Permission";
        color = "blue";
    }

    auto req = base_request(env, e.directory);
    req["badge"] = badge;
    req["badge_color"] = color;
    req["icon"] = "opencode";
    req["force_focus"] = s.focuses(e.type);
    return req;
}

} // namespace

HookEnv HookEnv::from_environment() {
    return {
        .tmux_pane = env_or_empty("TMUX_PANE"),
        .terminal_id = env_or_empty("PANETOAST_TERMINAL_ID"),
    };
}

std::expected<HookEvent, std::string> parse_hook_event(std::string_view agent, const std::string& payload) {
    try {
        auto j = json::parse(payload);
        if (!j.is_object()) return std::unexpected("hook payload must be a JSON object");

        if (agent == "claude") {
            return ClaudeHookEvent{
                .hook_event_name = j.at("hook_event_name").get<std::string>(),
                .notification_type = string_field(j, "notification_type"),
                .message = string_field(j, "message"),
                .cwd = string_field(j, "cwd"),
            };
        }
        if (agent == "codex") {
            return CodexHookEvent{
                .type = j.at("type").get<std::string>(),
                .last_assistant_message = string_field(j, "last-assistant-message"),
                .cwd = string_field(j, "cwd"),
            };
        }
        if (agent == "opencode") {
            OpenCodeHookEvent e{.type = j.at("type").get<std::string>(), .directory = string_field(j, "directory")};
            if (j.contains("properties") && j["properties"].is_object()) {
                auto& props = j["properties"];
                if (props.contains("status") && props["status"].is_object()) {
                    e.status_type = string_field(props["status"], "type");
                }
            }
            return e;
        }
    } catch (const json::exception& e) {
        return std::unexpected(std::string("Failed to parse JSON: ") + e.what());
    }
    return std::unexpected("unknown agent: " + std::string(agent));
}

std::optional<json> to_send_request(const HookEvent& event, const HookSettings& settings, const HookEnv& env) {
    if (auto* e = std::get_if<ClaudeHookEvent>(&event)) return claude_request(*e, settings.claude, env);
    if (auto* e = std::get_if<CodexHookEvent>(&event)) return codex_request(*e, settings.codex, env);
    return opencode_request(std::get<OpenCodeHookEvent>(event), settings.opencode, env);
}

std::string truncate_utf8(const std::string& s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s;

    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) cut--;
    return s.substr(0, cut) + "...";
}

json hook_result(const std::expected<void, std::string>& outcome) {
    if (outcome) return {{"success", true}};
    return {{"success", false}, {"error", outcome.error()}};
}
