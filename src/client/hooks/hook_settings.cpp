#include "hooks/hook_settings.hpp"

#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

using json = nlohmann::json;

namespace {

void read_agent(const json& j, AgentHookSettings& out) {
    if (j.contains("events")) out.events = j["events"].get<std::vector<std::string>>();
    if (j.contains("focus_events")) out.focus_events = j["focus_events"].get<std::vector<std::string>>();
    if (j.contains("include_body")) out.include_body = j["include_body"].get<bool>();
}

} // namespace

bool AgentHookSettings::enabled(const std::string& event) const {
    return std::ranges::find(events, event) != events.end();
}

bool AgentHookSettings::focuses(const std::string& event) const {
    return std::ranges::find(focus_events, event) != focus_events.end();
}

HookSettings HookSettings::load(const std::string& path) {
    HookSettings settings;
    std::ifstream f(path);
    if (!f.is_open()) return settings;

    try {
        auto j = json::parse(f);
        if (!j.contains("hooks")) return settings;

        auto& h = j["hooks"];
        if (h.contains("claude")) read_agent(h["claude"], settings.claude);
        if (h.contains("codex")) read_agent(h["codex"], settings.codex);
        if (h.contains("opencode")) read_agent(h["opencode"], settings.opencode);
    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error in hooks: {}", e.what());
        return HookSettings{};
    }

    return settings;
}
