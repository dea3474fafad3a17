#pragma once

#include <cstdint>
#include <expected>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

enum class BadgeColor { Green, Blue, Red, Gray };

enum class Icon { Default, ClaudeCode, Codex, OpenCode };

std::string to_string(BadgeColor color);
std::string to_string(Icon icon);
std::optional<BadgeColor> badge_color_from_string(const std::string& s);
std::optional<Icon> icon_from_string(const std::string& s);

struct Notification {
    int64_t id = 0;
    std::string badge;
    std::string body;
    BadgeColor badge_color = BadgeColor::Gray;
    Icon icon = Icon::Default;
    std::string repo;
    std::string repo_root;
    std::map<std::string, std::string> metadata;
    std::string tmux_pane;
    std::string terminal_bundle_id;
    bool force_focus = false;
    bool is_read = false;
    std::string created_at;

    // Repository root when it was resolved at ingest, otherwise the group name.
    std::string group_key() const { return repo_root.empty() ? repo : repo_root; }
};

// Everything a producer supplies; id, is_read and created_at are assigned by the store.
struct NotificationInput {
    std::string badge;
    std::string body;
    BadgeColor badge_color = BadgeColor::Gray;
    Icon icon = Icon::Default;
    std::string repo;
    std::string repo_root;
    std::map<std::string, std::string> metadata;
    std::string tmux_pane;
    std::string terminal_bundle_id;
    bool force_focus = false;

    // Directory the event originated from; used to fill repo/repo_root.
    std::string source_directory;

    std::string group_key() const { return repo_root.empty() ? repo : repo_root; }
};

nlohmann::json to_json(const Notification& n);

// Parses the body of a "send" request. Unknown colors and icons are rejected
// so a malformed event is dropped instead of being stored with a guess.
std::expected<NotificationInput, std::string> parse_notification_input(const nlohmann::json& j);
