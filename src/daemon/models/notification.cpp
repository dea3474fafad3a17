#include "models/notification.hpp"

std::string to_string(BadgeColor color) {
    switch (color) {
        case BadgeColor::Green: return "green";
        case BadgeColor::Blue: return "blue";
        case BadgeColor::Red: return "red";
        case BadgeColor::Gray: return "gray";
    }
    return "gray";
}

std::string to_string(Icon icon) {
    switch (icon) {
        case Icon::Default: return "default";
        case Icon::ClaudeCode: return "claude-code";
        case Icon::Codex: return "codex";
        case Icon::OpenCode: return "opencode";
    }
    return "default";
}

std::optional<BadgeColor> badge_color_from_string(const std::string& s) {
    if (s == "green") return BadgeColor::Green;
    if (s == "blue") return BadgeColor::Blue;
    if (s == "red") return BadgeColor::Red;
    if (s == "gray") return BadgeColor::Gray;
    return std::nullopt;
}

std::optional<Icon> icon_from_string(const std::string& s) {
    if (s == "default") return Icon::Default;
    if (s == "claude-code") return Icon::ClaudeCode;
    if (s == "codex") return Icon::Codex;
    if (s == "opencode") return Icon::OpenCode;
    return std::nullopt;
}

nlohmann::json to_json(const Notification& n) {
    return {
        {"id", n.id},
        {"badge", n.badge},
        {"body", n.body},
        {"badge_color", to_string(n.badge_color)},
        {"icon", to_string(n.icon)},
        {"repo", n.repo},
        {"repo_root", n.repo_root},
        {"metadata", n.metadata},
        {"tmux_pane", n.tmux_pane},
        {"terminal_bundle_id", n.terminal_bundle_id},
        {"force_focus", n.force_focus},
        {"is_read", n.is_read},
        {"created_at", n.created_at},
    };
}

std::expected<NotificationInput, std::string> parse_notification_input(const nlohmann::json& j) {
    if (!j.is_object()) return std::unexpected("notification must be an object");

    NotificationInput input;
    try {
        input.badge = j.value("badge", "");
        input.body = j.value("body", "");
        input.repo = j.value("repo", "");
        input.repo_root = j.value("repo_root", "");
        input.tmux_pane = j.value("tmux_pane", "");
        input.terminal_bundle_id = j.value("terminal_bundle_id", "");
        input.force_focus = j.value("force_focus", false);
        input.source_directory = j.value("source_directory", "");

        if (j.contains("badge_color")) {
            auto color = badge_color_from_string(j["badge_color"].get<std::string>());
            if (!color) return std::unexpected("unknown badge_color: " + j["badge_color"].get<std::string>());
            input.badge_color = *color;
        }

        if (j.contains("icon")) {
            auto icon = icon_from_string(j["icon"].get<std::string>());
            if (!icon) return std::unexpected("unknown icon: " + j["icon"].get<std::string>());
            input.icon = *icon;
        }

        if (j.contains("metadata")) {
            auto& meta = j["metadata"];
            if (!meta.is_object()) return std::unexpected("metadata must be an object");
            for (auto& [key, value] : meta.items()) {
                if (!value.is_string()) return std::unexpected("metadata value for '" + key + "' must be a string");
                input.metadata[key] = value.get<std::string>();
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(std::string("malformed notification: ") + e.what());
    }

    if (input.badge.empty() && input.body.empty()) {
        return std::unexpected("notification needs a badge or a body");
    }
    return input;
}
