#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    cfg.path = path;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("poll")) {
            auto& p = j["poll"];
            if (p.contains("interval_ms")) cfg.poll.interval_ms = p["interval_ms"].get<int>();
            if (p.contains("tmux_timeout_ms")) cfg.poll.tmux_timeout_ms = p["tmux_timeout_ms"].get<int>();
            if (p.contains("max_backoff_ms")) cfg.poll.max_backoff_ms = p["max_backoff_ms"].get<int>();
            if (p.contains("failure_threshold")) cfg.poll.failure_threshold = p["failure_threshold"].get<int>();
        }

        if (j.contains("toast")) {
            auto& t = j["toast"];
            if (t.contains("duration_ms")) cfg.toast.duration_ms = t["duration_ms"].get<int>();
            if (t.contains("persistent")) cfg.toast.persistent = t["persistent"].get<bool>();
            if (t.contains("fade_ms")) cfg.toast.fade_ms = t["fade_ms"].get<int>();
        }

        if (j.contains("store")) {
            auto& s = j["store"];
            if (s.contains("db_path")) cfg.store.db_path = s["db_path"].get<std::string>();
            if (s.contains("list_limit")) cfg.store.list_limit = s["list_limit"].get<int>();
        }

        if (j.contains("panel")) {
            auto& p = j["panel"];
            if (p.contains("group_limit")) cfg.panel.group_limit = p["group_limit"].get<int>();
            if (p.contains("agent_panes_only")) cfg.panel.agent_panes_only = p["agent_panes_only"].get<bool>();
            if (p.contains("filter_notified_only")) {
                cfg.panel.filter_notified_only = p["filter_notified_only"].get<bool>();
            }
        }

        if (j.contains("detector")) {
            auto& d = j["detector"];
            if (d.contains("rules_path")) cfg.detector.rules_path = d["rules_path"].get<std::string>();
            if (d.contains("notify_on_waiting")) cfg.detector.notify_on_waiting = d["notify_on_waiting"].get<bool>();
        }

        if (j.contains("agents")) {
            cfg.agents.clear();
            for (auto& a : j["agents"]) {
                cfg.agents.push_back({a.at("process").get<std::string>(), a.at("type").get<std::string>()});
            }
        }

        if (j.contains("terminal")) {
            auto& t = j["terminal"];
            if (t.contains("activate_command")) cfg.terminal.activate_command = t["activate_command"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        Config defaults;
        defaults.path = path;
        return defaults;
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    Config cfg;
    cfg.path = config_path.string();
    return cfg;
}

bool Config::save_panel_filter(const std::string& path, bool notified_only) {
    if (path.empty()) return false;

    json j = json::object();
    std::error_code ec;
    if (fs::exists(path, ec)) {
        std::ifstream in(path);
        try {
            j = json::parse(in);
        } catch (const json::exception& e) {
            std::println(stderr, "config: not rewriting {}: {}", path, e.what());
            return false;
        }
        if (!j.is_object()) {
            std::println(stderr, "config: not rewriting {}: top level is not an object", path);
            return false;
        }
    }
    if (!j["panel"].is_object()) j["panel"] = json::object();
    j["panel"]["filter_notified_only"] = notified_only;

    fs::path p(path);
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    auto tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            std::println(stderr, "config: could not write {}", tmp);
            return false;
        }
        out << j.dump(2) << "\n";
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::println(stderr, "config: could not replace {}: {}", path, ec.message());
        return false;
    }
    return true;
}
