#pragma once

#include <string>
#include <vector>

struct Config {
    struct Poll {
        int interval_ms = 3000;
        int tmux_timeout_ms = 2000;
        int max_backoff_ms = 30000;
        int failure_threshold = 2;
    } poll;

    struct Toast {
        int duration_ms = 4000;
        bool persistent = false;
        int fade_ms = 300;
    } toast;

    struct Store {
        std::string db_path; // empty: <data dir>/notifications.db
        int list_limit = 100;
    } store;

    struct Panel {
        int group_limit = 3;
        bool agent_panes_only = true;
        // Hide panes that have no notification.
        bool filter_notified_only = false;
    } panel;

    struct Detector {
        std::string rules_path; // empty: built-in rule tables
        bool notify_on_waiting = true;
    } detector;

    struct Agent {
        std::string process;
        std::string type;
    };
    std::vector<Agent> agents = {
        {"claude", "claude"},
        {"claude-code", "claude"},
        {"codex", "codex"},
        {"opencode", "opencode"},
    };

    struct Terminal {
        // Run after a tmux focus switch; "{id}" is the notification's terminal id.
        std::string activate_command;
    } terminal;

    // File this config came from; toggles made at runtime are written back here.
    std::string path;

    static Config load(const std::string& path);
    static Config load_default();

    // Rewrites only panel.filter_notified_only, keeping every other key in the file.
    static bool save_panel_filter(const std::string& path, bool notified_only);
};
