#pragma once

#include <expected>
#include <string>
#include <vector>

struct PaneRecord {
    std::string pane_id;
    int pid = 0;
    std::string session_name;
    std::string window_name;
    std::string cwd;
    // Pane, window and session are all current and a client is attached.
    bool is_active = false;
};

class Multiplexer {
public:
    virtual ~Multiplexer() = default;
    virtual std::expected<std::vector<PaneRecord>, std::string> list_panes() = 0;
    // Visible screen only, escape sequences removed.
    virtual std::expected<std::string, std::string> capture_pane(const std::string& pane_id) = 0;
    virtual std::expected<bool, std::string> is_pane_visible(const std::string& pane_id) = 0;
    virtual std::expected<void, std::string> focus_pane(const std::string& pane_id) = 0;
};
