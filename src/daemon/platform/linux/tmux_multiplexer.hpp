#pragma once

#include "platform/multiplexer.hpp"

#include <string>
#include <vector>

class TmuxMultiplexer : public Multiplexer {
public:
    explicit TmuxMultiplexer(int timeout_ms = 2000, std::string tmux_binary = "tmux");

    std::expected<std::vector<PaneRecord>, std::string> list_panes() override;
    std::expected<std::string, std::string> capture_pane(const std::string& pane_id) override;
    std::expected<bool, std::string> is_pane_visible(const std::string& pane_id) override;
    std::expected<void, std::string> focus_pane(const std::string& pane_id) override;

    // Parses `list-panes -F` output produced with the format used by list_panes().
    static std::vector<PaneRecord> parse_pane_list(const std::string& output);

private:
    std::expected<std::string, std::string> tmux(std::vector<std::string> args);

    int timeout_ms_;
    std::string tmux_binary_;
};
