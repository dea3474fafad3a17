#pragma once

#include "platform/multiplexer.hpp"
#include "platform/terminal_focus.hpp"

#include <string>

// Switches tmux to the pane, then optionally raises the terminal window with
// `activate_command` ("{id}" is replaced by the terminal id, run via /bin/sh).
class TmuxTerminalFocus : public TerminalFocus {
public:
    TmuxTerminalFocus(Multiplexer& mux, std::string activate_command, int timeout_ms = 2000);

    std::expected<void, std::string> focus(const std::string& tmux_pane,
                                           const std::string& terminal_bundle_id) override;

    static std::string expand_command(const std::string& tmpl, const std::string& terminal_id);

private:
    Multiplexer& mux_;
    std::string activate_command_;
    int timeout_ms_;
};
