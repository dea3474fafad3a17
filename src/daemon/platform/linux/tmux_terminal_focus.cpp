#include "platform/linux/tmux_terminal_focus.hpp"

#include "platform/command_runner.hpp"

TmuxTerminalFocus::TmuxTerminalFocus(Multiplexer& mux, std::string activate_command, int timeout_ms)
    : mux_(mux), activate_command_(std::move(activate_command)), timeout_ms_(timeout_ms) {}

std::string TmuxTerminalFocus::expand_command(const std::string& tmpl, const std::string& terminal_id) {
    // Single-quote the id for /bin/sh.
    std::string quoted = "'";
    for (char c : terminal_id) {
        if (c == '\'') quoted += "'\\''";
        else quoted += c;
    }
    quoted += "'";

    std::string out;
    size_t start = 0;
    while (true) {
        auto pos = tmpl.find("{id}", start);
        if (pos == std::string::npos) {
            out += tmpl.substr(start);
            break;
        }
        out += tmpl.substr(start, pos - start);
        out += quoted;
        start = pos + 4;
    }
    return out;
}

std::expected<void, std::string> TmuxTerminalFocus::focus(const std::string& tmux_pane,
                                                          const std::string& terminal_bundle_id) {
    if (!tmux_pane.empty()) {
        auto res = mux_.focus_pane(tmux_pane);
        if (!res) return res;
    }

    if (activate_command_.empty() || terminal_bundle_id.empty()) return {};

    auto cmd = expand_command(activate_command_, terminal_bundle_id);
    auto res = platform::run_command({"/bin/sh", "-c", cmd}, timeout_ms_);
    if (!res) return std::unexpected(res.error());
    if (res->exit_code != 0) {
        return std::unexpected("activate command exited with code " + std::to_string(res->exit_code));
    }
    return {};
}
