#include "platform/linux/tmux_multiplexer.hpp"

#include "detector/screen_text.hpp"
#include "platform/command_runner.hpp"

#include <charconv>

namespace {

constexpr const char* kSeparator = "|||";

constexpr const char* kPaneFormat =
    "#{pane_id}|||#{pane_pid}|||#{session_name}|||#{window_name}|||#{pane_current_path}|||"
    "#{pane_active}|||#{window_active}|||#{session_attached}";

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        auto pos = line.find(kSeparator, start);
        if (pos == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 3;
    }
    return fields;
}

} // namespace

TmuxMultiplexer::TmuxMultiplexer(int timeout_ms, std::string tmux_binary)
    : timeout_ms_(timeout_ms), tmux_binary_(std::move(tmux_binary)) {}

std::expected<std::string, std::string> TmuxMultiplexer::tmux(std::vector<std::string> args) {
    args.insert(args.begin(), tmux_binary_);
    auto res = platform::run_command(args, timeout_ms_);
    if (!res) return std::unexpected("tmux: " + res.error());
    if (res->exit_code != 0) {
        return std::unexpected("tmux: " + args[1] + " exited with code " + std::to_string(res->exit_code));
    }
    return std::move(res->output);
}

std::vector<PaneRecord> TmuxMultiplexer::parse_pane_list(const std::string& output) {
    std::vector<PaneRecord> panes;
    for (auto& line : screen::split_lines(output)) {
        auto f = split_fields(line);
        if (f.size() < 8) continue;

        PaneRecord p;
        p.pane_id = f[0];
        auto [ptr, ec] = std::from_chars(f[1].data(), f[1].data() + f[1].size(), p.pid);
        if (ec != std::errc{}) p.pid = 0;
        p.session_name = f[2];
        p.window_name = f[3];
        p.cwd = f[4];
        // session_attached is a client count
        p.is_active = f[5] == "1" && f[6] == "1" && !f[7].empty() && f[7] != "0";
        panes.push_back(std::move(p));
    }
    return panes;
}

std::expected<std::vector<PaneRecord>, std::string> TmuxMultiplexer::list_panes() {
    auto out = tmux({"list-panes", "-a", "-F", kPaneFormat});
    if (!out) return std::unexpected(out.error());
    return parse_pane_list(*out);
}

std::expected<std::string, std::string> TmuxMultiplexer::capture_pane(const std::string& pane_id) {
    auto out = tmux({"capture-pane", "-p", "-t", pane_id});
    if (!out) return std::unexpected(out.error());
    return screen::strip_ansi(*out);
}

std::expected<bool, std::string> TmuxMultiplexer::is_pane_visible(const std::string& pane_id) {
    auto out = tmux({"display-message", "-t", pane_id, "-p",
                     "#{pane_active} #{window_active} #{session_attached}"});
    if (!out) return std::unexpected(out.error());
    auto flags = screen::trim(*out);
    return flags.starts_with("1 1 ") && !flags.ends_with(" 0");
}

std::expected<void, std::string> TmuxMultiplexer::focus_pane(const std::string& pane_id) {
    // switch-client fails without an attached client; selecting still helps the next attach.
    auto switched = tmux({"switch-client", "-t", pane_id});
    auto window = tmux({"select-window", "-t", pane_id});
    if (!window) return std::unexpected(window.error());
    auto pane = tmux({"select-pane", "-t", pane_id});
    if (!pane) return std::unexpected(pane.error());
    if (!switched) return std::unexpected(switched.error());
    return {};
}
