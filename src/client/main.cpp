#include "hooks/hook_event.hpp"
#include "hooks/hook_settings.hpp"
#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <cstdio>
#include <cstdlib>
#include <expected>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <map>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  send [-B badge] [-b body] [-c color] [-i icon] [-r repo] [-t pane]");
    std::println(stderr, "       [-f] [-m KEY=VALUE]... [--terminal-id ID]   Send a notification");
    std::println(stderr, "  list [--limit N]                  List stored notifications");
    std::println(stderr, "  panel [filter]                    Show the grouped panel, or toggle notified-only");
    std::println(stderr, "  unread                            Print the unread count");
    std::println(stderr, "  delete ID                         Delete one notification");
    std::println(stderr, "  delete-pane PANE...               Delete the notifications for tmux panes");
    std::println(stderr, "  delete-group GROUP                Delete every notification in a group");
    std::println(stderr, "  clear                             Delete all notifications");
    std::println(stderr, "  mute [GROUP]                      Toggle global or group mute");
    std::println(stderr, "  mute-state                        Show mute state");
    std::println(stderr, "  nav ACTION                        next|prev|next-notification|prev-notification|");
    std::println(stderr, "                                    activate|delete|delete-group|toggle");
    std::println(stderr, "  toast ACTION                      click|dismiss|dismiss-delete|state");
    std::println(stderr, "  refresh                           Re-poll tmux now");
    std::println(stderr, "  subscribe [--after ID]            Stream daemon events, replaying rows after ID");
    std::println(stderr, "  hook claude|codex|opencode [JSON] Agent hook entry point");
}

static bool connect_daemon(UnixSocketClient& client) {
    auto sock_path = platform::ipc_endpoint();
    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is panetoastd running?");
        return false;
    }
    return true;
}

static std::expected<json, std::string> request(const json& cmd) {
    UnixSocketClient client;
    if (!connect_daemon(client)) return std::unexpected("daemon not reachable");
    if (!client.send(cmd)) return std::unexpected("failed to send command");

    json response;
    if (!client.recv(response)) return std::unexpected("no response from daemon (timeout)");
    return response;
}

static int run_hook(int argc, char* argv[]) {
    if (argc < 3) {
        std::println(stderr, "Usage: {} hook claude|codex|opencode [JSON]", argv[0]);
        return 1;
    }

    std::string agent = argv[2];
    std::string payload;
    if (argc > 3) {
        payload = argv[3];
    } else {
        payload.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    auto outcome = [&]() -> std::expected<void, std::string> {
        auto event = parse_hook_event(agent, payload);
        if (!event) return std::unexpected(event.error());

        auto settings = HookSettings::load(platform::config_dir() + "/config.json");
        auto req = to_send_request(*event, settings, HookEnv::from_environment());
        if (!req) return {};

        auto response = request(*req);
        if (!response) return std::unexpected(response.error());
        if (response->value("status", "") != "ok") {
            return std::unexpected(response->value("message", "daemon rejected the event"));
        }
        return {};
    }();

    // Agents only look at stdout; never fail their hook chain.
    std::println("{}", hook_result(outcome).dump());
    return 0;
}

static int subscribe(const std::vector<std::string>& args) {
    json cmd = {{"cmd", "subscribe"}};
    if (args.size() >= 2 && args[0] == "--after") cmd["after_id"] = std::atoll(args[1].c_str());

    UnixSocketClient client;
    if (!connect_daemon(client)) return 1;
    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    json msg;
    while (client.recv(msg, -1)) {
        std::println("{}", msg.dump());
        std::fflush(stdout);
    }
    return 0;
}

static void print_notification(const json& n, const char* indent) {
    auto body = n.value("body", "");
    std::println("{}[{}] {}{}{}", indent, n.value("id", 0), n.value("badge", ""),
                 body.empty() ? "" : ": ", body);
}

static void print_panel(const json& panel) {
    std::map<std::string, json> groups;
    std::map<std::string, json> panes;
    std::map<int64_t, json> orphans;
    for (auto& g : panel["groups"]) {
        groups[g.value("key", "")] = g;
        for (auto& item : g["panes"]) panes[item["pane"].value("pane_id", "")] = item;
        for (auto& n : g["orphans"]) orphans[n.value("id", int64_t{0})] = n;
    }

    json selected = panel["selected"];
    size_t index = 0;
    for (auto& row : panel["rows"]) {
        const char* cursor = (!selected.is_null() && selected.get<size_t>() == index) ? ">" : " ";
        auto kind = row.value("kind", "");

        if (kind == "group-header") {
            auto& g = groups[row.value("group_key", "")];
            auto name = g.value("name", "");
            std::string branch = g["git_branch"].is_string() ? " (" + g["git_branch"].get<std::string>() + ")" : "";
            std::println("{} {} {}{}", cursor, g.value("collapsed", false) ? "+" : "-", name, branch);
        } else if (kind == "pane-item") {
            auto& item = panes[row.value("pane_id", "")];
            auto& pane = item["pane"];
            std::string status = pane["agent_status"].is_string() ? pane["agent_status"].get<std::string>() : "";
            std::println("{}    {} {} {}", cursor, pane.value("pane_id", ""),
                         pane["agent_type"].is_string() ? pane["agent_type"].get<std::string>() : "-", status);
            if (item["notification"].is_object()) print_notification(item["notification"], "        ");
        } else {
            print_notification(orphans[row.value("notification_id", int64_t{0})], "      ");
        }
        index++;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "hook") return run_hook(argc, argv);
    std::vector<std::string> args(argv + 2, argv + argc);
    if (command == "subscribe") return subscribe(args);

    auto positional = [&]() -> std::string { return args.empty() ? "" : args.front(); };

    json cmd;
    if (command == "send") {
        cmd = {{"cmd", "send"}, {"metadata", json::object()}};
        const char* pane = std::getenv("TMUX_PANE");
        if (pane) cmd["tmux_pane"] = pane;
        const char* terminal = std::getenv("PANETOAST_TERMINAL_ID");
        if (terminal) cmd["terminal_bundle_id"] = terminal;
        cmd["source_directory"] = std::filesystem::current_path().string();

        for (size_t i = 0; i < args.size(); i++) {
            auto& arg = args[i];
            bool has_value = i + 1 < args.size();
            if (arg == "-f" || arg == "--force-focus") {
                cmd["force_focus"] = true;
            } else if ((arg == "-B" || arg == "--badge") && has_value) {
                cmd["badge"] = args[++i];
            } else if ((arg == "-b" || arg == "--body") && has_value) {
                cmd["body"] = args[++i];
            } else if ((arg == "-c" || arg == "--color") && has_value) {
                cmd["badge_color"] = args[++i];
            } else if ((arg == "-i" || arg == "--icon") && has_value) {
                cmd["icon"] = args[++i];
            } else if ((arg == "-r" || arg == "--repo") && has_value) {
                cmd["repo"] = args[++i];
            } else if ((arg == "-t" || arg == "--tmux-pane") && has_value) {
                cmd["tmux_pane"] = args[++i];
            } else if (arg == "--terminal-id" && has_value) {
                cmd["terminal_bundle_id"] = args[++i];
            } else if ((arg == "-m" || arg == "--meta") && has_value) {
                auto entry = args[++i];
                auto eq = entry.find('=');
                if (eq == std::string::npos) {
                    std::println(stderr, "Warning: ignoring invalid metadata entry '{}' (expected KEY=VALUE)", entry);
                    continue;
                }
                cmd["metadata"][entry.substr(0, eq)] = entry.substr(eq + 1);
            } else {
                std::println(stderr, "Unknown option: {}", arg);
                return 1;
            }
        }
    } else if (command == "list") {
        cmd = {{"cmd", "list"}};
        if (args.size() >= 2 && args[0] == "--limit") cmd["limit"] = std::atoi(args[1].c_str());
    } else if (command == "panel") {
        cmd = {{"cmd", positional() == "filter" ? "toggle_panel_filter" : "panel"}};
    } else if (command == "unread") {
        cmd = {{"cmd", "unread"}};
    } else if (command == "delete" && !args.empty()) {
        cmd = {{"cmd", "delete"}, {"id", std::atoll(args[0].c_str())}};
    } else if (command == "delete-pane" && args.size() == 1) {
        cmd = {{"cmd", "delete_pane"}, {"tmux_pane", args[0]}};
    } else if (command == "delete-pane" && args.size() > 1) {
        cmd = {{"cmd", "delete_panes"}, {"tmux_panes", args}};
    } else if (command == "delete-group" && !args.empty()) {
        cmd = {{"cmd", "delete_group"}, {"group", args[0]}};
    } else if (command == "clear") {
        cmd = {{"cmd", "delete_all"}};
    } else if (command == "mute") {
        if (args.empty()) {
            cmd = {{"cmd", "toggle_mute"}};
        } else {
            cmd = {{"cmd", "toggle_group_mute"}, {"group", args[0]}};
        }
    } else if (command == "mute-state") {
        cmd = {{"cmd", "mute_state"}};
    } else if (command == "nav" && !args.empty()) {
        cmd = {{"cmd", "nav"}, {"action", positional()}};
    } else if (command == "toast" && !args.empty()) {
        cmd = {{"cmd", "toast"}, {"action", positional()}};
    } else if (command == "refresh") {
        cmd = {{"cmd", "refresh"}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    auto response = request(cmd);
    if (!response) {
        std::println(stderr, "{}", response.error());
        return 1;
    }

    auto status = response->value("status", "");
    if (status == "error") {
        std::println(stderr, "Error: {}", response->value("message", "unknown error"));
        return 1;
    }

    if (command == "list") {
        for (auto& n : (*response)["notifications"]) {
            auto repo = n.value("repo", "");
            std::println("{} {}{}", n.value("created_at", ""), repo.empty() ? "" : repo + " ", n["is_read"].get<bool>() ? "" : "*");
            print_notification(n, "  ");
        }
    } else if (command == "unread") {
        std::println("{}", response->value("count", 0));
    } else if (command == "panel" || command == "nav") {
        if (response->value("notified_only", false)) std::println("(notified only)");
        print_panel((*response)["panel"]);
    } else if (command == "mute" || command == "mute-state") {
        std::println("{}", (*response)["mute"].dump(2));
    } else if (command == "send") {
        std::println("{}", response->value("delivery", "ok"));
    } else if (command == "toast") {
        std::println("{} {}/{}", response->value("state", ""), response->value("index", 0),
                     response->value("count", 0));
    } else if (command == "delete" || command == "delete-pane" || command == "delete-group" ||
               command == "clear") {
        std::println("Deleted {}", response->value("deleted", 0));
    } else {
        std::println("OK");
    }

    return 0;
}
