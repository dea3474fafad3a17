#include "daemon_core.hpp"

#include "view/group_unifier.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <print>

using json = nlohmann::json;

namespace {

Icon icon_for(AgentType agent) {
    switch (agent) {
        case AgentType::Claude: return Icon::ClaudeCode;
        case AgentType::Codex: return Icon::Codex;
        case AgentType::OpenCode: return Icon::OpenCode;
    }
    return Icon::Default;
}

json error_response(const std::string& message) {
    return {{"status", "error"}, {"message", message}};
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose, DaemonPorts ports, NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose),
      ports_(ports),
      notify_(std::move(notify)),
      rules_(RuleSet::defaults()),
      detector_(rules_),
      enumerator_(ports_.mux, ports_.processes, ports_.git, detector_,
                  EnumeratorOptions{
                      .interval_ms = config_.poll.interval_ms,
                      .max_backoff_ms = config_.poll.max_backoff_ms,
                      .failure_threshold = config_.poll.failure_threshold,
                  },
                  verbose_),
      mute_(""),
      toast_(ports_.timers,
             ToastOptions{
                 .duration_ms = config_.toast.duration_ms,
                 .persistent = config_.toast.persistent,
                 .fade_ms = config_.toast.fade_ms,
             },
             ToastCallbacks{
                 .show = [this](const Notification& n, size_t index, size_t count) {
                     bus_.publish(events::kToastShow,
                                  {{"notification", to_json(n)}, {"index", index}, {"count", count},
                                   {"counter", std::format("{}/{}", index + 1, count)}});
                 },
                 .fade = [this] { bus_.publish(events::kToastFade); },
                 .hide = [this] { bus_.publish(events::kToastHide); },
                 .remove = [this](const Notification& n) {
                     auto res = store_.remove(n.id);
                     if (!res) std::println(stderr, "store: {}", res.error().message);
                     store_changed();
                 },
                 .focus = [this](const Notification& n) {
                     focus_terminal(n.tmux_pane, n.terminal_bundle_id);
                 },
             }),
      nav_(config_.panel.group_limit),
      notified_only_(config_.panel.filter_notified_only) {}

DaemonCore::~DaemonCore() = default;

bool DaemonCore::init(const std::string& db_path, const std::string& mute_path) {
    if (!config_.detector.rules_path.empty()) {
        auto loaded = RuleSet::load(config_.detector.rules_path);
        if (loaded) {
            rules_ = std::move(*loaded);
            log(std::format("Loaded rule tables v{} from {}", rules_.version(), config_.detector.rules_path));
        } else {
            std::println(stderr, "{}; using built-in rule tables", loaded.error());
        }
    }

    if (!store_.open(db_path)) {
        std::println(stderr, "Warning: notification store failed to open, will retry on next write");
    }

    mute_ = MuteService(mute_path);
    if (!mute_.load()) {
        std::println(stderr, "Warning: mute state unreadable, starting unmuted");
    }

    bus_.subscribe([this](const BusEvent& event) {
        if (event.name == events::kRefresh || event.name == events::kPanesUpdated) {
            rebuild_view();
        }
    });
    bus_.subscribe([this](const BusEvent& event) { forward_to_subscribers(event); });

    rebuild_view();
    return true;
}

void DaemonCore::start() {
    started_ = true;
    start_poll();
}

nlohmann::json DaemonCore::handle_command(const std::string& cmd_str, const nlohmann::json& cmd) {
    if (cmd.contains("malformed")) return error_response("malformed request");

    try {
        return dispatch(cmd_str, cmd);
    } catch (const json::exception& e) {
        std::println(stderr, "ipc: dropping '{}' request: {}", cmd_str, e.what());
        return error_response(std::string("malformed request: ") + e.what());
    }
}

nlohmann::json DaemonCore::dispatch(const std::string& cmd_str, const nlohmann::json& cmd) {
    if (cmd_str == "send") return handle_send(cmd);
    if (cmd_str == "list") return handle_list(cmd);
    if (cmd_str == "unread") {
        auto count = store_.unread_count();
        if (!count) return error_response(count.error().message);
        return {{"status", "ok"}, {"count", *count}};
    }
    if (cmd_str == "delete" || cmd_str == "delete_pane" || cmd_str == "delete_panes" ||
        cmd_str == "delete_group" || cmd_str == "delete_all") {
        return handle_delete(cmd_str, cmd);
    }
    if (cmd_str == "panes") {
        json panes = json::array();
        for (auto& p : panes_) panes.push_back(to_json(p));
        return {{"status", "ok"}, {"panes", panes}};
    }
    if (cmd_str == "panel") {
        rebuild_view();
        return {{"status", "ok"}, {"notified_only", notified_only_}, {"panel", nav_.to_json()}};
    }
    if (cmd_str == "toggle_panel_filter") {
        notified_only_ = !notified_only_;
        if (!config_.path.empty() && !Config::save_panel_filter(config_.path, notified_only_)) {
            std::println(stderr, "Warning: panel filter not saved to {}", config_.path);
        }
        log(std::format("Panel filter: {}", notified_only_ ? "notified only" : "all panes"));
        bus_.publish(events::kRefresh);
        return {{"status", "ok"}, {"notified_only", notified_only_}, {"panel", nav_.to_json()}};
    }
    if (cmd_str == "mute_state" || cmd_str == "toggle_mute" || cmd_str == "toggle_group_mute") {
        return handle_mute(cmd_str, cmd);
    }
    if (cmd_str == "nav") return handle_nav(cmd);
    if (cmd_str == "toast") return handle_toast(cmd);
    if (cmd_str == "refresh") {
        request_poll();
        bus_.publish(events::kRefresh);
        return {{"status", "ok"}};
    }
    if (cmd_str == "subscribe") return handle_subscribe(cmd);
    return error_response("unknown command");
}

nlohmann::json DaemonCore::handle_send(const nlohmann::json& cmd) {
    auto input = parse_notification_input(cmd);
    if (!input) {
        std::println(stderr, "ingest: dropping event: {}", input.error());
        return error_response(input.error());
    }
    return ingest(std::move(*input));
}

nlohmann::json DaemonCore::ingest(NotificationInput input) {
    auto resp = deliver(std::move(input));
    if (resp.value("status", "") == "ok") request_poll();
    return resp;
}

nlohmann::json DaemonCore::deliver(NotificationInput input) {
    enrich(input);

    bool muted = mute_.is_muted(input.group_key());
    bool visible = !muted && !input.force_focus && pane_visible(input.tmux_pane);
    auto delivery = decide_delivery({.muted = muted, .force_focus = input.force_focus, .pane_visible = visible});
    log(std::format("Notification '{}' for {} -> {}", input.badge,
                    input.tmux_pane.empty() ? input.group_key() : input.tmux_pane, to_string(delivery)));

    if (delivery == Delivery::FocusOnly) {
        focus_terminal(input.tmux_pane, input.terminal_bundle_id);
        return {{"status", "ok"}, {"delivery", to_string(delivery)}};
    }

    // A muted force-focus event is kept as an ordinary entry.
    if (muted) input.force_focus = false;

    auto stored = store_.insert(input);
    if (!stored) {
        std::println(stderr, "store: {}", stored.error().message);
        return error_response(stored.error().message);
    }

    store_changed();
    if (delivery != Delivery::StoreSilently) {
        bus_.publish(events::kNotificationsNew, json::array({to_json(*stored)}));
    }
    if (delivery == Delivery::StoreAndToast) {
        toast_.push({*stored});
    }

    return {{"status", "ok"}, {"delivery", to_string(delivery)}, {"id", stored->id}};
}

void DaemonCore::enrich(NotificationInput& input) {
    if (!input.repo_root.empty()) return;

    if (!input.tmux_pane.empty()) {
        auto it = std::ranges::find_if(panes_, [&](const TmuxPane& p) { return p.pane_id == input.tmux_pane; });
        if (it != panes_.end()) {
            input.repo_root = it->group_key();
            if (input.repo.empty()) input.repo = it->group_name();
            if (it->git_branch && !input.metadata.contains("branch")) input.metadata["branch"] = *it->git_branch;
            return;
        }
    }

    if (input.source_directory.empty()) return;

    if (auto info = ports_.git.resolve(input.source_directory)) {
        input.repo_root = info->repo_root;
        if (input.repo.empty()) input.repo = info->repo_name;
        if (!info->branch.empty() && !input.metadata.contains("branch")) input.metadata["branch"] = info->branch;
    } else {
        input.repo_root = input.source_directory;
        if (input.repo.empty()) {
            input.repo = std::filesystem::path(input.source_directory).filename().string();
        }
    }
}

bool DaemonCore::pane_visible(const std::string& tmux_pane) {
    if (tmux_pane.empty()) return false;
    auto visible = ports_.mux.is_pane_visible(tmux_pane);
    if (!visible) {
        log(visible.error());
        return false;
    }
    return *visible;
}

void DaemonCore::focus_terminal(const std::string& tmux_pane, const std::string& terminal_bundle_id) {
    if (tmux_pane.empty() && terminal_bundle_id.empty()) return;

    auto res = ports_.focus.focus(tmux_pane, terminal_bundle_id);
    if (!res) {
        std::println(stderr, "focus: {}", res.error());
    }
    bus_.publish(events::kTerminalFocus, {{"tmux_pane", tmux_pane}, {"terminal_bundle_id", terminal_bundle_id}});
}

nlohmann::json DaemonCore::handle_list(const nlohmann::json& cmd) {
    int limit = cmd.value("limit", config_.store.list_limit);
    auto rows = store_.list(limit);
    if (!rows) return error_response(rows.error().message);

    json resp = {{"status", "ok"}, {"notifications", json::array()}};
    for (auto& n : *rows) {
        resp["notifications"].push_back(to_json(n));
    }
    return resp;
}

nlohmann::json DaemonCore::handle_delete(const std::string& cmd_str, const nlohmann::json& cmd) {
    std::expected<int, StorageError> res;
    try {
        if (cmd_str == "delete") {
            res = store_.remove(cmd.at("id").get<int64_t>());
        } else if (cmd_str == "delete_pane") {
            res = store_.remove_by_pane(cmd.at("tmux_pane").get<std::string>());
        } else if (cmd_str == "delete_panes") {
            res = store_.remove_by_panes(cmd.at("tmux_panes").get<std::vector<std::string>>());
        } else if (cmd_str == "delete_group") {
            res = store_.remove_by_group(cmd.at("group").get<std::string>());
        } else {
            res = store_.remove_all();
            toast_.clear();
        }
    } catch (const json::exception& e) {
        return error_response(std::string("bad arguments: ") + e.what());
    }

    if (!res) {
        std::println(stderr, "store: {}", res.error().message);
        return error_response(res.error().message);
    }
    store_changed();
    return {{"status", "ok"}, {"deleted", *res}};
}

nlohmann::json DaemonCore::handle_subscribe(const nlohmann::json& cmd) {
    json resp = {{"status", "subscribed"}};
    auto last = store_.max_id();
    if (last) resp["last_id"] = *last;

    // A reconnecting subscriber catches up on rows it has not seen.
    if (cmd.contains("after_id")) {
        auto missed = store_.list_after(cmd.at("after_id").get<int64_t>());
        if (!missed) return error_response(missed.error().message);
        resp["missed"] = json::array();
        for (auto& n : *missed) resp["missed"].push_back(to_json(n));
    }
    return resp;
}

nlohmann::json DaemonCore::handle_mute(const std::string& cmd_str, const nlohmann::json& cmd) {
    if (cmd_str == "toggle_mute") {
        mute_.toggle_global();
        bus_.publish(events::kMuteChanged, mute_.to_json());
    } else if (cmd_str == "toggle_group_mute") {
        auto group = cmd.value("group", "");
        if (group.empty()) return error_response("missing group");
        mute_.toggle_group(group);
        bus_.publish(events::kMuteChanged, mute_.to_json());
    }
    return {{"status", "ok"}, {"mute", mute_.to_json()}};
}

nlohmann::json DaemonCore::handle_nav(const nlohmann::json& cmd) {
    auto action = cmd.value("action", "");
    json performed = nullptr;

    auto record = [&](const NavAction& a) {
        performed = {
            {"kind", to_string(a.kind)},
            {"group_key", a.group_key},
            {"pane_id", a.pane_id},
            {"notification_id", a.notification_id},
        };
        perform(a);
    };

    if (action == "next") {
        nav_.move_next();
    } else if (action == "prev") {
        nav_.move_prev();
    } else if (action == "next-notification") {
        nav_.next_notification();
    } else if (action == "prev-notification") {
        nav_.prev_notification();
    } else if (action == "toggle") {
        auto* row = nav_.selected_row();
        if (row) nav_.toggle_collapse(row->group_key);
    } else if (action == "activate") {
        record(nav_.activate());
    } else if (action == "delete") {
        if (auto a = nav_.delete_selected()) record(*a);
    } else if (action == "delete-group") {
        if (auto a = nav_.delete_group()) record(*a);
    } else {
        return error_response("unknown nav action: " + action);
    }

    return {{"status", "ok"}, {"action", performed}, {"panel", nav_.to_json()}};
}

void DaemonCore::perform(const NavAction& action) {
    std::expected<int, StorageError> res = 0;
    switch (action.kind) {
        case NavAction::Kind::ClosePanel:
        case NavAction::Kind::ToggleGroup:
            return;
        case NavAction::Kind::FocusPane:
            if (action.notification_id != 0) {
                res = store_.remove_by_group_and_pane(action.group_key, action.pane_id);
                // The attached entry may carry another group's key.
                if (res && *res == 0) res = store_.remove(action.notification_id);
            }
            focus_terminal(action.pane_id, action.terminal_bundle_id);
            break;
        case NavAction::Kind::OpenNotification:
            res = store_.remove(action.notification_id);
            focus_terminal(action.pane_id, action.terminal_bundle_id);
            break;
        case NavAction::Kind::DeleteNotification:
            res = store_.remove(action.notification_id);
            break;
        case NavAction::Kind::DeleteGroup:
            res = store_.remove_by_group(action.group_key);
            break;
    }

    if (!res) std::println(stderr, "store: {}", res.error().message);
    store_changed();
}

nlohmann::json DaemonCore::handle_toast(const nlohmann::json& cmd) {
    auto action = cmd.value("action", "");
    if (action == "click") {
        toast_.click();
    } else if (action == "dismiss") {
        toast_.dismiss(false);
    } else if (action == "dismiss-delete") {
        toast_.dismiss(true);
    } else if (action != "state") {
        return error_response("unknown toast action: " + action);
    }

    const char* state = toast_.state() == ToastState::Showing ? "showing"
                      : toast_.state() == ToastState::FadingOut ? "fading"
                                                                 : "empty";
    json resp = {{"status", "ok"}, {"state", state}, {"index", toast_.index()},
                 {"count", toast_.entries().size()}};
    if (auto* current = toast_.current()) resp["current"] = to_json(*current);
    return resp;
}

void DaemonCore::store_changed() {
    auto count = store_.unread_count();
    if (count) bus_.publish(events::kUnreadCount, *count);
    bus_.publish(events::kRefresh);
}

void DaemonCore::rebuild_view() {
    // The panel shows every stored row; list_limit only caps the list command.
    auto rows = store_.list(NotificationStore::kAllRows);
    if (!rows) {
        log("view: keeping previous notifications: " + rows.error().message);
        return;
    }
    nav_.rebuild(unify_groups(panes_, *rows,
                              UnifyOptions{.agent_panes_only = config_.panel.agent_panes_only,
                                           .notified_only = notified_only_}));
}

void DaemonCore::add_subscriber(int fd) {
    subscribers_.push_back(fd);
    log(std::format("Subscriber {} attached", fd));
}

void DaemonCore::remove_client(int fd) {
    std::erase(subscribers_, fd);
}

void DaemonCore::forward_to_subscribers(const BusEvent& event) {
    if (subscribers_.empty()) return;

    json msg = {{"event", event.name}, {"payload", event.payload}};
    std::vector<int> dead;
    for (int fd : subscribers_) {
        if (!ports_.ipc.send_response(fd, msg)) dead.push_back(fd);
    }
    for (int fd : dead) {
        log(std::format("Subscriber {} dropped", fd));
        std::erase(subscribers_, fd);
    }
}

void DaemonCore::start_poll() {
    if (polling_) {
        poll_requested_ = true;
        return;
    }
    if (poll_timer_ != 0) {
        ports_.timers.cancel(poll_timer_);
        poll_timer_ = 0;
    }

    polling_ = true;
    worker_ = std::jthread([this](std::stop_token stop) {
        auto panes = enumerator_.enumerate(stop);
        if (stop.stop_requested()) return;
        poll_result_ = std::move(panes);
        notify_();
    });
}

void DaemonCore::request_poll() {
    if (!started_) return;
    start_poll();
}

void DaemonCore::schedule_poll(std::chrono::milliseconds delay) {
    if (poll_timer_ != 0) ports_.timers.cancel(poll_timer_);
    poll_timer_ = ports_.timers.schedule(delay, [this] {
        poll_timer_ = 0;
        start_poll();
    });
}

void DaemonCore::on_poll_complete() {
    if (worker_.joinable()) {
        worker_.join();
    }
    polling_ = false;

    auto next = std::move(poll_result_);
    poll_result_.clear();

    if (config_.detector.notify_on_waiting) notify_waiting_transitions(next);

    panes_ = std::move(next);
    bus_.publish(events::kPanesUpdated, {{"count", panes_.size()}});

    if (poll_requested_) {
        poll_requested_ = false;
        start_poll();
    } else {
        schedule_poll(enumerator_.next_delay());
    }
}

void DaemonCore::notify_waiting_transitions(const std::vector<TmuxPane>& next) {
    for (auto& pane : next) {
        if (!pane.agent_type || pane.agent_status != AgentStatus::Waiting) continue;

        auto prev = std::ranges::find_if(panes_, [&](const TmuxPane& p) { return p.pane_id == pane.pane_id; });
        // First sighting after startup is not a transition.
        if (prev == panes_.end() || !prev->agent_status || prev->agent_status == AgentStatus::Waiting) continue;

        auto existing = store_.latest_by_pane(pane.pane_id);
        if (existing && existing->has_value()) continue;

        NotificationInput input;
        input.badge = "Waiting";
        input.body = std::format("{} needs your {}", to_string(*pane.agent_type),
                                 pane.waiting_reason.value_or("respond") == "respond" ? "response"
                                                                                      : *pane.waiting_reason);
        input.badge_color = BadgeColor::Blue;
        input.icon = icon_for(*pane.agent_type);
        input.repo = pane.group_name();
        input.repo_root = pane.group_key();
        input.tmux_pane = pane.pane_id;
        input.metadata["agent"] = to_string(*pane.agent_type);
        if (pane.git_branch) input.metadata["branch"] = *pane.git_branch;

        log(std::format("Pane {} is waiting ({})", pane.pane_id, pane.waiting_reason.value_or("respond")));
        deliver(std::move(input));
    }
}

void DaemonCore::shutdown() {
    started_ = false;
    if (poll_timer_ != 0) {
        ports_.timers.cancel(poll_timer_);
        poll_timer_ = 0;
    }

    // An in-flight poll is abandoned; its result is never applied.
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
    polling_ = false;

    if (!mute_.save()) std::println(stderr, "Warning: failed to save mute state");
    store_.close();
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[panetoast] {}", msg);
    }
}
