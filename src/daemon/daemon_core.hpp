#pragma once

#include "config.hpp"
#include "detector/rule_table.hpp"
#include "detector/status_detector.hpp"
#include "event_bus.hpp"
#include "models/notification.hpp"
#include "models/tmux_pane.hpp"
#include "mute_service.hpp"
#include "panes/pane_enumerator.hpp"
#include "platform/git_resolver.hpp"
#include "platform/ipc_server.hpp"
#include "platform/multiplexer.hpp"
#include "platform/process_detector.hpp"
#include "platform/terminal_focus.hpp"
#include "platform/timer_service.hpp"
#include "storage/notification_store.hpp"
#include "suppression_policy.hpp"
#include "toast/toast_queue.hpp"
#include "view/navigation_model.hpp"

#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

struct DaemonPorts {
    Multiplexer& mux;
    ProcessDetector& processes;
    GitResolver& git;
    TerminalFocus& focus;
    IpcServer& ipc;
    TimerService& timers;
};

class DaemonCore {
public:
    using NotifyCallback = std::function<void()>;

    DaemonCore(Config config, bool verbose, DaemonPorts ports, NotifyCallback notify);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Opens the store, loads mute state and rule tables.
    bool init(const std::string& db_path, const std::string& mute_path);
    // Starts the periodic pane poll.
    void start();

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    // Runs on the event-loop thread after the poll worker signalled completion.
    void on_poll_complete();

    void add_subscriber(int fd);
    void remove_client(int fd);

    // Routes one notification and re-polls so pane status catches up.
    nlohmann::json ingest(NotificationInput input);

    EventBus& bus() { return bus_; }
    ToastQueue& toast() { return toast_; }
    NavigationModel& navigation() { return nav_; }
    NotificationStore& store() { return store_; }
    MuteService& mute() { return mute_; }
    const std::vector<TmuxPane>& panes() const { return panes_; }
    bool notified_only() const { return notified_only_; }

    void shutdown();

private:
    nlohmann::json dispatch(const std::string& cmd_str, const nlohmann::json& cmd);
    nlohmann::json handle_send(const nlohmann::json& cmd);
    nlohmann::json handle_list(const nlohmann::json& cmd);
    nlohmann::json handle_delete(const std::string& cmd_str, const nlohmann::json& cmd);
    nlohmann::json handle_mute(const std::string& cmd_str, const nlohmann::json& cmd);
    nlohmann::json handle_nav(const nlohmann::json& cmd);
    nlohmann::json handle_toast(const nlohmann::json& cmd);
    nlohmann::json handle_subscribe(const nlohmann::json& cmd);

    // Routes one notification without touching the poll schedule.
    nlohmann::json deliver(NotificationInput input);

    void enrich(NotificationInput& input);
    bool pane_visible(const std::string& tmux_pane);
    void focus_terminal(const std::string& tmux_pane, const std::string& terminal_bundle_id);
    void perform(const NavAction& action);

    void start_poll();
    void request_poll();
    void schedule_poll(std::chrono::milliseconds delay);
    void notify_waiting_transitions(const std::vector<TmuxPane>& next);

    void store_changed();
    void rebuild_view();
    void forward_to_subscribers(const BusEvent& event);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    DaemonPorts ports_;
    NotifyCallback notify_;

    RuleSet rules_;
    StatusDetector detector_;
    PaneEnumerator enumerator_;

    NotificationStore store_;
    MuteService mute_;
    EventBus bus_;
    ToastQueue toast_;
    NavigationModel nav_;
    bool notified_only_;

    std::vector<TmuxPane> panes_;
    std::vector<int> subscribers_;

    bool started_ = false;
    bool polling_ = false;
    bool poll_requested_ = false;
    TimerService::TimerId poll_timer_ = 0;

    std::vector<TmuxPane> poll_result_;
    std::jthread worker_;
};
