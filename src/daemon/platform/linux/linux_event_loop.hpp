#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/git_cli_resolver.hpp"
#include "platform/linux/procfs_detector.hpp"
#include "platform/linux/timerfd_timer_service.hpp"
#include "platform/linux/tmux_multiplexer.hpp"
#include "platform/linux/tmux_terminal_focus.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <atomic>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    bool add_fd(int fd);
    void handle_client(int fd);
    void drop_client(int fd);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    TmuxMultiplexer mux_;
    ProcfsDetector processes_;
    GitCliResolver git_;
    TmuxTerminalFocus focus_;
    UnixSocketServer ipc_server_;
    TimerfdTimerService timers_;

    // Portable business logic
    DaemonCore core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;

    std::atomic<bool> running_{false};
};
