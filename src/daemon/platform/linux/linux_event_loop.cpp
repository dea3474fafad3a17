#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace {

std::vector<AgentProcess> agent_processes(const Config& config) {
    std::vector<AgentProcess> out;
    for (auto& a : config.agents) {
        out.push_back({a.process, a.type});
    }
    return out;
}

} // namespace

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      mux_(config_.poll.tmux_timeout_ms),
      processes_(agent_processes(config_)),
      git_(config_.poll.tmux_timeout_ms),
      focus_(mux_, config_.terminal.activate_command, config_.poll.tmux_timeout_ms),
      core_(config_, verbose_,
            DaemonPorts{
                .mux = mux_,
                .processes = processes_,
                .git = git_,
                .focus = focus_,
                .ipc = ipc_server_,
                .timers = timers_,
            },
            // NotifyCallback, called from the poll worker
            [this]() {
                uint64_t val = 1;
                if (::write(worker_event_fd_, &val, sizeof(val)) < 0) {
                    std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
                }
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
}

bool LinuxEventLoop::init() {
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    if (!timers_.init()) return false;

    auto db_path = config_.store.db_path.empty() ? platform::data_file("notifications.db")
                                                 : config_.store.db_path;
    if (!core_.init(db_path, platform::data_file("mute.json"))) return false;
    log("Notification store at " + db_path);

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);
    // Subscribers that vanish mid-write must not kill the daemon.
    signal(SIGPIPE, SIG_IGN);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    if (!add_fd(signal_fd_) || !add_fd(ipc_server_.server_fd()) ||
        !add_fd(worker_event_fd_) || !add_fd(timers_.fd())) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    running_.store(true, std::memory_order_release);
    core_.start();
    return true;
}

bool LinuxEventLoop::add_fd(int fd) {
    epoll_event ev{.events = EPOLLIN, .data = {.fd = fd}};
    return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log(std::format("Received signal {}, shutting down", info.ssi_signo));
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0 && !add_fd(client_fd)) {
                    ipc_server_.close_client(client_fd);
                }
                continue;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                if (::read(worker_event_fd_, &val, sizeof(val)) > 0) {
                    core_.on_poll_complete();
                }
                continue;
            }

            if (fd == timers_.fd()) {
                timers_.dispatch();
                continue;
            }

            handle_client(fd);
        }
    }

    core_.shutdown();
    ipc_server_.stop();
}

void LinuxEventLoop::handle_client(int fd) {
    std::vector<nlohmann::json> cmds;
    bool open = ipc_server_.read_commands(fd, cmds);

    for (auto& cmd : cmds) {
        std::string cmd_str;
        if (auto it = cmd.find("cmd"); it != cmd.end() && it->is_string()) cmd_str = it->get<std::string>();
        auto response = core_.handle_command(cmd_str, cmd);

        if (!ipc_server_.send_response(fd, response)) {
            open = false;
            break;
        }
        if (response.value("status", "") == "subscribed") {
            core_.add_subscriber(fd);
        }
    }

    if (!open) drop_client(fd);
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    core_.remove_client(fd);
    ipc_server_.close_client(fd);
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[panetoast] {}", msg);
    }
}
