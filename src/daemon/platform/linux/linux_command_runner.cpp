#include "platform/command_runner.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace platform {

namespace {

std::expected<int, std::string> reap(pid_t pid) {
    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

std::expected<CommandResult, std::string> run_command(const std::vector<std::string>& argv,
                                                      int timeout_ms) {
    if (argv.empty()) return std::unexpected("empty command");

    // Everything the child needs is prepared here; after fork() it only calls
    // async-signal-safe functions.
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    int devnull = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    if (devnull < 0) {
        return std::unexpected(std::string("open(/dev/null) failed: ") + std::strerror(errno));
    }

    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) < 0) {
        ::close(devnull);
        return std::unexpected(std::string("pipe2() failed: ") + std::strerror(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(devnull);
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        ::dup2(pipefd[1], STDOUT_FILENO);
        ::dup2(devnull, STDIN_FILENO);
        ::dup2(devnull, STDERR_FILENO);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    ::close(devnull);
    ::close(pipefd[1]);

    CommandResult result;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    pollfd pfd{.fd = pipefd[0], .events = POLLIN, .revents = 0};
    bool timed_out = false;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            timed_out = true;
            break;
        }

        int ret = ::poll(&pfd, 1, static_cast<int>(remaining));
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) {
            timed_out = true;
            break;
        }

        char buf[4096];
        ssize_t n = ::read(pipefd[0], buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;
        result.output.append(buf, static_cast<size_t>(n));
    }

    ::close(pipefd[0]);

    if (timed_out) {
        ::kill(pid, SIGKILL);
        auto reaped = reap(pid);
        if (!reaped) return std::unexpected(reaped.error());
        return std::unexpected(argv[0] + " timed out after " + std::to_string(timeout_ms) + "ms");
    }

    auto code = reap(pid);
    if (!code) return std::unexpected(code.error());
    if (*code == 127) return std::unexpected(argv[0] + " could not be executed");

    result.exit_code = *code;
    return result;
}

} // namespace platform
