#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <print>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

namespace {

void redirect(int target_fd, const char* path, int flags) {
    int fd = ::open(path, flags | O_CLOEXEC, 0640);
    if (fd < 0) fd = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    if (fd < 0) return;
    ::dup2(fd, target_fd);
    ::close(fd);
}

} // namespace

void daemonize(const std::string& log_path) {
    std::fflush(stdout);
    std::fflush(stderr);

    pid_t pid = ::fork();
    if (pid < 0) {
        std::println(stderr, "fork() failed: {}", std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0);

    ::setsid();

    pid = ::fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    ::umask(027);
    if (::chdir("/") < 0) _exit(1);

    redirect(STDIN_FILENO, "/dev/null", O_RDONLY);
    redirect(STDOUT_FILENO, "/dev/null", O_WRONLY);

    if (log_path.empty()) {
        redirect(STDERR_FILENO, "/dev/null", O_WRONLY);
    } else {
        std::error_code ec;
        std::filesystem::create_directories(std::filesystem::path(log_path).parent_path(), ec);
        redirect(STDERR_FILENO, log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND);
    }
}

} // namespace platform
