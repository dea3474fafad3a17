#include "platform/linux/timerfd_timer_service.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <sys/timerfd.h>
#include <unistd.h>

TimerfdTimerService::TimerfdTimerService() = default;

TimerfdTimerService::~TimerfdTimerService() {
    if (fd_ >= 0) ::close(fd_);
}

bool TimerfdTimerService::init() {
    fd_ = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd_ < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return false;
    }
    return true;
}

TimerService::TimerId TimerfdTimerService::schedule(std::chrono::milliseconds delay,
                                                    std::function<void()> callback) {
    TimerId id = next_id_++;
    timers_.emplace(Key{Clock::now() + delay, id}, std::move(callback));
    rearm();
    return id;
}

void TimerfdTimerService::cancel(TimerId id) {
    std::erase_if(timers_, [id](const auto& entry) { return entry.first.second == id; });
    rearm();
}

void TimerfdTimerService::dispatch() {
    uint64_t expirations;
    ::read(fd_, &expirations, sizeof(expirations));

    // One at a time so a callback can cancel or schedule timers that are also due.
    auto now = Clock::now();
    while (!timers_.empty() && timers_.begin()->first.first <= now) {
        auto node = timers_.extract(timers_.begin());
        node.mapped()();
    }
    rearm();
}

void TimerfdTimerService::rearm() {
    if (fd_ < 0) return;

    itimerspec its{};
    if (!timers_.empty()) {
        auto delay = timers_.begin()->first.first - Clock::now();
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(delay).count();
        // A zero it_value disarms the timer, so fire as soon as possible instead.
        if (ns <= 0) ns = 1;
        its.it_value.tv_sec = static_cast<time_t>(ns / 1'000'000'000);
        its.it_value.tv_nsec = static_cast<long>(ns % 1'000'000'000);
    }
    if (::timerfd_settime(fd_, 0, &its, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
    }
}
