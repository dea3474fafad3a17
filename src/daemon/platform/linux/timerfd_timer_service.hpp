#pragma once

#include "platform/timer_service.hpp"

#include <chrono>
#include <map>
#include <utility>

// All one-shot timers multiplexed onto a single timerfd that is armed for the
// earliest deadline. The owner polls fd() and calls dispatch() when readable.
class TimerfdTimerService : public TimerService {
public:
    TimerfdTimerService();
    ~TimerfdTimerService() override;

    TimerfdTimerService(const TimerfdTimerService&) = delete;
    TimerfdTimerService& operator=(const TimerfdTimerService&) = delete;

    bool init();
    int fd() const { return fd_; }

    TimerId schedule(std::chrono::milliseconds delay, std::function<void()> callback) override;
    void cancel(TimerId id) override;

    void dispatch();

private:
    using Clock = std::chrono::steady_clock;
    using Key = std::pair<Clock::time_point, TimerId>;

    void rearm();

    int fd_ = -1;
    TimerId next_id_ = 1;
    std::map<Key, std::function<void()>> timers_;
};
