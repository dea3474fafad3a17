#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

// One-shot timers delivered on the event-loop thread.
class TimerService {
public:
    using TimerId = uint64_t;

    virtual ~TimerService() = default;
    virtual TimerId schedule(std::chrono::milliseconds delay, std::function<void()> callback) = 0;
    virtual void cancel(TimerId id) = 0;
};
