#pragma once

#include "models/notification.hpp"
#include "platform/timer_service.hpp"

#include <cstddef>
#include <functional>
#include <vector>

enum class ToastState { Empty, Showing, FadingOut };

struct ToastOptions {
    int duration_ms = 4000;
    bool persistent = false;
    int fade_ms = 300;
};

struct ToastCallbacks {
    std::function<void(const Notification& entry, size_t index, size_t count)> show;
    std::function<void()> fade;
    std::function<void()> hide;
    std::function<void(const Notification&)> remove;
    std::function<void(const Notification&)> focus;
};

// Single-slot LIFO toast display. Newest entries are shown first; entries that
// were queued but not yet read survive later pushes unless superseded by an
// incoming entry for the same group and pane.
class ToastQueue {
public:
    ToastQueue(TimerService& timers, ToastOptions options, ToastCallbacks callbacks);
    ~ToastQueue();

    ToastQueue(const ToastQueue&) = delete;
    ToastQueue& operator=(const ToastQueue&) = delete;

    // `batch` is in arrival order (oldest first).
    void push(std::vector<Notification> batch);

    // Activates the current entry: delete it (unless force-focus), focus its pane, advance.
    void click();
    void dismiss(bool delete_entry);
    void clear();

    ToastState state() const { return state_; }
    const std::vector<Notification>& entries() const { return entries_; }
    size_t index() const { return index_; }
    const Notification* current() const;

private:
    void show_current();
    void advance();
    void start_fade();
    void finish_fade();
    void arm(int ms, std::function<void()> callback);
    void cancel_timer();

    TimerService& timers_;
    ToastOptions options_;
    ToastCallbacks callbacks_;

    ToastState state_ = ToastState::Empty;
    std::vector<Notification> entries_;
    size_t index_ = 0;
    TimerService::TimerId timer_ = 0;
};
