#include "toast/toast_queue.hpp"

#include <algorithm>
#include <chrono>

namespace {

bool supersedes(const Notification& incoming, const Notification& queued) {
    return !incoming.tmux_pane.empty() && incoming.tmux_pane == queued.tmux_pane &&
           incoming.group_key() == queued.group_key();
}

} // namespace

ToastQueue::ToastQueue(TimerService& timers, ToastOptions options, ToastCallbacks callbacks)
    : timers_(timers), options_(options), callbacks_(std::move(callbacks)) {}

ToastQueue::~ToastQueue() {
    cancel_timer();
}

const Notification* ToastQueue::current() const {
    if (state_ != ToastState::Showing || index_ >= entries_.size()) return nullptr;
    return &entries_[index_];
}

void ToastQueue::push(std::vector<Notification> batch) {
    if (batch.empty()) return;
    cancel_timer();

    std::ranges::reverse(batch);

    if (state_ == ToastState::Showing) {
        std::vector<Notification> remainder(entries_.begin() + static_cast<std::ptrdiff_t>(index_), entries_.end());
        std::erase_if(remainder, [&](const Notification& queued) {
            return std::ranges::any_of(batch, [&](const Notification& n) { return supersedes(n, queued); });
        });
        batch.insert(batch.end(), std::make_move_iterator(remainder.begin()),
                     std::make_move_iterator(remainder.end()));
    }

    entries_ = std::move(batch);
    index_ = 0;
    show_current();
}

void ToastQueue::click() {
    if (state_ != ToastState::Showing) return;
    cancel_timer();

    auto entry = entries_[index_];
    if (!entry.force_focus && callbacks_.remove) callbacks_.remove(entry);
    if (callbacks_.focus) callbacks_.focus(entry);
    advance();
}

void ToastQueue::dismiss(bool delete_entry) {
    if (state_ != ToastState::Showing) return;
    cancel_timer();

    if (delete_entry && callbacks_.remove) callbacks_.remove(entries_[index_]);
    advance();
}

void ToastQueue::clear() {
    cancel_timer();
    bool was_visible = state_ != ToastState::Empty;
    entries_.clear();
    index_ = 0;
    state_ = ToastState::Empty;
    if (was_visible && callbacks_.hide) callbacks_.hide();
}

void ToastQueue::show_current() {
    state_ = ToastState::Showing;
    if (callbacks_.show) callbacks_.show(entries_[index_], index_, entries_.size());
    if (!options_.persistent) {
        arm(options_.duration_ms, [this] { advance(); });
    }
}

void ToastQueue::advance() {
    cancel_timer();
    index_++;
    if (index_ < entries_.size()) {
        show_current();
    } else {
        start_fade();
    }
}

void ToastQueue::start_fade() {
    cancel_timer();
    state_ = ToastState::FadingOut;
    if (callbacks_.fade) callbacks_.fade();
    arm(options_.fade_ms, [this] { finish_fade(); });
}

void ToastQueue::finish_fade() {
    cancel_timer();
    entries_.clear();
    index_ = 0;
    state_ = ToastState::Empty;
    if (callbacks_.hide) callbacks_.hide();
}

void ToastQueue::arm(int ms, std::function<void()> callback) {
    timer_ = timers_.schedule(std::chrono::milliseconds(ms), [this, callback = std::move(callback)] {
        timer_ = 0;
        callback();
    });
}

void ToastQueue::cancel_timer() {
    if (timer_ != 0) {
        timers_.cancel(timer_);
        timer_ = 0;
    }
}
