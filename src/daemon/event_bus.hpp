#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace events {
inline constexpr const char* kNotificationsNew = "notifications:new";
inline constexpr const char* kUnreadCount = "notifications:unread-count";
inline constexpr const char* kRefresh = "notifications:refresh";
inline constexpr const char* kPanesUpdated = "panes:updated";
inline constexpr const char* kToastShow = "toast:show";
inline constexpr const char* kToastFade = "toast:fade";
inline constexpr const char* kToastHide = "toast:hide";
inline constexpr const char* kMuteChanged = "mute:changed";
inline constexpr const char* kTerminalFocus = "terminal:focus";
} // namespace events

struct BusEvent {
    std::string name;
    nlohmann::json payload;
};

// Synchronous fan-out from producers (store mutations, poll results, toast
// transitions) to consumers (view rebuild, IPC subscribers). Single-threaded:
// publish only from the event-loop thread.
class EventBus {
public:
    using Handler = std::function<void(const BusEvent&)>;

    int subscribe(Handler handler);
    void unsubscribe(int id);

    void publish(const std::string& name, nlohmann::json payload = nullptr);

    size_t subscriber_count() const { return handlers_.size(); }

private:
    struct Entry {
        int id;
        Handler handler;
    };
    std::vector<Entry> handlers_;
    int next_id_ = 1;
};
