#include "event_bus.hpp"

int EventBus::subscribe(Handler handler) {
    int id = next_id_++;
    handlers_.push_back({id, std::move(handler)});
    return id;
}

void EventBus::unsubscribe(int id) {
    std::erase_if(handlers_, [id](const Entry& e) { return e.id == id; });
}

void EventBus::publish(const std::string& name, nlohmann::json payload) {
    BusEvent event{name, std::move(payload)};
    // Handlers may unsubscribe while we deliver.
    auto snapshot = handlers_;
    for (auto& entry : snapshot) {
        entry.handler(event);
    }
}
