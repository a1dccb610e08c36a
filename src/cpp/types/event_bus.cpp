#include <statex/types/event_bus.h>

#include <algorithm>

namespace statex {

    SubscriptionId EventBus::subscribe(std::string_view key, Callback callback) {
        auto id = _next_id++;
        auto it = _subscribers.find(key);
        if (it == _subscribers.end()) { it = _subscribers.emplace(std::string{key}, subscriber_list{}).first; }
        it->second.emplace_back(id, std::move(callback));
        return id;
    }

    void EventBus::unsubscribe(std::string_view key, SubscriptionId id) {
        auto it = _subscribers.find(key);
        if (it == _subscribers.end()) { return; }
        auto &subscribers = it->second;
        std::erase_if(subscribers, [id](const auto &entry) { return entry.first == id; });
        if (subscribers.empty()) { _subscribers.erase(it); }
    }

    void EventBus::emit(std::string_view key) const {
        auto it = _subscribers.find(key);
        if (it == _subscribers.end()) { return; }
        // Copy before dispatch: callbacks are free to change the subscription table
        subscriber_list snapshot{it->second};
        for (const auto &[_, callback] : snapshot) { callback(); }
    }

    std::size_t EventBus::subscriber_count(std::string_view key) const {
        auto it = _subscribers.find(key);
        return it == _subscribers.end() ? 0 : it->second.size();
    }

} // namespace statex
