#include "events/event_bus.h"

#include <algorithm>
#include <exception>

#include "common/logging.h"

namespace plotwise::events {

SubscriptionId EventBus::Subscribe(std::string pattern, EventCallback callback) {
    SubscriptionId id = next_id_++;
    subscribers_.push_back(Subscriber{
        .id = id,
        .pattern = std::move(pattern),
        .callback = std::move(callback),
    });
    return id;
}

bool EventBus::Unsubscribe(SubscriptionId id) {
    auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                           [id](const Subscriber& s) { return s.id == id; });
    if (it == subscribers_.end()) {
        return false;
    }
    subscribers_.erase(it);
    return true;
}

void EventBus::Emit(const Event& event) {
    PLOTWISE_LOG_TRACE("Emitting event '{}'", event.type);

    // Copy so callbacks may subscribe or unsubscribe during dispatch
    std::vector<Subscriber> snapshot = subscribers_;
    for (const auto& subscriber : snapshot) {
        if (!Matches(subscriber.pattern, event.type)) {
            continue;
        }
        try {
            subscriber.callback(event);
        } catch (const std::exception& e) {
            PLOTWISE_LOG_ERROR("Subscriber '{}' failed on event '{}': {}",
                               subscriber.pattern, event.type, e.what());
        }
    }
}

bool EventBus::Matches(std::string_view pattern, std::string_view type) {
    if (!pattern.empty() && pattern.back() == '*') {
        std::string_view prefix = pattern.substr(0, pattern.size() - 1);
        return type.substr(0, prefix.size()) == prefix;
    }
    return pattern == type;
}

}  // namespace plotwise::events
