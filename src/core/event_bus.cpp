#include "lanbeam/core/event_bus.hpp"
#include "lanbeam/core/logger.hpp"
#include <exception>
#include <vector>

namespace lanbeam::core {

EventBus::SubscriptionId EventBus::subscribe(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_id_++;
    handlers_.emplace(id, std::move(handler));
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.erase(id) > 0;
}

void EventBus::publish(const Event& event) {
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers.reserve(handlers_.size());
        for (const auto& [id, handler] : handlers_) {
            handlers.push_back(handler);
        }
    }

    LOG_TRACE("Publishing {} to {} subscriber(s)", event_name(event), handlers.size());

    for (const auto& handler : handlers) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            LOG_ERROR("Event handler for {} threw: {}", event_name(event), e.what());
        }
    }
}

std::size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
}

}
