#pragma once

#include "lanbeam/core/events.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace lanbeam::core {

// Handlers run on the publishing thread, outside the bus lock.
class EventBus {
public:
    using Handler = std::function<void(const Event&)>;
    using SubscriptionId = std::uint64_t;

    SubscriptionId subscribe(Handler handler);
    bool unsubscribe(SubscriptionId id);

    void publish(const Event& event);

    std::size_t subscriber_count() const;

private:
    mutable std::mutex mutex_;
    std::map<SubscriptionId, Handler> handlers_;
    SubscriptionId next_id_ = 1;
};

}
