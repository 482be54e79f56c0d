/**
 * @file subscriber_registry.cpp
 * @brief SubscriberRegistry implementation.
 *
 * @copyright GPL-2.0-or-later
 */

#include "droidglue/subscriber_registry.h"
#include "droidglue/logging.h"

#include <utility>

namespace droidglue {

void SubscriberRegistry::subscribe(EventSender endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    endpoints_.push_back(std::move(endpoint));
}

PublishStats SubscriberRegistry::publish(const Event& event) {
    PublishStats stats;
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto it = endpoints_.begin(); it != endpoints_.end();) {
        switch (it->send(event)) {
            case SendStatus::Sent:
                ++stats.delivered;
                ++it;
                break;
            case SendStatus::Full:
                ++stats.dropped;
                ++it;
                break;
            case SendStatus::Disconnected:
                ++stats.pruned;
                it = endpoints_.erase(it);
                break;
        }
    }

    if (stats.pruned > 0) {
        LOG_DEBUG("registry", "pruned %zu disconnected endpoint(s), %zu remain",
                  stats.pruned, endpoints_.size());
    }
    return stats;
}

size_t SubscriberRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return endpoints_.size();
}

} // namespace droidglue
