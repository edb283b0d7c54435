#pragma once

#include "lanshare/Events.hpp"

#include <cstdint>
#include <mutex>
#include <utility>
#include <vector>

namespace lanshare {

// Fan-out of engine events. Listeners run on the publishing thread, outside the lock.
class EventBus {
public:
    using SubscriptionId = std::uint64_t;

    SubscriptionId subscribe(EventCallback listener);
    bool unsubscribe(SubscriptionId id);
    void publish(const EngineEvent& event) const;

    [[nodiscard]] std::size_t listener_count() const;

private:
    mutable std::mutex mutex_;
    SubscriptionId next_id_{1};
    std::vector<std::pair<SubscriptionId, EventCallback>> listeners_;
};

}  // namespace lanshare
