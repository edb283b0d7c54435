#include "lanshare/core/EventBus.hpp"

#include "lanshare/log/StructuredLogger.hpp"

#include <algorithm>
#include <exception>

namespace lanshare {

EventBus::SubscriptionId EventBus::subscribe(EventCallback listener) {
    std::scoped_lock lock(mutex_);
    const auto id = next_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::scoped_lock lock(mutex_);
    const auto it = std::remove_if(listeners_.begin(), listeners_.end(), [&](const auto& entry) {
        return entry.first == id;
    });
    const bool removed = it != listeners_.end();
    listeners_.erase(it, listeners_.end());
    return removed;
}

void EventBus::publish(const EngineEvent& event) const {
    std::vector<EventCallback> listeners;
    {
        std::scoped_lock lock(mutex_);
        listeners.reserve(listeners_.size());
        for (const auto& [id, listener] : listeners_) {
            listeners.push_back(listener);
        }
    }

    for (const auto& listener : listeners) {
        if (!listener) {
            continue;
        }
        try {
            listener(event);
        } catch (const std::exception& ex) {
            log::StructuredLogger::instance().error(
                "events.listener_failed",
                {{"event", to_string(event.kind)}, {"error", ex.what()}});
        }
    }
}

std::size_t EventBus::listener_count() const {
    std::scoped_lock lock(mutex_);
    return listeners_.size();
}

const char* to_string(EventKind kind) noexcept {
    switch (kind) {
        case EventKind::PeerOnline:
            return "peer_online";
        case EventKind::PeerStale:
            return "peer_stale";
        case EventKind::PeerRemoved:
            return "peer_removed";
        case EventKind::OfferReceived:
            return "offer_received";
        case EventKind::StateChanged:
            return "state_changed";
        case EventKind::Progress:
            return "progress";
    }
    return "unknown";
}

}  // namespace lanshare
