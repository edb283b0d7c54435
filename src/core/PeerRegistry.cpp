#include "lanshare/core/PeerRegistry.hpp"

#include <algorithm>

namespace lanshare {

PeerRegistry::PeerRegistry(DeviceId self)
    : self_(self) {}

PeerRegistry::UpsertResult PeerRegistry::upsert(const PeerIdentity& identity,
                                                const std::string& source_address,
                                                Clock::time_point now) {
    if (identity.device_id == self_) {
        return UpsertResult::IgnoredSelf;
    }

    const auto key = device_id_to_string(identity.device_id);

    std::scoped_lock lock(mutex_);
    auto it = peers_.find(key);
    if (it == peers_.end()) {
        PeerRecord record{};
        record.identity = identity;
        record.identity.address = source_address;
        record.last_seen = now;
        record.status = PeerStatus::Online;
        peers_.emplace(key, std::move(record));
        return UpsertResult::Inserted;
    }

    auto& record = it->second;
    const bool was_stale = record.status == PeerStatus::Stale;
    record.identity.display_name = identity.display_name;
    record.identity.address = source_address;
    record.identity.port = identity.port;
    record.last_seen = std::max(record.last_seen, now);
    record.status = PeerStatus::Online;
    return was_stale ? UpsertResult::Revived : UpsertResult::Refreshed;
}

PeerRegistry::SweepResult PeerRegistry::sweep(Clock::time_point now, std::chrono::milliseconds stale_after) {
    SweepResult result{};
    const auto remove_after = stale_after * 2;

    std::scoped_lock lock(mutex_);
    for (auto it = peers_.begin(); it != peers_.end();) {
        auto& record = it->second;
        const auto silence = now - record.last_seen;
        if (silence > remove_after) {
            result.removed.push_back(record);
            it = peers_.erase(it);
            continue;
        }
        if (silence > stale_after && record.status == PeerStatus::Online) {
            record.status = PeerStatus::Stale;
            result.became_stale.push_back(record);
        }
        ++it;
    }
    return result;
}

std::vector<PeerRecord> PeerRegistry::snapshot() const {
    std::vector<PeerRecord> records;
    {
        std::scoped_lock lock(mutex_);
        records.reserve(peers_.size());
        for (const auto& [key, record] : peers_) {
            records.push_back(record);
        }
    }

    std::sort(records.begin(), records.end(), [](const PeerRecord& lhs, const PeerRecord& rhs) {
        if (lhs.identity.display_name != rhs.identity.display_name) {
            return lhs.identity.display_name < rhs.identity.display_name;
        }
        return lhs.identity.device_id < rhs.identity.device_id;
    });
    return records;
}

std::optional<PeerRecord> PeerRegistry::find(const DeviceId& device_id) const {
    std::scoped_lock lock(mutex_);
    const auto it = peers_.find(device_id_to_string(device_id));
    if (it == peers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t PeerRegistry::size() const {
    std::scoped_lock lock(mutex_);
    return peers_.size();
}

void PeerRegistry::clear() {
    std::scoped_lock lock(mutex_);
    peers_.clear();
}

const char* to_string(PeerRegistry::UpsertResult result) noexcept {
    switch (result) {
        case PeerRegistry::UpsertResult::Inserted:
            return "inserted";
        case PeerRegistry::UpsertResult::Refreshed:
            return "refreshed";
        case PeerRegistry::UpsertResult::Revived:
            return "revived";
        case PeerRegistry::UpsertResult::IgnoredSelf:
            return "ignored_self";
    }
    return "unknown";
}

}  // namespace lanshare
