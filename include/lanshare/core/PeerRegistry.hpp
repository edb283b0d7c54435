#pragma once

#include "lanshare/Types.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lanshare {

// Thread-safe table of peers seen on the network, keyed by device id.
class PeerRegistry {
public:
    enum class UpsertResult {
        Inserted,
        Refreshed,
        Revived,
        IgnoredSelf
    };

    struct SweepResult {
        std::vector<PeerRecord> became_stale;
        std::vector<PeerRecord> removed;

        [[nodiscard]] bool empty() const noexcept { return became_stale.empty() && removed.empty(); }
    };

    explicit PeerRegistry(DeviceId self);

    // The address is taken from the datagram source; identity.address is ignored.
    UpsertResult upsert(const PeerIdentity& identity,
                        const std::string& source_address,
                        Clock::time_point now);

    // Online -> Stale after stale_after without an announcement; removal after twice that.
    SweepResult sweep(Clock::time_point now, std::chrono::milliseconds stale_after);

    [[nodiscard]] std::vector<PeerRecord> snapshot() const;
    [[nodiscard]] std::optional<PeerRecord> find(const DeviceId& device_id) const;
    [[nodiscard]] std::size_t size() const;
    void clear();

    [[nodiscard]] const DeviceId& self() const noexcept { return self_; }

private:
    DeviceId self_{};
    mutable std::mutex mutex_;
    std::unordered_map<std::string, PeerRecord> peers_;
};

const char* to_string(PeerRegistry::UpsertResult result) noexcept;

}  // namespace lanshare
