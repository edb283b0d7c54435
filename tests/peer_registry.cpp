#include "lanshare/core/PeerRegistry.hpp"

#include <cassert>
#include <chrono>
#include <string>

namespace {

using lanshare::Clock;
using lanshare::DeviceId;
using lanshare::PeerIdentity;
using lanshare::PeerRegistry;
using lanshare::PeerStatus;
using namespace std::chrono_literals;

DeviceId make_id(std::uint8_t value) {
    DeviceId id{};
    id.fill(value);
    return id;
}

PeerIdentity make_peer(std::uint8_t value, const std::string& name, std::uint16_t port = 47801) {
    PeerIdentity identity{};
    identity.device_id = make_id(value);
    identity.display_name = name;
    identity.address = "ignored";
    identity.port = port;
    return identity;
}

}  // namespace

int main() {
    const auto start = Clock::now();
    constexpr auto stale_after = std::chrono::milliseconds(10'000);

    PeerRegistry registry(make_id(0xAA));

    // Self-suppression.
    assert(registry.upsert(make_peer(0xAA, "me"), "10.0.0.1", start) == PeerRegistry::UpsertResult::IgnoredSelf);
    assert(registry.size() == 0);

    assert(registry.upsert(make_peer(1, "Bravo"), "10.0.0.2", start) == PeerRegistry::UpsertResult::Inserted);
    assert(registry.upsert(make_peer(2, "Alpha"), "10.0.0.3", start) == PeerRegistry::UpsertResult::Inserted);

    // Address comes from the datagram source, not the payload.
    auto record = registry.find(make_id(1));
    assert(record);
    assert(record->identity.address == "10.0.0.2");
    assert(record->status == PeerStatus::Online);

    // Refresh updates address, name and port.
    assert(registry.upsert(make_peer(1, "Bravo 2", 5000), "10.0.0.9", start + 1s) ==
           PeerRegistry::UpsertResult::Refreshed);
    record = registry.find(make_id(1));
    assert(record->identity.address == "10.0.0.9");
    assert(record->identity.display_name == "Bravo 2");
    assert(record->identity.port == 5000);

    // Snapshot is ordered by display name.
    const auto snapshot = registry.snapshot();
    assert(snapshot.size() == 2);
    assert(snapshot[0].identity.display_name == "Alpha");
    assert(snapshot[1].identity.display_name == "Bravo 2");

    // Nothing seen within stale_after is touched.
    auto sweep = registry.sweep(start + 10s, stale_after);
    assert(sweep.empty());
    assert(registry.size() == 2);

    // Alpha (last seen at start) goes stale, Bravo (start + 1s) stays online.
    sweep = registry.sweep(start + 10s + 500ms, stale_after);
    assert(sweep.became_stale.size() == 1);
    assert(sweep.became_stale[0].identity.device_id == make_id(2));
    assert(sweep.removed.empty());
    assert(registry.find(make_id(2))->status == PeerStatus::Stale);
    assert(registry.find(make_id(1))->status == PeerStatus::Online);

    // A stale peer that announces again is revived.
    assert(registry.upsert(make_peer(2, "Alpha"), "10.0.0.3", start + 12s) == PeerRegistry::UpsertResult::Revived);
    assert(registry.find(make_id(2))->status == PeerStatus::Online);

    // Online -> Stale -> absent.
    sweep = registry.sweep(start + 12s, stale_after);
    assert(sweep.became_stale.size() == 1);
    assert(sweep.became_stale[0].identity.device_id == make_id(1));
    sweep = registry.sweep(start + 21s + 500ms, stale_after);
    assert(sweep.removed.size() == 1);
    assert(sweep.removed[0].identity.device_id == make_id(1));
    assert(!registry.find(make_id(1)));
    assert(registry.find(make_id(2)));

    // A late datagram never moves last_seen backwards.
    assert(registry.upsert(make_peer(2, "Alpha"), "10.0.0.3", start) == PeerRegistry::UpsertResult::Refreshed);
    sweep = registry.sweep(start + 20s, stale_after);
    assert(sweep.empty());

    registry.clear();
    assert(registry.size() == 0);
    return 0;
}
