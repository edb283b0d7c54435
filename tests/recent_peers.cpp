#include "lanshare/core/RecentPeers.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

using namespace lanshare;

PeerIdentity peer(std::uint8_t fill, const std::string& name, const std::string& address) {
    PeerIdentity identity{};
    identity.device_id.fill(fill);
    identity.display_name = name;
    identity.address = address;
    identity.port = 47801;
    return identity;
}

}  // namespace

int main() {
    const auto root = std::filesystem::temp_directory_path() / "lanshare_recent_peers_test";
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    const auto file = root / "state" / "recent_peers.json";

    // No file yet: empty history, nothing written.
    RecentPeers history(file, 3);
    history.load();
    assert(history.recent().empty());
    assert(!std::filesystem::exists(file));

    history.record(peer(0x01, "laptop", "192.168.1.10"), true, 100);
    history.record(peer(0x02, "desktop", "192.168.1.11"), false, 200);
    history.record(peer(0x01, "laptop-renamed", "192.168.1.12"), true, 300);
    assert(std::filesystem::exists(file));

    // The latest use moves a peer to the front and refreshes its address.
    auto recent = history.recent();
    assert(recent.size() == 2);
    assert(recent[0].display_name == "laptop-renamed");
    assert(recent[0].address == "192.168.1.12");
    assert(recent[0].last_used == 300);
    assert(recent[0].success_count == 2 && recent[0].total_attempts == 2);
    assert(recent[0].success_rate() == 100.0);
    assert(recent[1].success_count == 0 && recent[1].total_attempts == 1);
    assert(recent[1].success_rate() == 0.0);
    assert(history.recent(1).size() == 1);

    // Over the limit the oldest entry falls off.
    history.record(peer(0x03, "phone", "192.168.1.13"), false, 400);
    history.record(peer(0x04, "tablet", "192.168.1.14"), true, 500);
    recent = history.recent();
    assert(recent.size() == 3);
    assert(recent[0].display_name == "tablet");
    assert(recent[2].display_name == "laptop-renamed");

    // A fresh instance reads back the same list.
    RecentPeers reloaded(file, 3);
    reloaded.load();
    const auto restored = reloaded.recent();
    assert(restored.size() == 3);
    for (std::size_t i = 0; i < restored.size(); ++i) {
        assert(restored[i].device_id == recent[i].device_id);
        assert(restored[i].display_name == recent[i].display_name);
        assert(restored[i].last_used == recent[i].last_used);
        assert(restored[i].total_attempts == recent[i].total_attempts);
    }

    // A smaller limit trims on load.
    RecentPeers narrow(file, 1);
    narrow.load();
    assert(narrow.recent().size() == 1);
    assert(narrow.recent()[0].display_name == "tablet");

    DeviceId tablet{};
    tablet.fill(0x04);
    assert(reloaded.remove(tablet));
    assert(!reloaded.remove(tablet));
    assert(reloaded.recent().size() == 2);

    // Names with quotes and control characters survive the file format.
    reloaded.record(peer(0x05, "Ann's \"PC\"\n", "10.0.0.5"), true, 600);
    RecentPeers escaped(file, 3);
    escaped.load();
    assert(escaped.recent()[0].display_name == "Ann's \"PC\"\n");

    reloaded.clear();
    RecentPeers cleared(file, 3);
    cleared.load();
    assert(cleared.recent().empty());

    for (const char* broken : {"{", "{\"device_id\": 1}", "[{\"device_id\": \"zz\"}]", "[1, 2]"}) {
        {
            std::ofstream out(file, std::ios::trunc);
            out << broken;
        }
        RecentPeers corrupt(file, 3);
        bool threw = false;
        try {
            corrupt.load();
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
    }

    std::filesystem::remove_all(root, ec);
    return 0;
}
