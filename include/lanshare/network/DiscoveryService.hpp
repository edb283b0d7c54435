#pragma once

#include "lanshare/Config.hpp"
#include "lanshare/Events.hpp"
#include "lanshare/core/PeerRegistry.hpp"
#include "lanshare/network/Socket.hpp"
#include "lanshare/protocol/Message.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <thread>
#include <vector>

namespace lanshare::network {

// Broadcasts this device's Announcement and feeds received ones into the PeerRegistry.
// A single worker thread owns the UDP socket; it listens between ticks, and each tick
// announces and sweeps the registry.
class DiscoveryService {
public:
    DiscoveryService(PeerRegistry& registry,
                     Config config,
                     protocol::Announcement self,
                     EventCallback events = {});
    ~DiscoveryService();

    DiscoveryService(const DiscoveryService&) = delete;
    DiscoveryService& operator=(const DiscoveryService&) = delete;

    // Throws std::runtime_error if the discovery port cannot be bound.
    void start();
    void stop();
    [[nodiscard]] bool running() const noexcept { return running_.load(); }

    // Decodes one datagram and applies it. Malformed input is dropped and counted.
    void ingest(std::span<const std::uint8_t> bytes,
                const std::string& source_address,
                Clock::time_point now);

    // Sends the announcement to every target and sweeps the registry.
    void tick(Clock::time_point now);

    void update_listen_port(std::uint16_t port);

    [[nodiscard]] std::uint16_t bound_port() const noexcept { return socket_.port(); }
    [[nodiscard]] std::uint64_t dropped_frames() const noexcept { return dropped_frames_.load(); }
    [[nodiscard]] std::uint64_t announcements_sent() const noexcept { return announcements_sent_.load(); }

private:
    void run();
    void announce();
    void publish(EventKind kind, const PeerRecord& record) const;

    PeerRegistry& registry_;
    Config config_;
    std::vector<Config::DiscoveryTarget> targets_;
    EventCallback events_;

    std::mutex announcement_mutex_;
    protocol::Announcement self_;

    // Serialises registry updates against stop().
    std::mutex apply_mutex_;
    bool stopped_{false};

    UdpSocket socket_;
    std::atomic<bool> running_{false};
    std::thread worker_;
    std::atomic<bool> last_announce_ok_{true};

    std::atomic<std::uint64_t> dropped_frames_{0};
    std::atomic<std::uint64_t> announcements_sent_{0};
};

}  // namespace lanshare::network
