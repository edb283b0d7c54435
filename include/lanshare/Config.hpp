#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanshare {

struct Config {
    std::string display_name{"LanShare"};

    std::uint16_t discovery_port{47800};
    std::chrono::seconds announce_interval{std::chrono::seconds(3)};
    std::chrono::seconds stale_after{std::chrono::seconds(10)};

    struct DiscoveryTarget {
        std::string host;
        std::uint16_t port{0};
    };

    // Empty means the limited broadcast address on discovery_port.
    std::vector<DiscoveryTarget> discovery_targets;

    std::string transfer_host{"0.0.0.0"};
    std::uint16_t transfer_port{47801};
    // 0 picks a size from the file size.
    std::uint32_t chunk_size{0};
    std::string checksum_algorithm{"sha256"};
    std::size_t max_concurrent_transfers{4};
    std::chrono::seconds connect_timeout{std::chrono::seconds(5)};
    std::chrono::seconds handshake_timeout{std::chrono::seconds(5)};
    std::chrono::seconds offer_response_timeout{std::chrono::seconds(120)};
    std::chrono::seconds idle_timeout{std::chrono::seconds(30)};
    std::uint32_t ack_every_chunks{8};
    std::chrono::seconds terminal_grace_period{std::chrono::seconds(60)};
    bool auto_accept{false};

    std::string download_directory;
    // Empty means a fresh identity for this process only.
    std::string identity_path;

    // Empty disables the recent-peers history.
    std::string recent_peers_path;
    std::size_t max_recent_peers{10};

    std::string log_level{"info"};
};

}  // namespace lanshare
