#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanshare {

using DeviceId = std::array<std::uint8_t, 16>;
using TransferId = std::uint64_t;
using Clock = std::chrono::steady_clock;

std::string device_id_to_string(const DeviceId& id);
std::optional<DeviceId> device_id_from_string(const std::string& text);

std::string transfer_id_to_string(TransferId id);

struct PeerIdentity {
    DeviceId device_id{};
    std::string display_name;
    std::string address;
    std::uint16_t port{0};
};

enum class PeerStatus {
    Online,
    Stale
};

struct PeerRecord {
    PeerIdentity identity;
    Clock::time_point last_seen{};
    PeerStatus status{PeerStatus::Online};
};

const char* to_string(PeerStatus status) noexcept;

}  // namespace lanshare
