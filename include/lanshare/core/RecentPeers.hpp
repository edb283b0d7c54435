#pragma once

#include "lanshare/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace lanshare {

struct RecentPeer {
    DeviceId device_id{};
    std::string display_name;
    std::string address;
    std::uint16_t port{0};
    std::int64_t last_used{0};  // seconds since the Unix epoch
    std::uint32_t success_count{0};
    std::uint32_t total_attempts{0};

    // Percentage of attempts that completed, 0 when never attempted.
    [[nodiscard]] double success_rate() const noexcept;
};

// Most-recent-first history of peers this device sent files to, persisted as a
// JSON array. Every mutation rewrites the file.
class RecentPeers {
public:
    RecentPeers(std::filesystem::path file, std::size_t limit);

    // A missing file leaves the history empty. Throws std::runtime_error when the
    // file exists but cannot be read or parsed.
    void load();

    // Moves the peer to the front, refreshing its address and counters.
    // Throws std::runtime_error when the file cannot be written.
    void record(const PeerIdentity& peer, bool success, std::int64_t now);
    void record(const PeerIdentity& peer, bool success);

    // 0 means the whole list.
    [[nodiscard]] std::vector<RecentPeer> recent(std::size_t limit = 0) const;
    bool remove(const DeviceId& device_id);
    void clear();

    [[nodiscard]] const std::filesystem::path& file() const noexcept { return file_; }

private:
    void save_locked() const;

    std::filesystem::path file_;
    std::size_t limit_;
    mutable std::mutex mutex_;
    std::vector<RecentPeer> peers_;
};

}  // namespace lanshare
