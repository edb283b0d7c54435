#include "lanshare/core/RecentPeers.hpp"

#include "lanshare/config/Json.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace lanshare {

namespace {

std::string require_string(const config::JsonValue& entry, std::string_view key) {
    const auto* value = entry.find(key);
    if (!value || !value->is_string()) {
        throw std::runtime_error("recent peer entry is missing '" + std::string(key) + "'");
    }
    return value->string_value;
}

std::int64_t require_integer(const config::JsonValue& entry, std::string_view key, std::int64_t min, std::int64_t max) {
    const auto* value = entry.find(key);
    if (!value || !value->is_number() || std::floor(value->number_value) != value->number_value ||
        value->number_value < static_cast<double>(min) || value->number_value > static_cast<double>(max)) {
        throw std::runtime_error("recent peer entry has an invalid '" + std::string(key) + "'");
    }
    return static_cast<std::int64_t>(value->number_value);
}

RecentPeer parse_entry(const config::JsonValue& entry) {
    if (!entry.is_object()) {
        throw std::runtime_error("recent peer entry must be an object");
    }
    RecentPeer peer{};
    const auto id = device_id_from_string(require_string(entry, "device_id"));
    if (!id) {
        throw std::runtime_error("recent peer entry has an invalid device_id");
    }
    peer.device_id = *id;
    peer.display_name = require_string(entry, "name");
    peer.address = require_string(entry, "address");
    peer.port = static_cast<std::uint16_t>(require_integer(entry, "port", 0, 65535));
    peer.last_used = require_integer(entry, "last_used", 0, std::int64_t{1} << 50);
    peer.success_count = static_cast<std::uint32_t>(require_integer(entry, "success_count", 0, 0xFFFFFFFFll));
    peer.total_attempts = static_cast<std::uint32_t>(require_integer(entry, "total_attempts", 0, 0xFFFFFFFFll));
    return peer;
}

}  // namespace

double RecentPeer::success_rate() const noexcept {
    if (total_attempts == 0) {
        return 0.0;
    }
    return static_cast<double>(success_count) * 100.0 / static_cast<double>(total_attempts);
}

RecentPeers::RecentPeers(std::filesystem::path file, std::size_t limit)
    : file_(std::move(file)),
      limit_(std::max<std::size_t>(limit, 1)) {}

void RecentPeers::load() {
    std::error_code ec;
    if (!std::filesystem::exists(file_, ec)) {
        std::scoped_lock lock(mutex_);
        peers_.clear();
        return;
    }

    std::ifstream input(file_, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Unable to read recent peers at " + file_.string());
    }
    std::stringstream buffer;
    buffer << input.rdbuf();

    std::vector<RecentPeer> loaded;
    try {
        const auto document = config::parse_json(buffer.str());
        if (!document.is_array()) {
            throw std::runtime_error("recent peers file must hold a JSON array");
        }
        for (const auto& entry : document.array_value) {
            auto peer = parse_entry(entry);
            const auto duplicate = std::any_of(loaded.begin(), loaded.end(), [&](const RecentPeer& existing) {
                return existing.device_id == peer.device_id;
            });
            if (!duplicate) {
                loaded.push_back(std::move(peer));
            }
        }
    } catch (const std::runtime_error& ex) {
        throw std::runtime_error("Recent peers file is corrupt: " + file_.string() + ": " + ex.what());
    }
    if (loaded.size() > limit_) {
        loaded.resize(limit_);
    }

    std::scoped_lock lock(mutex_);
    peers_ = std::move(loaded);
}

void RecentPeers::record(const PeerIdentity& peer, bool success) {
    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
    record(peer, success, static_cast<std::int64_t>(now));
}

void RecentPeers::record(const PeerIdentity& peer, bool success, std::int64_t now) {
    std::scoped_lock lock(mutex_);
    RecentPeer entry{};
    const auto it = std::find_if(peers_.begin(), peers_.end(), [&](const RecentPeer& existing) {
        return existing.device_id == peer.device_id;
    });
    if (it != peers_.end()) {
        entry = std::move(*it);
        peers_.erase(it);
    }

    entry.device_id = peer.device_id;
    if (!peer.display_name.empty()) {
        entry.display_name = peer.display_name;
    }
    entry.address = peer.address;
    entry.port = peer.port;
    entry.last_used = std::max(entry.last_used, now);
    ++entry.total_attempts;
    if (success) {
        ++entry.success_count;
    }

    peers_.insert(peers_.begin(), std::move(entry));
    if (peers_.size() > limit_) {
        peers_.resize(limit_);
    }
    save_locked();
}

std::vector<RecentPeer> RecentPeers::recent(std::size_t limit) const {
    std::scoped_lock lock(mutex_);
    if (limit == 0 || limit >= peers_.size()) {
        return peers_;
    }
    return std::vector<RecentPeer>(peers_.begin(), peers_.begin() + static_cast<std::ptrdiff_t>(limit));
}

bool RecentPeers::remove(const DeviceId& device_id) {
    std::scoped_lock lock(mutex_);
    const auto it = std::find_if(peers_.begin(), peers_.end(), [&](const RecentPeer& existing) {
        return existing.device_id == device_id;
    });
    if (it == peers_.end()) {
        return false;
    }
    peers_.erase(it);
    save_locked();
    return true;
}

void RecentPeers::clear() {
    std::scoped_lock lock(mutex_);
    peers_.clear();
    save_locked();
}

void RecentPeers::save_locked() const {
    std::error_code ec;
    if (file_.has_parent_path()) {
        std::filesystem::create_directories(file_.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Unable to create " + file_.parent_path().string() + ": " + ec.message());
        }
    }

    std::ostringstream out;
    out << "[";
    for (std::size_t i = 0; i < peers_.size(); ++i) {
        const auto& peer = peers_[i];
        out << (i == 0 ? "\n" : ",\n")
            << "  {\"device_id\": " << config::quote_json(device_id_to_string(peer.device_id))
            << ", \"name\": " << config::quote_json(peer.display_name)
            << ", \"address\": " << config::quote_json(peer.address)
            << ", \"port\": " << peer.port
            << ", \"last_used\": " << peer.last_used
            << ", \"success_count\": " << peer.success_count
            << ", \"total_attempts\": " << peer.total_attempts << "}";
    }
    out << (peers_.empty() ? "]\n" : "\n]\n");

    auto staging = file_;
    staging += ".tmp";
    {
        std::ofstream output(staging, std::ios::binary | std::ios::trunc);
        output << out.str();
        if (!output.flush()) {
            throw std::runtime_error("Unable to write recent peers at " + staging.string());
        }
    }
    std::filesystem::rename(staging, file_, ec);
    if (ec) {
        std::filesystem::remove(staging, ec);
        throw std::runtime_error("Unable to replace " + file_.string());
    }
}

}  // namespace lanshare
