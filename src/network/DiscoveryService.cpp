#include "lanshare/network/DiscoveryService.hpp"

#include "lanshare/log/StructuredLogger.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

namespace lanshare::network {

namespace {

constexpr std::chrono::milliseconds kMaxReceiveSlice{200};
constexpr const char* kBroadcastAddress = "255.255.255.255";

log::StructuredLogger& logger() {
    return log::StructuredLogger::instance();
}

}  // namespace

DiscoveryService::DiscoveryService(PeerRegistry& registry,
                                   Config config,
                                   protocol::Announcement self,
                                   EventCallback events)
    : registry_(registry),
      config_(std::move(config)),
      events_(std::move(events)),
      self_(std::move(self)) {
    targets_ = config_.discovery_targets;
    if (targets_.empty()) {
        targets_.push_back(Config::DiscoveryTarget{kBroadcastAddress, config_.discovery_port});
    }
    if (config_.announce_interval <= std::chrono::seconds::zero()) {
        config_.announce_interval = std::chrono::seconds(1);
    }
}

DiscoveryService::~DiscoveryService() {
    stop();
}

void DiscoveryService::start() {
    if (running_) {
        return;
    }

    socket_.bind(config_.discovery_port);
    {
        std::scoped_lock lock(apply_mutex_);
        stopped_ = false;
    }
    running_ = true;
    worker_ = std::thread(&DiscoveryService::run, this);

    logger().info("discovery.started",
                  {{"port", std::to_string(socket_.port())},
                   {"targets", std::to_string(targets_.size())},
                   {"device_id", device_id_to_string(self_.device_id)}});
}

void DiscoveryService::stop() {
    const bool was_running = running_.exchange(false);
    if (worker_.joinable()) {
        worker_.join();
    }
    socket_.close();
    {
        std::scoped_lock lock(apply_mutex_);
        stopped_ = true;
    }
    if (was_running) {
        logger().info("discovery.stopped", {{"dropped_frames", std::to_string(dropped_frames_.load())}});
    }
}

void DiscoveryService::ingest(std::span<const std::uint8_t> bytes,
                              const std::string& source_address,
                              Clock::time_point now) {
    ErrorCode error = ErrorCode::MalformedFrame;
    const auto announcement = protocol::decode_announcement(bytes, &error);
    if (!announcement) {
        dropped_frames_.fetch_add(1);
        logger().warning("discovery.frame_dropped",
                         {{"source", source_address},
                          {"reason", to_string(error)},
                          {"bytes", std::to_string(bytes.size())}});
        return;
    }

    PeerIdentity identity{};
    identity.device_id = announcement->device_id;
    identity.display_name = announcement->display_name;
    identity.port = announcement->listen_port;

    std::optional<PeerRecord> online;
    {
        std::scoped_lock lock(apply_mutex_);
        if (stopped_) {
            return;
        }
        const auto result = registry_.upsert(identity, source_address, now);
        if (result == PeerRegistry::UpsertResult::Inserted || result == PeerRegistry::UpsertResult::Revived) {
            online = registry_.find(identity.device_id);
            logger().info("discovery.peer_online",
                          {{"device_id", device_id_to_string(identity.device_id)},
                           {"name", identity.display_name},
                           {"address", source_address + ":" + std::to_string(identity.port)},
                           {"result", to_string(result)}});
        }
    }

    if (online) {
        publish(EventKind::PeerOnline, *online);
    }
}

void DiscoveryService::tick(Clock::time_point now) {
    if (running_) {
        announce();
    }

    PeerRegistry::SweepResult sweep;
    {
        std::scoped_lock lock(apply_mutex_);
        if (stopped_) {
            return;
        }
        sweep = registry_.sweep(now, config_.stale_after);
    }

    for (const auto& record : sweep.became_stale) {
        logger().info("discovery.peer_stale", {{"device_id", device_id_to_string(record.identity.device_id)},
                                               {"name", record.identity.display_name}});
        publish(EventKind::PeerStale, record);
    }
    for (const auto& record : sweep.removed) {
        logger().info("discovery.peer_removed", {{"device_id", device_id_to_string(record.identity.device_id)},
                                                 {"name", record.identity.display_name}});
        publish(EventKind::PeerRemoved, record);
    }
}

void DiscoveryService::update_listen_port(std::uint16_t port) {
    std::scoped_lock lock(announcement_mutex_);
    self_.listen_port = port;
}

void DiscoveryService::run() {
    auto next_tick = Clock::now();
    while (running_) {
        auto now = Clock::now();
        if (now >= next_tick) {
            tick(now);
            next_tick = now + config_.announce_interval;
        }

        const auto until_tick = std::chrono::duration_cast<std::chrono::milliseconds>(next_tick - now);
        const auto slice = std::clamp(until_tick, std::chrono::milliseconds(1), kMaxReceiveSlice);
        auto datagram = socket_.receive_from(slice);
        if (datagram) {
            ingest(datagram->data, datagram->address, Clock::now());
        }
    }
}

void DiscoveryService::announce() {
    std::vector<std::uint8_t> frame;
    {
        std::scoped_lock lock(announcement_mutex_);
        frame = protocol::encode_announcement(self_);
    }

    bool all_sent = true;
    for (const auto& target : targets_) {
        if (socket_.send_to(target.host, target.port, frame)) {
            announcements_sent_.fetch_add(1);
        } else {
            all_sent = false;
            if (last_announce_ok_) {
                logger().warning("discovery.announce_failed",
                                 {{"target", target.host + ":" + std::to_string(target.port)}});
            }
        }
    }
    last_announce_ok_.store(all_sent);
}

void DiscoveryService::publish(EventKind kind, const PeerRecord& record) const {
    if (!events_) {
        return;
    }
    EngineEvent event{};
    event.kind = kind;
    event.peer = record;
    try {
        events_(event);
    } catch (const std::exception& ex) {
        logger().error("discovery.event_failed", {{"event", to_string(kind)}, {"error", ex.what()}});
    }
}

}  // namespace lanshare::network
