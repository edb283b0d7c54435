#include "lanshare/Engine.hpp"

#include "lanshare/config/ConfigLoader.hpp"
#include "lanshare/core/EventBus.hpp"
#include "lanshare/core/Identity.hpp"
#include "lanshare/core/Paths.hpp"
#include "lanshare/core/PeerRegistry.hpp"
#include "lanshare/log/StructuredLogger.hpp"
#include "lanshare/network/DiscoveryService.hpp"
#include "lanshare/network/LocalAddress.hpp"
#include "lanshare/protocol/Message.hpp"
#include "lanshare/transfer/TransferManager.hpp"

#include <exception>
#include <mutex>
#include <optional>
#include <utility>

namespace lanshare {

namespace {

Config resolve_defaults(Config config) {
    config = config::sanitize_config(std::move(config));
    if (config.display_name.empty()) {
        config.display_name = local_host_name();
    }
    config.display_name = protocol::truncate_utf8(config.display_name, protocol::kMaxDisplayNameBytes);
    if (config.download_directory.empty()) {
        config.download_directory = default_download_directory().string();
    }
    return config;
}

PeerIdentity make_identity(const Config& config) {
    PeerIdentity identity{};
    identity.device_id = config.identity_path.empty() ? generate_device_id()
                                                      : load_or_create_device_id(config.identity_path);
    identity.display_name = config.display_name;
    identity.address = "0.0.0.0";
    identity.port = config.transfer_port;
    return identity;
}

}  // namespace

class Engine::Impl {
public:
    explicit Impl(Config config)
        : config_(resolve_defaults(std::move(config))),
          identity_(make_identity(config_)),
          registry_(identity_.device_id),
          manager_(config_, identity_, [this](const EngineEvent& event) {
              record_history(event);
              bus_.publish(event);
          }) {
        if (!config_.recent_peers_path.empty()) {
            history_.emplace(config_.recent_peers_path, config_.max_recent_peers);
            try {
                history_->load();
            } catch (const std::exception& ex) {
                log::StructuredLogger::instance().warning("history.load_failed",
                                                          {{"path", config_.recent_peers_path},
                                                           {"error", ex.what()}});
            }
        }
    }

    ~Impl() {
        stop();
    }

    void start() {
        std::scoped_lock lock(lifecycle_mutex_);
        start_locked();
    }

    void stop() {
        std::scoped_lock lock(lifecycle_mutex_);
        if (discovery_) {
            discovery_->stop();
            discovery_.reset();
        }
        manager_.stop();
    }

    void start_discovery() {
        std::scoped_lock lock(lifecycle_mutex_);
        start_locked();
        if (discovery_) {
            return;
        }

        protocol::Announcement self{};
        self.device_id = identity_.device_id;
        self.display_name = identity_.display_name;
        self.listen_port = identity_.port;

        auto discovery = std::make_unique<network::DiscoveryService>(
            registry_, config_, std::move(self), [this](const EngineEvent& event) { bus_.publish(event); });
        discovery->start();
        discovery_ = std::move(discovery);
    }

    void stop_discovery() {
        std::scoped_lock lock(lifecycle_mutex_);
        if (discovery_) {
            discovery_->stop();
            discovery_.reset();
        }
    }

    bool discovery_running() const {
        std::scoped_lock lock(lifecycle_mutex_);
        return discovery_ && discovery_->running();
    }

    TransferId send_file(const DeviceId& peer, const std::filesystem::path& path) {
        start();

        return manager_.send_file(online_peer(peer).identity, path);
    }

    std::vector<TransferId> send_directory(const DeviceId& peer, const std::filesystem::path& directory) {
        start();
        return manager_.send_directory(online_peer(peer).identity, directory);
    }

    PeerIdentity identity() const {
        std::scoped_lock lock(lifecycle_mutex_);
        return identity_;
    }

    Config config_;
    PeerIdentity identity_;
    PeerRegistry registry_;
    EventBus bus_;
    std::optional<RecentPeers> history_;
    transfer::TransferManager manager_;

private:
    PeerRecord online_peer(const DeviceId& peer) const {
        const auto record = registry_.find(peer);
        if (!record) {
            throw EngineError(ErrorCode::PeerUnreachable, "Unknown peer " + device_id_to_string(peer));
        }
        if (record->status != PeerStatus::Online) {
            throw EngineError(ErrorCode::PeerUnreachable,
                              "Peer " + record->identity.display_name + " has not announced recently");
        }
        return *record;
    }

    // Outcome of every outbound transfer feeds the recent-peers history.
    void record_history(const EngineEvent& event) {
        if (!history_ || event.kind != EventKind::StateChanged || !event.transfer ||
            event.transfer->role != transfer::TransferRole::Sender || !transfer::is_terminal(event.transfer->state)) {
            return;
        }
        const auto& status = *event.transfer;
        try {
            history_->record(status.peer, status.state == transfer::TransferState::Completed);
        } catch (const std::exception& ex) {
            log::StructuredLogger::instance().warning("history.save_failed",
                                                      {{"path", history_->file().string()}, {"error", ex.what()}});
        }
    }

    void start_locked() {
        if (manager_.running()) {
            return;
        }
        manager_.start();
        identity_.port = manager_.listening_port();
        manager_.set_local_identity(identity_);
        log::StructuredLogger::instance().info("engine.started",
                                               {{"device_id", device_id_to_string(identity_.device_id)},
                                                {"name", identity_.display_name},
                                                {"transfer_port", std::to_string(identity_.port)}});
    }

    mutable std::mutex lifecycle_mutex_;
    std::unique_ptr<network::DiscoveryService> discovery_;
};

Engine::Engine(Config config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

Engine::~Engine() = default;
Engine::Engine(Engine&&) noexcept = default;
Engine& Engine::operator=(Engine&&) noexcept = default;

void Engine::start() {
    impl_->start();
}

void Engine::stop() {
    impl_->stop();
}

void Engine::start_discovery() {
    impl_->start_discovery();
}

void Engine::stop_discovery() {
    impl_->stop_discovery();
}

bool Engine::discovery_running() const {
    return impl_->discovery_running();
}

std::vector<PeerRecord> Engine::list_peers() const {
    return impl_->registry_.snapshot();
}

TransferId Engine::send_file(const DeviceId& peer, const std::filesystem::path& path) {
    return impl_->send_file(peer, path);
}

bool Engine::respond_to_offer(TransferId id, bool accept) {
    return impl_->manager_.respond(id, accept);
}

bool Engine::cancel_transfer(TransferId id) {
    return impl_->manager_.cancel(id);
}

Engine::SubscriptionId Engine::subscribe(EventCallback listener) {
    return impl_->bus_.subscribe(std::move(listener));
}

void Engine::unsubscribe(SubscriptionId id) {
    impl_->bus_.unsubscribe(id);
}

std::optional<transfer::TransferStatus> Engine::transfer_status(TransferId id) const {
    return impl_->manager_.status(id);
}

std::vector<transfer::TransferStatus> Engine::transfers() const {
    return impl_->manager_.transfers();
}

std::vector<TransferId> Engine::send_directory(const DeviceId& peer, const std::filesystem::path& directory) {
    return impl_->send_directory(peer, directory);
}

std::vector<RecentPeer> Engine::recent_peers(std::size_t limit) const {
    if (!impl_->history_) {
        return {};
    }
    return impl_->history_->recent(limit);
}

void Engine::clear_recent_peers() {
    if (impl_->history_) {
        impl_->history_->clear();
    }
}

PeerIdentity Engine::identity() const {
    return impl_->identity();
}

std::string Engine::local_address() const {
    return network::detect_local_address();
}

const Config& Engine::config() const noexcept {
    return impl_->config_;
}

}  // namespace lanshare
