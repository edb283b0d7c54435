#pragma once

#include "lanshare/Config.hpp"
#include "lanshare/Error.hpp"
#include "lanshare/Events.hpp"
#include "lanshare/Export.hpp"
#include "lanshare/Types.hpp"
#include "lanshare/core/RecentPeers.hpp"
#include "lanshare/transfer/TransferTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lanshare {

// Public entry point used by the GUI and the CLI. No call blocks on the network;
// outcomes of asynchronous work arrive as EngineEvents.
class LANSHARE_API Engine {
public:
    using SubscriptionId = std::uint64_t;

    explicit Engine(Config config = {});
    ~Engine();

    Engine(Engine&&) noexcept;
    Engine& operator=(Engine&&) noexcept;
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Binds the transfer listener. Throws std::runtime_error if the port is taken.
    void start();
    void stop();

    void start_discovery();
    void stop_discovery();
    [[nodiscard]] bool discovery_running() const;

    [[nodiscard]] std::vector<PeerRecord> list_peers() const;

    // Throws EngineError: PeerUnreachable for an unknown or stale peer, IOFailure for an unreadable file.
    TransferId send_file(const DeviceId& peer, const std::filesystem::path& path);
    // One queued transfer per file below the directory. Same errors as send_file.
    std::vector<TransferId> send_directory(const DeviceId& peer, const std::filesystem::path& directory);

    bool respond_to_offer(TransferId id, bool accept);
    bool cancel_transfer(TransferId id);

    SubscriptionId subscribe(EventCallback listener);
    void unsubscribe(SubscriptionId id);

    [[nodiscard]] std::optional<transfer::TransferStatus> transfer_status(TransferId id) const;
    [[nodiscard]] std::vector<transfer::TransferStatus> transfers() const;

    // Peers this device sent to, most recent first. Empty when the history is disabled.
    [[nodiscard]] std::vector<RecentPeer> recent_peers(std::size_t limit = 0) const;
    void clear_recent_peers();

    [[nodiscard]] PeerIdentity identity() const;
    [[nodiscard]] std::string local_address() const;
    [[nodiscard]] const Config& config() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace lanshare
