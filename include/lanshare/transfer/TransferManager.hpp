#pragma once

#include "lanshare/Config.hpp"
#include "lanshare/Events.hpp"
#include "lanshare/network/Socket.hpp"
#include "lanshare/transfer/TransferSession.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <filesystem>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace lanshare::transfer {

// Owns every transfer session: listens for inbound Offers, dials outbound peers,
// runs one worker thread per connection and enforces the concurrency cap.
class TransferManager {
public:
    TransferManager(Config config, PeerIdentity local, EventCallback events = {});
    ~TransferManager();

    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    // Binds the TCP listener. Throws std::runtime_error on failure.
    void start();
    void stop();
    [[nodiscard]] bool running() const noexcept { return running_.load(); }
    [[nodiscard]] std::uint16_t listening_port() const noexcept { return listener_.port(); }

    // Registers an outbound transfer and returns at once; the checksum is
    // computed by the worker. Throws EngineError(IOFailure) when the path is
    // not a regular file or its size cannot be read.
    TransferId send_file(const PeerIdentity& peer, const std::filesystem::path& path);

    // Queues one transfer per regular file below `directory`, in path order.
    // Each file is offered as "<directory name>/<relative path>". Throws
    // EngineError(IOFailure) when nothing can be sent.
    std::vector<TransferId> send_directory(const PeerIdentity& peer, const std::filesystem::path& directory);

    bool respond(TransferId id, bool accept);
    bool cancel(TransferId id);

    [[nodiscard]] std::optional<TransferStatus> status(TransferId id) const;
    [[nodiscard]] std::vector<TransferStatus> transfers() const;
    [[nodiscard]] std::size_t active_slots() const;

    void set_local_identity(PeerIdentity local);

private:
    enum class Command {
        Accept,
        Reject,
        Cancel
    };

    struct Worker {
        std::thread thread;
        std::atomic<bool> done{false};
    };

    struct Entry {
        TransferRole role{TransferRole::Sender};
        TransferId id{0};
        std::unique_ptr<TransferSession> session;
        network::TcpConnection connection;
        PeerIdentity peer;

        std::mutex commands_mutex;
        std::deque<Command> commands;
        // Set with a queued Cancel so blocking work can stop early.
        std::atomic<bool> cancel_requested{false};

        bool holds_slot{false};
        bool queued{false};
        bool worker_started{false};
        std::optional<Clock::time_point> terminal_since{};
    };

    using Key = std::pair<TransferRole, TransferId>;

    TransferId enqueue_outbound(const PeerIdentity& peer,
                                const std::filesystem::path& path,
                                const std::string& offered_name);

    void accept_loop();
    void housekeeping(Clock::time_point now);
    void dispatch_queued();

    void inbound_worker(network::TcpConnection connection);
    void outbound_worker(std::shared_ptr<Entry> entry);
    void run_session(Entry& entry);
    bool process_incoming(Entry& entry);

    void start_worker(std::function<void()> body);
    void post(Entry& entry, Command command);
    std::shared_ptr<Entry> find_entry(TransferId id, std::optional<TransferRole> role) const;

    TransferSession::FrameSink make_sink(Entry& entry);
    TransferSession::StatusCallback make_callback(Entry& entry);
    void on_status(Entry& entry, const TransferStatus& status, TransferSession::Update update);
    void publish(EventKind kind, const TransferStatus& status) const;
    void refuse(network::TcpConnection& connection, TransferId id, ErrorCode reason, const std::string& detail);

    TransferSession::Options session_options() const;
    TransferId next_transfer_id();

    Config config_;
    EventCallback events_;

    mutable std::mutex mutex_;
    PeerIdentity local_;
    std::map<Key, std::shared_ptr<Entry>> entries_;
    std::deque<std::shared_ptr<Entry>> queue_;
    std::size_t active_slots_{0};
    bool stopping_{false};

    std::mutex workers_mutex_;
    std::list<std::shared_ptr<Worker>> workers_;

    network::TcpListener listener_;
    std::atomic<bool> running_{false};
    std::thread accept_thread_;

    std::uint64_t id_prefix_{0};
    std::atomic<std::uint32_t> id_counter_{0};
};

}  // namespace lanshare::transfer
