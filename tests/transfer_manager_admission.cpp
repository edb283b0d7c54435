#include "lanshare/log/StructuredLogger.hpp"
#include "lanshare/network/Socket.hpp"
#include "lanshare/protocol/Message.hpp"
#include "lanshare/transfer/TransferManager.hpp"

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace {

using namespace lanshare;
using namespace std::chrono_literals;
using transfer::TransferState;

struct Recorder {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<EngineEvent> events;

    void push(const EngineEvent& event) {
        {
            std::scoped_lock lock(mutex);
            events.push_back(event);
        }
        cv.notify_all();
    }

    std::optional<transfer::TransferStatus> wait_for(EventKind kind,
                                                     TransferId id,
                                                     std::optional<TransferState> state,
                                                     std::chrono::milliseconds timeout = 10s) {
        std::optional<transfer::TransferStatus> found;
        std::unique_lock lock(mutex);
        cv.wait_for(lock, timeout, [&] {
            for (const auto& event : events) {
                if (event.kind == kind && event.transfer && event.transfer->transfer_id == id &&
                    (!state || event.transfer->state == *state)) {
                    found = event.transfer;
                    return true;
                }
            }
            return false;
        });
        return found;
    }

    std::vector<TransferId> offers() {
        std::scoped_lock lock(mutex);
        std::vector<TransferId> ids;
        for (const auto& event : events) {
            if (event.kind == EventKind::OfferReceived) {
                ids.push_back(event.transfer->transfer_id);
            }
        }
        return ids;
    }
};

class TempDir {
public:
    explicit TempDir(const std::string& name) {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() / (name + "_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

Config loopback_config(const std::filesystem::path& downloads) {
    Config config{};
    config.transfer_host = "127.0.0.1";
    config.transfer_port = 0;
    config.download_directory = downloads.string();
    config.connect_timeout = 2s;
    return config;
}

PeerIdentity identity(std::uint8_t fill, const std::string& name, std::uint16_t port = 0) {
    PeerIdentity peer{};
    peer.device_id.fill(fill);
    peer.display_name = name;
    peer.address = "127.0.0.1";
    peer.port = port;
    return peer;
}

void write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary);
    out << text;
}

// Large file without large disk usage.
void write_sparse(const std::filesystem::path& path, std::uintmax_t size) {
    { std::ofstream out(path, std::ios::binary); }
    std::filesystem::resize_file(path, size);
}

protocol::ControlMessage read_frame(network::TcpConnection& connection) {
    std::vector<std::uint8_t> frame;
    const auto status = connection.receive_frame(frame, protocol::kMaxControlFrameBytes);
    assert(status == network::TcpConnection::ReadStatus::Ok);
    const auto message = protocol::decode(frame);
    assert(message);
    return *message;
}

void test_outbound_queue_is_fifo() {
    TempDir outbox("lanshare_admission_outbox");
    TempDir inbox("lanshare_admission_inbox");
    write_text(outbox.path() / "a.txt", "alpha");
    write_text(outbox.path() / "b.txt", "bravo");
    write_text(outbox.path() / "c.txt", "charlie");

    auto receiver_config = loopback_config(inbox.path());
    receiver_config.auto_accept = false;
    Recorder receiver_events;
    transfer::TransferManager receiver(receiver_config, identity(0x21, "receiver"),
                                       [&](const EngineEvent& event) { receiver_events.push(event); });
    receiver.start();

    auto sender_config = loopback_config(outbox.path());
    sender_config.max_concurrent_transfers = 1;
    Recorder sender_events;
    transfer::TransferManager sender(sender_config, identity(0x12, "sender"),
                                     [&](const EngineEvent& event) { sender_events.push(event); });
    sender.start();

    const auto peer = identity(0x21, "receiver", receiver.listening_port());
    const std::vector<TransferId> ids{sender.send_file(peer, outbox.path() / "a.txt"),
                                      sender.send_file(peer, outbox.path() / "b.txt"),
                                      sender.send_file(peer, outbox.path() / "c.txt")};

    // Over the cap the extra sends wait in line instead of failing.
    assert(sender.active_slots() == 1);
    assert(sender.transfers().size() == 3);
    assert(sender.status(ids[1])->state == TransferState::Proposed);
    assert(sender.status(ids[2])->state == TransferState::Proposed);

    for (std::size_t i = 0; i < ids.size(); ++i) {
        assert(receiver_events.wait_for(EventKind::OfferReceived, ids[i], std::nullopt));
        std::this_thread::sleep_for(300ms);
        // Only the transfer holding the slot has reached the peer.
        assert(receiver_events.offers().size() == i + 1);
        assert(receiver.respond(ids[i], true));
        const auto done = sender_events.wait_for(EventKind::StateChanged, ids[i], TransferState::Completed);
        assert(done);
    }

    assert(receiver_events.offers() == ids);
    assert(sender.active_slots() == 0);

    std::ifstream c(inbox.path() / "c.txt");
    std::string text;
    std::getline(c, text);
    assert(text == "charlie");

    sender.stop();
    receiver.stop();
}

void test_silent_connection_times_out() {
    TempDir inbox("lanshare_admission_silent");
    auto config = loopback_config(inbox.path());
    config.handshake_timeout = 1s;
    transfer::TransferManager receiver(config, identity(0x31, "receiver"));
    receiver.start();

    auto idle = network::TcpConnection::connect("127.0.0.1", receiver.listening_port(), 2s);
    assert(idle);
    idle->set_recv_timeout(5s);

    const auto started = std::chrono::steady_clock::now();
    std::vector<std::uint8_t> frame;
    const auto read = idle->receive_frame(frame, protocol::kMaxControlFrameBytes);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    // The manager hangs up once the handshake window passes without an Offer.
    assert(read == network::TcpConnection::ReadStatus::Closed || read == network::TcpConnection::ReadStatus::Error);
    assert(elapsed >= 900ms);
    assert(elapsed < 4s);
    assert(receiver.transfers().empty());
    assert(receiver.active_slots() == 0);

    receiver.stop();
}

void test_unreachable_peer() {
    TempDir outbox("lanshare_admission_unreachable");
    write_text(outbox.path() / "note.txt", "nobody home");

    // A port that was just released has no listener behind it.
    std::uint16_t closed_port = 0;
    {
        network::TcpListener scratch;
        scratch.listen("127.0.0.1", 0);
        closed_port = scratch.port();
    }

    Recorder events;
    transfer::TransferManager sender(loopback_config(outbox.path()), identity(0x41, "sender"),
                                     [&](const EngineEvent& event) { events.push(event); });
    sender.start();

    const auto id = sender.send_file(identity(0x42, "gone", closed_port), outbox.path() / "note.txt");
    const auto aborted = events.wait_for(EventKind::StateChanged, id, TransferState::Aborted);
    assert(aborted);
    assert(aborted->error == ErrorCode::PeerUnreachable);
    assert(sender.active_slots() == 0);

    sender.stop();
}

void test_send_file_defers_hashing() {
    TempDir outbox("lanshare_admission_hashing");
    const auto big = outbox.path() / "disk.img";
    write_sparse(big, std::uintmax_t{1} << 30);

    Recorder events;
    transfer::TransferManager sender(loopback_config(outbox.path()), identity(0x51, "sender"),
                                     [&](const EngineEvent& event) { events.push(event); });
    sender.start();

    const auto started = std::chrono::steady_clock::now();
    const auto id = sender.send_file(identity(0x52, "peer", 9), big);
    assert(std::chrono::steady_clock::now() - started < 500ms);
    assert(sender.status(id)->state == TransferState::Proposed);

    // Cancelling stops the checksum pass instead of waiting for it.
    assert(sender.cancel(id));
    const auto aborted = events.wait_for(EventKind::StateChanged, id, TransferState::Aborted, 3s);
    assert(aborted);
    assert(aborted->error == ErrorCode::Cancelled);

    // Missing files are still refused up front.
    bool refused = false;
    try {
        sender.send_file(identity(0x52, "peer", 9), outbox.path() / "missing.bin");
    } catch (const EngineError& error) {
        refused = error.code() == ErrorCode::IOFailure;
    }
    assert(refused);

    sender.stop();
}

// Accepts one offer on a raw socket and then never reads again.
struct StalledReceiver {
    network::TcpListener listener;
    std::optional<network::TcpConnection> connection;

    StalledReceiver() { listener.listen("127.0.0.1", 0); }

    void accept_offer() {
        connection = listener.accept(10s);
        assert(connection);
        connection->set_recv_timeout(10s);
        const auto offer = read_frame(*connection);
        assert(offer.type() == protocol::MessageType::Offer);

        protocol::ControlMessage reply{};
        reply.transfer_id = offer.transfer_id;
        reply.payload = protocol::AcceptPayload{};
        assert(connection->send_frame(protocol::encode(reply)));
    }
};

void test_stalled_send_honours_cancel() {
    TempDir outbox("lanshare_admission_stall_cancel");
    const auto big = outbox.path() / "stream.bin";
    write_sparse(big, std::uintmax_t{256} << 20);

    auto config = loopback_config(outbox.path());
    config.checksum_algorithm = "crc32";
    config.idle_timeout = 30s;
    Recorder events;
    transfer::TransferManager sender(config, identity(0x61, "sender"),
                                     [&](const EngineEvent& event) { events.push(event); });
    sender.start();

    StalledReceiver peer;
    const auto id = sender.send_file(identity(0x62, "stalled", peer.listener.port()), big);
    peer.accept_offer();
    assert(events.wait_for(EventKind::StateChanged, id, TransferState::InProgress));

    // Give the socket buffers time to fill so the sender blocks in a write.
    std::this_thread::sleep_for(1s);
    const auto started = std::chrono::steady_clock::now();
    assert(sender.cancel(id));
    const auto aborted = events.wait_for(EventKind::StateChanged, id, TransferState::Aborted, 5s);
    assert(aborted);
    assert(aborted->error == ErrorCode::Cancelled);
    assert(std::chrono::steady_clock::now() - started < 3s);

    sender.stop();
}

void test_stalled_send_times_out() {
    TempDir outbox("lanshare_admission_stall_timeout");
    const auto big = outbox.path() / "stream.bin";
    write_sparse(big, std::uintmax_t{256} << 20);

    auto config = loopback_config(outbox.path());
    config.checksum_algorithm = "crc32";
    config.idle_timeout = 1s;
    Recorder events;
    transfer::TransferManager sender(config, identity(0x71, "sender"),
                                     [&](const EngineEvent& event) { events.push(event); });
    sender.start();

    StalledReceiver peer;
    const auto id = sender.send_file(identity(0x72, "stalled", peer.listener.port()), big);
    peer.accept_offer();

    const auto aborted = events.wait_for(EventKind::StateChanged, id, TransferState::Aborted, 10s);
    assert(aborted);
    assert(aborted->error == ErrorCode::Timeout);

    sender.stop();
}

}  // namespace

int main() {
    log::StructuredLogger::instance().set_enabled(false);

    test_outbound_queue_is_fifo();
    test_silent_connection_times_out();
    test_unreachable_peer();
    test_send_file_defers_hashing();
    test_stalled_send_honours_cancel();
    test_stalled_send_times_out();
    return 0;
}
