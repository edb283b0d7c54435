#include "lanshare/Engine.hpp"
#include "lanshare/log/StructuredLogger.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace lanshare;
using namespace std::chrono_literals;

constexpr std::uint16_t kDiscoveryA = 47920;
constexpr std::uint16_t kDiscoveryB = 47921;

Config make_config(const std::string& name,
                   std::uint16_t own_port,
                   std::uint16_t peer_port,
                   const std::filesystem::path& downloads) {
    Config config{};
    config.display_name = name;
    config.identity_path.clear();
    config.discovery_port = own_port;
    config.announce_interval = 1s;
    config.stale_after = 10s;
    config.discovery_targets = {Config::DiscoveryTarget{"127.0.0.1", peer_port}};
    config.transfer_host = "127.0.0.1";
    config.transfer_port = 0;
    config.chunk_size = 16 * 1024;
    config.ack_every_chunks = 4;
    config.auto_accept = true;
    config.download_directory = downloads.string();
    return config;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

struct Outcome {
    std::mutex mutex;
    std::condition_variable cv;
    std::map<TransferId, transfer::TransferStatus> finished;

    bool wait_all(const std::vector<TransferId>& ids) {
        std::unique_lock lock(mutex);
        return cv.wait_for(lock, 20s, [&] {
            for (const auto id : ids) {
                if (finished.count(id) == 0) {
                    return false;
                }
            }
            return true;
        });
    }
};

void write_text(const std::filesystem::path& path, const std::string& text) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << text;
}

}  // namespace

int main() {
    log::StructuredLogger::instance().set_enabled(false);

    const auto root = std::filesystem::temp_directory_path() / "lanshare_engine_loopback";
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    std::filesystem::create_directories(root / "outbox");
    std::filesystem::create_directories(root / "inbox_a");
    std::filesystem::create_directories(root / "inbox_b");

    const auto source = root / "outbox" / "report.bin";
    std::string contents;
    for (int i = 0; i < 100000; ++i) {
        contents.push_back(static_cast<char>((i * 31 + 7) & 0xFF));
    }
    {
        std::ofstream out(source, std::ios::binary);
        out << contents;
    }

    auto sender_config = make_config("Sender", kDiscoveryA, kDiscoveryB, root / "inbox_a");
    sender_config.recent_peers_path = (root / "state" / "recent_peers.json").string();
    Engine sender(sender_config);
    Engine receiver(make_config("Receiver", kDiscoveryB, kDiscoveryA, root / "inbox_b"));
    assert(sender.identity().device_id != receiver.identity().device_id);

    Outcome outcome;
    sender.subscribe([&](const EngineEvent& event) {
        if (event.kind != EventKind::StateChanged || !event.transfer) {
            return;
        }
        if (!transfer::is_terminal(event.transfer->state)) {
            return;
        }
        {
            std::scoped_lock lock(outcome.mutex);
            outcome.finished[event.transfer->transfer_id] = *event.transfer;
        }
        outcome.cv.notify_all();
    });

    // identity() may be read while another thread starts the engine.
    std::atomic<bool> starting{true};
    std::vector<std::uint16_t> observed_ports;
    std::thread reader([&] {
        while (starting) {
            observed_ports.push_back(receiver.identity().port);
            std::this_thread::yield();
        }
    });
    receiver.start_discovery();
    starting = false;
    reader.join();
    for (const auto port : observed_ports) {
        assert(port == 0 || port == receiver.identity().port);
    }

    sender.start_discovery();
    assert(sender.discovery_running());
    assert(receiver.identity().port != 0);

    std::optional<PeerRecord> target;
    const auto deadline = std::chrono::steady_clock::now() + 10s;
    while (!target && std::chrono::steady_clock::now() < deadline) {
        for (const auto& peer : sender.list_peers()) {
            if (peer.identity.device_id == receiver.identity().device_id) {
                target = peer;
            }
        }
        if (!target) {
            std::this_thread::sleep_for(100ms);
        }
    }
    assert(target);
    assert(target->identity.display_name == "Receiver");
    assert(target->identity.port == receiver.identity().port);

    const auto id = sender.send_file(target->identity.device_id, source);
    assert(outcome.wait_all({id}));
    {
        std::scoped_lock lock(outcome.mutex);
        const auto& status = outcome.finished.at(id);
        assert(status.state == transfer::TransferState::Completed);
        assert(status.bytes_transferred == contents.size());
    }

    // The receiver finalizes before the sender sees Complete, so the file is in place.
    const auto delivered = root / "inbox_b" / "report.bin";
    assert(std::filesystem::exists(delivered));
    assert(read_file(delivered) == contents);
    assert(!std::filesystem::exists(root / "inbox_b" / "report.bin.part"));

    bool unknown_rejected = false;
    try {
        DeviceId nobody{};
        nobody.fill(0xEE);
        sender.send_file(nobody, source);
    } catch (const EngineError& error) {
        unknown_rejected = error.code() == ErrorCode::PeerUnreachable;
    }
    assert(unknown_rejected);

    // The completed send is remembered, also across a reload of the history file.
    const auto recent = sender.recent_peers();
    assert(recent.size() == 1);
    assert(recent.front().device_id == receiver.identity().device_id);
    assert(recent.front().display_name == "Receiver");
    assert(recent.front().success_count == 1 && recent.front().total_attempts == 1);
    RecentPeers reloaded(sender_config.recent_peers_path, 10);
    reloaded.load();
    assert(reloaded.recent().size() == 1);
    assert(receiver.recent_peers().empty());

    // A folder fans out into one transfer per file, keeping its layout.
    write_text(root / "outbox" / "album" / "a.txt", "first file");
    write_text(root / "outbox" / "album" / "sub" / "b.txt", "second file");
    const auto folder_ids = sender.send_directory(target->identity.device_id, root / "outbox" / "album");
    assert(folder_ids.size() == 2);
    assert(outcome.wait_all(folder_ids));
    {
        std::scoped_lock lock(outcome.mutex);
        for (const auto folder_id : folder_ids) {
            assert(outcome.finished.at(folder_id).state == transfer::TransferState::Completed);
        }
    }
    assert(read_file(root / "inbox_b" / "album" / "a.txt") == "first file");
    assert(read_file(root / "inbox_b" / "album" / "sub" / "b.txt") == "second file");
    assert(sender.recent_peers().front().success_count == 3);

    sender.clear_recent_peers();
    assert(sender.recent_peers().empty());

    sender.stop();
    receiver.stop();
    assert(!sender.discovery_running());
    std::filesystem::remove_all(root, ec);
    return 0;
}
