#include "lanshare/crypto/Checksum.hpp"
#include "lanshare/log/StructuredLogger.hpp"
#include "lanshare/transfer/TransferSession.hpp"

#include <cassert>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

namespace {

using namespace lanshare;
using namespace lanshare::transfer;
using namespace std::chrono_literals;

struct Frame {
    protocol::ControlMessage message;
    std::vector<std::uint8_t> payload;
};

// Frames queued for one side; delivered explicitly so neither session is re-entered.
struct Wire {
    std::deque<Frame> frames;

    TransferSession::FrameSink sink() {
        return [this](const protocol::ControlMessage& message, std::span<const std::uint8_t> payload) {
            frames.push_back(Frame{message, std::vector<std::uint8_t>(payload.begin(), payload.end())});
            return true;
        };
    }

    void deliver(TransferSession& session, Clock::time_point now) {
        while (!frames.empty()) {
            auto frame = std::move(frames.front());
            frames.pop_front();
            if (frame.message.type() == protocol::MessageType::ChunkHeader) {
                session.handle_chunk(std::get<protocol::ChunkHeaderPayload>(frame.message.payload), frame.payload, now);
            } else {
                session.handle(frame.message, now);
            }
        }
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

std::vector<std::uint8_t> make_content(std::size_t size) {
    std::vector<std::uint8_t> data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::uint8_t>((i * 31 + 7) & 0xFF);
    }
    return data;
}

void write_file(const std::filesystem::path& path, const std::vector<std::uint8_t>& data) {
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::size_t file_count(const std::filesystem::path& directory) {
    std::size_t count = 0;
    for ([[maybe_unused]] const auto& entry : std::filesystem::directory_iterator(directory)) {
        ++count;
    }
    return count;
}

TransferRequest make_request(const std::vector<std::uint8_t>& content, std::uint32_t chunk_size, std::string name) {
    TransferRequest request{};
    request.transfer_id = 0xABCDEF0012345678ull;
    request.file_name = std::move(name);
    request.file_size = content.size();
    request.checksum_algorithm = crypto::ChecksumAlgorithm::Sha256;
    const auto digest = crypto::Sha256::digest(content);
    request.checksum.assign(digest.begin(), digest.end());
    request.chunk_size = chunk_size;
    request.sender.device_id.fill(0x01);
    request.sender.display_name = "sender";
    request.receiver.device_id.fill(0x02);
    request.receiver.display_name = "receiver";
    return request;
}

TransferSession::Options options(std::uint32_t ack_every = 8) {
    TransferSession::Options opts{};
    opts.ack_every_chunks = ack_every;
    opts.idle_timeout = 30s;
    return opts;
}

protocol::ChunkHeaderPayload header(std::uint64_t sequence, std::uint32_t length, bool is_final) {
    protocol::ChunkHeaderPayload chunk{};
    chunk.sequence = sequence;
    chunk.payload_length = length;
    chunk.is_final = is_final;
    return chunk;
}

bool contains_abort(const Wire& wire, ErrorCode reason) {
    for (const auto& frame : wire.frames) {
        if (frame.message.type() == protocol::MessageType::Abort &&
            std::get<protocol::AbortPayload>(frame.message.payload).reason == reason) {
            return true;
        }
    }
    return false;
}

void test_happy_path() {
    TempDir source_dir("lanshare_session_src");
    TempDir download_dir("lanshare_session_dst");
    const auto content = make_content(300 * 1024 + 17);
    const auto source = source_dir.path() / "report.bin";
    write_file(source, content);

    const auto request = make_request(content, 64 * 1024, "report.bin");
    Wire to_receiver;
    Wire to_sender;
    std::vector<TransferState> sender_states;
    std::vector<std::uint64_t> receiver_progress;

    auto sender = TransferSession::create_sender(
        request, source, options(2), to_receiver.sink(),
        [&](const TransferStatus& status, TransferSession::Update update) {
            if (update == TransferSession::Update::StateChanged) {
                sender_states.push_back(status.state);
            }
        });
    auto receiver = TransferSession::create_receiver(
        request, download_dir.path(), options(2), to_sender.sink(),
        [&](const TransferStatus& status, TransferSession::Update update) {
            if (update == TransferSession::Update::Progress) {
                receiver_progress.push_back(status.bytes_transferred);
            }
        });

    const auto now = Clock::now();
    assert(sender->send_offer(now));
    assert(to_receiver.frames.size() == 1);
    assert(to_receiver.frames.front().message.type() == protocol::MessageType::Offer);
    to_receiver.frames.clear();
    assert(sender->state() == TransferState::Proposed);

    receiver->accept(now);
    assert(receiver->state() == TransferState::InProgress);
    to_sender.deliver(*sender, now);
    assert(sender->state() == TransferState::InProgress);

    while (sender->send_next_chunk(now)) {
    }
    assert(sender->all_chunks_sent());
    assert(to_receiver.frames.size() == 5);

    to_receiver.deliver(*receiver, now);
    assert(receiver->state() == TransferState::Completed);
    assert(receiver->status().bytes_transferred == content.size());
    assert(!receiver_progress.empty());
    assert(receiver_progress.back() == content.size());

    to_sender.deliver(*sender, now);
    assert(sender->state() == TransferState::Completed);
    assert(sender->status().bytes_transferred == content.size());
    assert((sender_states == std::vector<TransferState>{TransferState::Accepted, TransferState::InProgress,
                                                        TransferState::Completed}));

    const auto saved = download_dir.path() / "report.bin";
    assert(receiver->status().local_path == saved.string());
    assert(read_file(saved) == content);
    assert(file_count(download_dir.path()) == 1);
}

void test_sequence_gap() {
    TempDir download_dir("lanshare_session_gap");
    const auto content = make_content(16);
    Wire to_sender;
    auto receiver = TransferSession::create_receiver(make_request(content, 4, "gap.bin"), download_dir.path(),
                                                     options(), to_sender.sink());
    const auto now = Clock::now();
    receiver->accept(now);
    to_sender.frames.clear();

    const std::span<const std::uint8_t> bytes(content);
    receiver->handle_chunk(header(0, 4, false), bytes.subspan(0, 4), now);
    receiver->handle_chunk(header(1, 4, false), bytes.subspan(4, 4), now);
    assert(receiver->status().bytes_transferred == 8);

    receiver->handle_chunk(header(3, 4, true), bytes.subspan(12, 4), now);
    const auto status = receiver->status();
    assert(status.state == TransferState::Aborted);
    assert(status.error == ErrorCode::SequencingError);
    assert(status.bytes_transferred == 8);
    assert(contains_abort(to_sender, ErrorCode::SequencingError));
    assert(file_count(download_dir.path()) == 0);
}

void test_checksum_mismatch() {
    TempDir download_dir("lanshare_session_mismatch");
    const auto content = make_content(10);
    auto request = make_request(content, 4, "bad.bin");
    request.checksum[0] ^= 0xFF;

    Wire to_sender;
    auto receiver = TransferSession::create_receiver(request, download_dir.path(), options(), to_sender.sink());
    const auto now = Clock::now();
    receiver->accept(now);

    const std::span<const std::uint8_t> bytes(content);
    receiver->handle_chunk(header(0, 4, false), bytes.subspan(0, 4), now);
    receiver->handle_chunk(header(1, 4, false), bytes.subspan(4, 4), now);
    receiver->handle_chunk(header(2, 2, true), bytes.subspan(8, 2), now);

    assert(receiver->state() == TransferState::Aborted);
    assert(receiver->status().error == ErrorCode::ChecksumMismatch);
    assert(contains_abort(to_sender, ErrorCode::ChecksumMismatch));
    assert(!std::filesystem::exists(download_dir.path() / "bad.bin"));
    assert(file_count(download_dir.path()) == 0);
}

void test_idle_timeout() {
    TempDir download_dir("lanshare_session_idle");
    const auto content = make_content(8);
    Wire to_sender;
    auto receiver = TransferSession::create_receiver(make_request(content, 4, "idle.bin"), download_dir.path(),
                                                     options(), to_sender.sink());
    const auto now = Clock::now();
    receiver->accept(now);

    receiver->check_idle(now + 10s);
    assert(receiver->state() == TransferState::InProgress);
    receiver->check_idle(now + 31s);
    assert(receiver->state() == TransferState::Aborted);
    assert(receiver->status().error == ErrorCode::Timeout);
    assert(contains_abort(to_sender, ErrorCode::Timeout));
    assert(file_count(download_dir.path()) == 0);
}

void test_cancel_from_proposed() {
    TempDir source_dir("lanshare_session_cancel");
    const auto content = make_content(100);
    const auto source = source_dir.path() / "cancel.bin";
    write_file(source, content);

    Wire to_receiver;
    int state_changes = 0;
    auto sender = TransferSession::create_sender(make_request(content, 64, "cancel.bin"), source, options(),
                                                 to_receiver.sink(),
                                                 [&](const TransferStatus&, TransferSession::Update update) {
                                                     if (update == TransferSession::Update::StateChanged) {
                                                         ++state_changes;
                                                     }
                                                 });
    const auto now = Clock::now();
    assert(sender->send_offer(now));
    sender->abort(ErrorCode::Cancelled, true, now);
    assert(sender->state() == TransferState::Aborted);
    assert(sender->status().error == ErrorCode::Cancelled);
    assert(contains_abort(to_receiver, ErrorCode::Cancelled));

    // Idempotent: no second transition, no second Abort frame.
    const auto frames = to_receiver.frames.size();
    sender->abort(ErrorCode::Timeout, true, now);
    assert(sender->status().error == ErrorCode::Cancelled);
    assert(to_receiver.frames.size() == frames);
    assert(state_changes == 1);

    // Late frames for a terminal session are ignored.
    protocol::ControlMessage accept{};
    accept.transfer_id = sender->id();
    accept.payload = protocol::AcceptPayload{};
    sender->handle(accept, now);
    assert(sender->state() == TransferState::Aborted);

    // A receiver can decline before accepting.
    TempDir download_dir("lanshare_session_decline");
    Wire to_sender;
    auto receiver = TransferSession::create_receiver(make_request(content, 64, "cancel.bin"), download_dir.path(),
                                                     options(), to_sender.sink());
    receiver->reject(ErrorCode::Declined, now);
    assert(receiver->state() == TransferState::Rejected);
    assert(to_sender.frames.size() == 1);
    assert(to_sender.frames.front().message.type() == protocol::MessageType::Reject);
}

void test_sender_chunking() {
    TempDir source_dir("lanshare_session_chunking");
    const auto now = Clock::now();

    // 10 bytes in 4-byte chunks: 4, 4, 2 with only the last marked final.
    const auto content = make_content(10);
    const auto source = source_dir.path() / "ten.bin";
    write_file(source, content);
    Wire to_receiver;
    auto sender = TransferSession::create_sender(make_request(content, 4, "ten.bin"), source, options(),
                                                 to_receiver.sink());
    assert(sender->send_offer(now));
    to_receiver.frames.clear();
    protocol::ControlMessage accept{};
    accept.transfer_id = sender->id();
    accept.payload = protocol::AcceptPayload{};
    sender->handle(accept, now);
    assert(sender->state() == TransferState::InProgress);
    while (sender->send_next_chunk(now)) {
    }
    assert(to_receiver.frames.size() == 3);
    const std::uint32_t expected_lengths[] = {4, 4, 2};
    std::vector<std::uint8_t> reassembled;
    for (std::size_t i = 0; i < 3; ++i) {
        const auto& frame = to_receiver.frames[i];
        const auto chunk = std::get<protocol::ChunkHeaderPayload>(frame.message.payload);
        assert(chunk.sequence == i);
        assert(chunk.payload_length == expected_lengths[i]);
        assert(chunk.is_final == (i == 2));
        assert(frame.payload.size() == expected_lengths[i]);
        reassembled.insert(reassembled.end(), frame.payload.begin(), frame.payload.end());
    }
    assert(reassembled == content);
    assert(!sender->send_next_chunk(now));

    // An empty file still sends one final, empty chunk.
    const std::vector<std::uint8_t> empty;
    const auto empty_source = source_dir.path() / "empty.bin";
    write_file(empty_source, empty);
    Wire empty_wire;
    auto empty_sender = TransferSession::create_sender(make_request(empty, 4, "empty.bin"), empty_source, options(),
                                                       empty_wire.sink());
    assert(empty_sender->send_offer(now));
    empty_wire.frames.clear();
    accept.transfer_id = empty_sender->id();
    empty_sender->handle(accept, now);
    assert(!empty_sender->send_next_chunk(now));
    assert(empty_wire.frames.size() == 1);
    const auto only = std::get<protocol::ChunkHeaderPayload>(empty_wire.frames.front().message.payload);
    assert(only.sequence == 0 && only.payload_length == 0 && only.is_final);
}

void test_file_names() {
    assert(TransferSession::sanitize_file_name("../../etc/passwd") == "passwd");
    assert(TransferSession::sanitize_file_name("C:\\Users\\me\\notes.txt") == "notes.txt");
    assert(TransferSession::sanitize_file_name("a:b?.txt") == "a_b_.txt");
    assert(TransferSession::sanitize_file_name("..") == "received_file");
    assert(TransferSession::sanitize_file_name("") == "received_file");

    TempDir directory("lanshare_session_names");
    assert(TransferSession::unique_destination(directory.path(), "photo.jpg") == directory.path() / "photo.jpg");
    write_file(directory.path() / "photo.jpg", make_content(1));
    assert(TransferSession::unique_destination(directory.path(), "photo.jpg") == directory.path() / "photo (1).jpg");
    write_file(directory.path() / "photo (1).jpg.part", make_content(1));
    assert(TransferSession::unique_destination(directory.path(), "photo.jpg") == directory.path() / "photo (2).jpg");

    assert(TransferSession::sanitize_relative_path("album/2024/photo.jpg") ==
           std::filesystem::path("album") / "2024" / "photo.jpg");
    assert(TransferSession::sanitize_relative_path("../../etc/passwd") == std::filesystem::path("etc") / "passwd");
    assert(TransferSession::sanitize_relative_path("/abs//./x:y.txt") == std::filesystem::path("abs") / "x_y.txt");
    assert(TransferSession::sanitize_relative_path("docs\\notes.txt") == std::filesystem::path("docs") / "notes.txt");
    assert(TransferSession::sanitize_relative_path("../..") == "received_file");
}

void test_reserve_destination() {
    TempDir directory("lanshare_session_reserve");

    // Each reservation leaves a partial file behind, so the next one moves on.
    const auto first = TransferSession::reserve_destination(directory.path(), "clip.mp4");
    const auto second = TransferSession::reserve_destination(directory.path(), "clip.mp4");
    assert(first && second);
    assert(*first == directory.path() / "clip.mp4");
    assert(*second == directory.path() / "clip (1).mp4");
    assert(std::filesystem::exists(directory.path() / "clip.mp4.part"));
    assert(std::filesystem::exists(directory.path() / "clip (1).mp4.part"));

    // Parent directories of a relative path are created.
    const auto nested = TransferSession::reserve_destination(directory.path(), std::filesystem::path("a") / "b" / "c.txt");
    assert(nested && *nested == directory.path() / "a" / "b" / "c.txt");

    // Concurrent reservations of one name never share a destination.
    constexpr int kThreads = 8;
    std::vector<std::filesystem::path> results(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            const auto reserved = TransferSession::reserve_destination(directory.path(), "race.bin");
            assert(reserved);
            results[static_cast<std::size_t>(i)] = *reserved;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    const std::set<std::filesystem::path> distinct(results.begin(), results.end());
    assert(distinct.size() == static_cast<std::size_t>(kThreads));
}

void test_receive_into_subdirectory() {
    TempDir source_dir("lanshare_session_tree_src");
    TempDir download_dir("lanshare_session_tree_dst");
    const auto content = make_content(5000);
    const auto source = source_dir.path() / "photo.jpg";
    write_file(source, content);

    const auto request = make_request(content, 1024, "album/../2024/photo.jpg");
    Wire to_receiver;
    Wire to_sender;
    auto sender = TransferSession::create_sender(request, source, options(), to_receiver.sink());
    auto receiver = TransferSession::create_receiver(request, download_dir.path(), options(), to_sender.sink());

    const auto now = Clock::now();
    assert(sender->send_offer(now));
    to_receiver.frames.clear();
    receiver->accept(now);
    to_sender.deliver(*sender, now);
    while (sender->send_next_chunk(now)) {
    }
    to_receiver.deliver(*receiver, now);
    to_sender.deliver(*sender, now);

    assert(receiver->state() == TransferState::Completed);
    assert(sender->state() == TransferState::Completed);
    const auto saved = download_dir.path() / "album" / "2024" / "photo.jpg";
    assert(std::filesystem::path(receiver->status().local_path) == saved);
    assert(read_file(saved) == content);
}

void test_prepare_offer() {
    TempDir source_dir("lanshare_session_prepare");
    const auto content = make_content(200 * 1024 + 3);
    const auto source = source_dir.path() / "hash.bin";
    write_file(source, content);
    const auto now = Clock::now();

    // The checksum is filled in by prepare_offer and carried in the Offer.
    auto request = make_request(content, 64 * 1024, "hash.bin");
    const auto expected = request.checksum;
    request.checksum.clear();
    Wire to_receiver;
    auto sender = TransferSession::create_sender(request, source, options(), to_receiver.sink());
    assert(sender->prepare_offer(now));
    assert(sender->request().checksum == expected);
    assert(sender->state() == TransferState::Proposed);
    assert(sender->send_offer(now));
    const auto& offer = std::get<protocol::OfferPayload>(to_receiver.frames.front().message.payload);
    assert(offer.checksum == expected);

    // An unreadable source aborts without contacting the peer.
    Wire silent;
    auto missing = TransferSession::create_sender(request, source_dir.path() / "gone.bin", options(), silent.sink());
    assert(!missing->prepare_offer(now));
    assert(missing->state() == TransferState::Aborted);
    assert(missing->status().error == ErrorCode::IOFailure);
    assert(silent.frames.empty());

    // A file that changed size since it was queued is refused too.
    auto resized = make_request(content, 64 * 1024, "hash.bin");
    resized.file_size += 1;
    auto stale = TransferSession::create_sender(resized, source, options(), silent.sink());
    assert(!stale->prepare_offer(now));
    assert(stale->status().error == ErrorCode::IOFailure);

    auto cancelled = TransferSession::create_sender(request, source, options(), silent.sink());
    assert(!cancelled->prepare_offer(now, [] { return true; }));
    assert(cancelled->status().error == ErrorCode::Cancelled);
    assert(silent.frames.empty());
}

void test_abort_keeps_first_cause() {
    TempDir source_dir("lanshare_session_nested_abort");
    const auto content = make_content(100);
    const auto source = source_dir.path() / "nested.bin";
    write_file(source, content);

    // A sink that fails the Abort frame by aborting the session again, as a
    // stalled connection does.
    TransferSession* self = nullptr;
    int aborts_seen = 0;
    auto sender = TransferSession::create_sender(
        make_request(content, 64, "nested.bin"), source, options(),
        [&](const protocol::ControlMessage& message, std::span<const std::uint8_t>) {
            if (message.type() == protocol::MessageType::Abort) {
                ++aborts_seen;
                self->abort(ErrorCode::Timeout, false, Clock::now());
                return false;
            }
            return true;
        });
    self = sender.get();

    const auto now = Clock::now();
    assert(sender->send_offer(now));
    sender->abort(ErrorCode::Cancelled, true, now);
    assert(aborts_seen == 1);
    assert(sender->state() == TransferState::Aborted);
    assert(sender->status().error == ErrorCode::Cancelled);
}

}  // namespace

int main() {
    log::StructuredLogger::instance().set_enabled(false);

    test_happy_path();
    test_sequence_gap();
    test_checksum_mismatch();
    test_idle_timeout();
    test_cancel_from_proposed();
    test_sender_chunking();
    test_file_names();
    test_reserve_destination();
    test_receive_into_subdirectory();
    test_prepare_offer();
    test_abort_keeps_first_cause();
    return 0;
}
