#include "lanshare/transfer/TransferSession.hpp"

#include "lanshare/log/StructuredLogger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <string>
#include <system_error>
#include <utility>

namespace lanshare::transfer {

namespace {

constexpr const char* kPartialSuffix = ".part";
constexpr const char* kFallbackFileName = "received_file";
constexpr int kMaxReserveAttempts = 1000;

log::StructuredLogger& logger() {
    return log::StructuredLogger::instance();
}

bool is_reserved_character(char ch) {
    switch (ch) {
        case '<':
        case '>':
        case ':':
        case '"':
        case '|':
        case '?':
        case '*':
            return true;
        default:
            return static_cast<unsigned char>(ch) < 0x20;
    }
}

std::string clean_segment(std::string name) {
    for (auto& ch : name) {
        if (is_reserved_character(ch)) {
            ch = '_';
        }
    }
    while (!name.empty() && (name.back() == ' ' || name.back() == '.')) {
        name.pop_back();
    }
    return name;
}

// Creates the file only if it does not exist yet.
std::FILE* create_exclusive(const std::filesystem::path& path) {
#ifdef _WIN32
    return _wfopen(path.c_str(), L"wbx");
#else
    return std::fopen(path.c_str(), "wbx");
#endif
}

}  // namespace

TransferSession::TransferSession(TransferRole role,
                                 TransferRequest request,
                                 Options options,
                                 FrameSink sink,
                                 StatusCallback callback)
    : role_(role),
      request_(std::move(request)),
      options_(options),
      sink_(std::move(sink)),
      callback_(std::move(callback)) {
    if (options_.ack_every_chunks == 0) {
        options_.ack_every_chunks = 1;
    }
    total_chunks_ = chunk_count(request_.file_size, request_.chunk_size);

    status_.transfer_id = request_.transfer_id;
    status_.role = role_;
    status_.state = TransferState::Proposed;
    status_.total_bytes = request_.file_size;
    status_.chunk_size = request_.chunk_size;
    status_.file_name = request_.file_name;
    status_.peer = role_ == TransferRole::Sender ? request_.receiver : request_.sender;
    status_.last_activity = Clock::now();
}

TransferSession::~TransferSession() {
    release_file();
    if (role_ == TransferRole::Receiver && state() != TransferState::Completed) {
        remove_partial();
    }
}

std::unique_ptr<TransferSession> TransferSession::create_sender(TransferRequest request,
                                                                std::filesystem::path source_path,
                                                                Options options,
                                                                FrameSink sink,
                                                                StatusCallback callback) {
    std::unique_ptr<TransferSession> session(
        new TransferSession(TransferRole::Sender, std::move(request), options, std::move(sink), std::move(callback)));
    session->source_path_ = std::move(source_path);
    session->status_.local_path = session->source_path_.string();
    return session;
}

std::unique_ptr<TransferSession> TransferSession::create_receiver(TransferRequest request,
                                                                  std::filesystem::path download_directory,
                                                                  Options options,
                                                                  FrameSink sink,
                                                                  StatusCallback callback) {
    std::unique_ptr<TransferSession> session(
        new TransferSession(TransferRole::Receiver, std::move(request), options, std::move(sink), std::move(callback)));
    session->download_directory_ = std::move(download_directory);
    return session;
}

bool TransferSession::prepare_offer(Clock::time_point now, const std::function<bool()>& cancelled) {
    if (role_ != TransferRole::Sender || state() != TransferState::Proposed || offer_sent_) {
        return false;
    }

    auto digest = crypto::checksum_file(source_path_, request_.checksum_algorithm, cancelled);
    if (!digest) {
        if (cancelled && cancelled()) {
            abort(ErrorCode::Cancelled, false, now);
            return false;
        }
        logger().error("transfer.checksum_failed", {{"transfer_id", transfer_id_to_string(id())},
                                                    {"path", source_path_.string()}});
        abort(ErrorCode::IOFailure, false, now);
        return false;
    }

    std::error_code ec;
    const auto size = std::filesystem::file_size(source_path_, ec);
    if (ec || size != request_.file_size) {
        logger().error("transfer.source_changed", {{"transfer_id", transfer_id_to_string(id())},
                                                   {"path", source_path_.string()},
                                                   {"expected", std::to_string(request_.file_size)}});
        abort(ErrorCode::IOFailure, false, now);
        return false;
    }

    request_.checksum = std::move(*digest);
    touch(now);
    return true;
}

bool TransferSession::send_offer(Clock::time_point now) {
    if (role_ != TransferRole::Sender || state() != TransferState::Proposed || offer_sent_) {
        return false;
    }

    protocol::OfferPayload offer{};
    offer.sender_id = request_.sender.device_id;
    offer.receiver_id = request_.receiver.device_id;
    offer.sender_name = request_.sender.display_name;
    offer.file_name = request_.file_name;
    offer.file_size = request_.file_size;
    offer.checksum_algorithm = request_.checksum_algorithm;
    offer.checksum = request_.checksum;
    offer.chunk_size = request_.chunk_size;

    touch(now);
    if (!emit(std::move(offer))) {
        abort(ErrorCode::PeerUnreachable, false, now);
        return false;
    }
    offer_sent_ = true;
    return true;
}

bool TransferSession::send_next_chunk(Clock::time_point now) {
    if (role_ != TransferRole::Sender || state() != TransferState::InProgress || final_sent_) {
        return false;
    }

    const auto sent = status().bytes_transferred;
    const auto length = static_cast<std::uint32_t>(
        std::min<std::uint64_t>(request_.chunk_size, request_.file_size - sent));

    std::vector<std::uint8_t> buffer(length);
    if (length > 0) {
        input_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
        if (input_.gcount() != static_cast<std::streamsize>(length)) {
            logger().error("transfer.read_failed", {{"transfer_id", transfer_id_to_string(id())},
                                                    {"path", source_path_.string()},
                                                    {"offset", std::to_string(sent)}});
            abort(ErrorCode::IOFailure, true, now);
            return false;
        }
    }

    protocol::ChunkHeaderPayload header{};
    header.sequence = next_sequence_;
    header.payload_length = length;
    header.is_final = next_sequence_ + 1 >= total_chunks_;

    if (!emit(header, buffer)) {
        abort(ErrorCode::IOFailure, false, now);
        return false;
    }

    ++next_sequence_;
    if (header.is_final) {
        final_sent_ = true;
        input_.close();
    }
    touch(now);
    add_progress(length, now);
    return !header.is_final;
}

void TransferSession::accept(Clock::time_point now) {
    if (role_ != TransferRole::Receiver || state() != TransferState::Proposed) {
        return;
    }

    const auto destination = reserve_destination(download_directory_, sanitize_relative_path(request_.file_name));
    if (!destination) {
        logger().error("transfer.open_failed", {{"transfer_id", transfer_id_to_string(id())},
                                                {"path", download_directory_.string()}});
        abort(ErrorCode::IOFailure, true, now);
        return;
    }
    final_path_ = *destination;
    partial_path_ = final_path_;
    partial_path_ += kPartialSuffix;

    output_.open(partial_path_, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!output_) {
        logger().error("transfer.open_failed", {{"transfer_id", transfer_id_to_string(id())},
                                                {"path", partial_path_.string()}});
        abort(ErrorCode::IOFailure, true, now);
        return;
    }
    checksum_.emplace(request_.checksum_algorithm);

    {
        std::scoped_lock lock(status_mutex_);
        status_.local_path = final_path_.string();
    }

    touch(now);
    if (!emit(protocol::AcceptPayload{})) {
        abort(ErrorCode::IOFailure, false, now);
        return;
    }
    set_state(TransferState::Accepted, now);
    set_state(TransferState::InProgress, now);
}

void TransferSession::reject(ErrorCode reason, Clock::time_point now) {
    if (role_ != TransferRole::Receiver || state() != TransferState::Proposed) {
        return;
    }
    if (!emit(protocol::RejectPayload{reason})) {
        logger().warning("transfer.reject_undelivered", {{"transfer_id", transfer_id_to_string(id())}});
    }
    set_state(TransferState::Rejected, now, reason);
}

void TransferSession::handle(const protocol::ControlMessage& message, Clock::time_point now) {
    const auto current = state();
    if (is_terminal(current)) {
        return;
    }

    if (message.transfer_id != id()) {
        logger().warning("transfer.unexpected_frame", {{"transfer_id", transfer_id_to_string(id())},
                                                       {"frame_transfer_id", transfer_id_to_string(message.transfer_id)}});
        abort(ErrorCode::MalformedFrame, true, now);
        return;
    }

    const auto type = message.type();
    const bool sender = role_ == TransferRole::Sender;
    bool expected = false;

    switch (type) {
        case protocol::MessageType::Accept:
            expected = sender && current == TransferState::Proposed && offer_sent_;
            if (expected) {
                handle_accept(now);
            }
            break;
        case protocol::MessageType::Reject:
            expected = sender && current == TransferState::Proposed;
            if (expected) {
                touch(now);
                set_state(TransferState::Rejected, now, std::get<protocol::RejectPayload>(message.payload).reason);
            }
            break;
        case protocol::MessageType::Ack:
            expected = sender && current == TransferState::InProgress;
            if (expected) {
                handle_ack(std::get<protocol::AckPayload>(message.payload), now);
            }
            break;
        case protocol::MessageType::Complete:
            expected = sender && current == TransferState::InProgress && final_sent_;
            if (expected) {
                handle_complete(std::get<protocol::CompletePayload>(message.payload), now);
            }
            break;
        case protocol::MessageType::Abort:
            expected = true;
            logger().warning("transfer.remote_abort",
                             {{"transfer_id", transfer_id_to_string(id())},
                              {"reason", to_string(std::get<protocol::AbortPayload>(message.payload).reason)}});
            abort(std::get<protocol::AbortPayload>(message.payload).reason, false, now);
            break;
        case protocol::MessageType::Offer:
        case protocol::MessageType::ChunkHeader:
            break;
    }

    if (!expected) {
        logger().warning("transfer.unexpected_frame", {{"transfer_id", transfer_id_to_string(id())},
                                                       {"type", protocol::to_string(type)},
                                                       {"state", to_string(current)},
                                                       {"role", to_string(role_)}});
        abort(ErrorCode::MalformedFrame, true, now);
    }
}

void TransferSession::handle_chunk(const protocol::ChunkHeaderPayload& header,
                                   std::span<const std::uint8_t> payload,
                                   Clock::time_point now) {
    if (role_ != TransferRole::Receiver || state() != TransferState::InProgress) {
        abort(ErrorCode::MalformedFrame, true, now);
        return;
    }

    if (header.sequence != next_sequence_) {
        logger().warning("transfer.sequence_gap", {{"transfer_id", transfer_id_to_string(id())},
                                                   {"expected", std::to_string(next_sequence_)},
                                                   {"received", std::to_string(header.sequence)}});
        abort(ErrorCode::SequencingError, true, now);
        return;
    }

    const auto received = status().bytes_transferred;
    if (payload.size() != header.payload_length || header.payload_length > request_.chunk_size ||
        received + header.payload_length > request_.file_size ||
        (!header.is_final && header.payload_length != request_.chunk_size)) {
        logger().warning("transfer.chunk_rejected", {{"transfer_id", transfer_id_to_string(id())},
                                                     {"sequence", std::to_string(header.sequence)},
                                                     {"length", std::to_string(header.payload_length)}});
        abort(ErrorCode::MalformedFrame, true, now);
        return;
    }

    if (!payload.empty()) {
        const auto offset = header.sequence * static_cast<std::uint64_t>(request_.chunk_size);
        output_.seekp(static_cast<std::streamoff>(offset));
        output_.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
        if (!output_) {
            logger().error("transfer.write_failed", {{"transfer_id", transfer_id_to_string(id())},
                                                     {"path", partial_path_.string()}});
            abort(ErrorCode::IOFailure, true, now);
            return;
        }
        checksum_->update(payload);
    }

    ++next_sequence_;
    touch(now);
    add_progress(payload.size(), now);

    if (header.is_final) {
        finish_receive(header.sequence, now);
        return;
    }

    if (++chunks_since_ack_ >= options_.ack_every_chunks) {
        chunks_since_ack_ = 0;
        if (!emit(protocol::AckPayload{header.sequence})) {
            abort(ErrorCode::IOFailure, false, now);
        }
    }
}

void TransferSession::check_idle(Clock::time_point now) {
    if (state() != TransferState::InProgress) {
        return;
    }
    const auto last = status().last_activity;
    if (now - last > options_.idle_timeout) {
        logger().warning("transfer.idle_timeout", {{"transfer_id", transfer_id_to_string(id())}});
        abort(ErrorCode::Timeout, true, now);
    }
}

void TransferSession::handle_disconnect(Clock::time_point now) {
    if (terminal()) {
        return;
    }
    abort(ErrorCode::IOFailure, false, now);
}

void TransferSession::abort(ErrorCode cause, bool notify_peer, Clock::time_point now) {
    if (aborting_ || terminal()) {
        return;
    }
    aborting_ = true;

    if (notify_peer && (role_ == TransferRole::Receiver || offer_sent_)) {
        if (!emit(protocol::AbortPayload{cause})) {
            logger().warning("transfer.abort_undelivered", {{"transfer_id", transfer_id_to_string(id())}});
        }
    }

    release_file();
    if (role_ == TransferRole::Receiver) {
        remove_partial();
    }
    set_state(TransferState::Aborted, now, cause);
    aborting_ = false;
}

TransferStatus TransferSession::status() const {
    std::scoped_lock lock(status_mutex_);
    return status_;
}

TransferState TransferSession::state() const {
    std::scoped_lock lock(status_mutex_);
    return status_.state;
}

bool TransferSession::terminal() const {
    return is_terminal(state());
}

std::string TransferSession::sanitize_file_name(const std::string& offered) {
    const auto separator = offered.find_last_of("/\\");
    auto name = clean_segment(separator == std::string::npos ? offered : offered.substr(separator + 1));
    if (name.empty() || name == "." || name == "..") {
        return kFallbackFileName;
    }
    return name;
}

std::filesystem::path TransferSession::sanitize_relative_path(const std::string& offered) {
    std::filesystem::path relative;
    std::size_t start = 0;
    while (start <= offered.size()) {
        auto end = offered.find_first_of("/\\", start);
        if (end == std::string::npos) {
            end = offered.size();
        }
        const auto raw = offered.substr(start, end - start);
        if (raw != "." && raw != "..") {
            auto segment = clean_segment(raw);
            if (!segment.empty()) {
                relative /= segment;
            }
        }
        start = end + 1;
    }
    if (relative.empty()) {
        return kFallbackFileName;
    }
    return relative;
}

std::filesystem::path TransferSession::unique_destination(const std::filesystem::path& directory,
                                                          const std::string& file_name) {
    const std::filesystem::path base(file_name);
    const auto stem = base.stem().string();
    const auto extension = base.extension().string();

    auto taken = [](const std::filesystem::path& candidate) {
        std::error_code ec;
        auto partial = candidate;
        partial += kPartialSuffix;
        return std::filesystem::exists(candidate, ec) || std::filesystem::exists(partial, ec);
    };

    auto candidate = directory / base;
    for (std::uint32_t attempt = 1; taken(candidate); ++attempt) {
        candidate = directory / (stem + " (" + std::to_string(attempt) + ")" + extension);
    }
    return candidate;
}

std::optional<std::filesystem::path> TransferSession::reserve_destination(const std::filesystem::path& directory,
                                                                          const std::filesystem::path& relative) {
    const auto parent = (directory / relative).parent_path();
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        logger().error("transfer.mkdir_failed", {{"path", parent.string()}, {"error", ec.message()}});
        return std::nullopt;
    }

    const auto file_name = relative.filename().string();
    for (int attempt = 0; attempt < kMaxReserveAttempts; ++attempt) {
        const auto candidate = unique_destination(parent, file_name);
        auto partial = candidate;
        partial += kPartialSuffix;
        if (auto* file = create_exclusive(partial)) {
            std::fclose(file);
            // A completed file may have appeared between the check and the create.
            if (!std::filesystem::exists(candidate, ec)) {
                return candidate;
            }
            std::filesystem::remove(partial, ec);
            continue;
        }
        if (errno != EEXIST) {
            logger().error("transfer.reserve_failed", {{"path", partial.string()}, {"error", std::to_string(errno)}});
            return std::nullopt;
        }
    }
    return std::nullopt;
}

bool TransferSession::emit(protocol::Payload payload, std::span<const std::uint8_t> bytes) {
    if (!sink_) {
        return false;
    }
    protocol::ControlMessage message{};
    message.transfer_id = id();
    message.payload = std::move(payload);
    return sink_(message, bytes);
}

void TransferSession::set_state(TransferState state, Clock::time_point now, std::optional<ErrorCode> error) {
    TransferStatus snapshot;
    TransferState previous;
    {
        std::scoped_lock lock(status_mutex_);
        previous = status_.state;
        if (previous == state || is_terminal(previous)) {
            return;
        }
        status_.state = state;
        status_.last_activity = now;
        if (error) {
            status_.error = error;
        }
        snapshot = status_;
    }

    log::StructuredLogger::FieldList fields{{"transfer_id", transfer_id_to_string(id())},
                                            {"role", to_string(role_)},
                                            {"from", to_string(previous)},
                                            {"to", to_string(state)}};
    if (error) {
        fields.emplace_back("error", to_string(*error));
    }
    if (state == TransferState::Aborted) {
        logger().warning("transfer.aborted", std::move(fields));
    } else {
        logger().info("transfer.state", std::move(fields));
    }

    if (callback_) {
        callback_(snapshot, Update::StateChanged);
    }
}

void TransferSession::add_progress(std::uint64_t bytes, Clock::time_point now) {
    TransferStatus snapshot;
    {
        std::scoped_lock lock(status_mutex_);
        status_.bytes_transferred += bytes;
        snapshot = status_;
    }

    const auto percent = snapshot.total_bytes == 0 ? 100 : snapshot.bytes_transferred * 100 / snapshot.total_bytes;
    const bool finished = snapshot.bytes_transferred == snapshot.total_bytes;
    if (!finished && percent == last_progress_percent_ &&
        now - last_progress_report_ < options_.progress_interval) {
        return;
    }
    last_progress_percent_ = percent;
    last_progress_report_ = now;

    if (callback_) {
        callback_(snapshot, Update::Progress);
    }
}

void TransferSession::touch(Clock::time_point now) {
    std::scoped_lock lock(status_mutex_);
    status_.last_activity = now;
}

void TransferSession::handle_accept(Clock::time_point now) {
    touch(now);
    set_state(TransferState::Accepted, now);

    input_.open(source_path_, std::ios::binary);
    if (!input_) {
        logger().error("transfer.open_failed", {{"transfer_id", transfer_id_to_string(id())},
                                                {"path", source_path_.string()}});
        abort(ErrorCode::IOFailure, true, now);
        return;
    }
    set_state(TransferState::InProgress, now);
}

void TransferSession::handle_ack(const protocol::AckPayload& ack, Clock::time_point now) {
    if (next_sequence_ == 0 || ack.sequence >= next_sequence_ ||
        (acked_sequence_ && ack.sequence < *acked_sequence_)) {
        logger().warning("transfer.ack_rejected", {{"transfer_id", transfer_id_to_string(id())},
                                                   {"sequence", std::to_string(ack.sequence)}});
        abort(ErrorCode::SequencingError, true, now);
        return;
    }
    acked_sequence_ = ack.sequence;
    touch(now);
}

void TransferSession::handle_complete(const protocol::CompletePayload& complete, Clock::time_point now) {
    if (complete.bytes != request_.file_size) {
        logger().warning("transfer.complete_mismatch", {{"transfer_id", transfer_id_to_string(id())},
                                                        {"bytes", std::to_string(complete.bytes)}});
        abort(ErrorCode::SequencingError, true, now);
        return;
    }
    touch(now);
    set_state(TransferState::Completed, now);
}

void TransferSession::finish_receive(std::uint64_t final_sequence, Clock::time_point now) {
    if (status().bytes_transferred != request_.file_size) {
        logger().warning("transfer.short_transfer", {{"transfer_id", transfer_id_to_string(id())},
                                                     {"expected", std::to_string(request_.file_size)}});
        abort(ErrorCode::SequencingError, true, now);
        return;
    }

    output_.flush();
    const bool flushed = static_cast<bool>(output_);
    output_.close();
    if (!flushed || output_.fail()) {
        abort(ErrorCode::IOFailure, true, now);
        return;
    }

    const auto digest = checksum_->finalize();
    if (digest != request_.checksum) {
        logger().warning("transfer.checksum_mismatch", {{"transfer_id", transfer_id_to_string(id())},
                                                        {"expected", crypto::digest_to_hex(request_.checksum)},
                                                        {"actual", crypto::digest_to_hex(digest)}});
        abort(ErrorCode::ChecksumMismatch, true, now);
        return;
    }

    std::error_code ec;
    std::filesystem::rename(partial_path_, final_path_, ec);
    if (ec) {
        logger().error("transfer.rename_failed", {{"transfer_id", transfer_id_to_string(id())},
                                                  {"path", final_path_.string()},
                                                  {"error", ec.message()}});
        abort(ErrorCode::IOFailure, true, now);
        return;
    }
    partial_path_.clear();

    if (!emit(protocol::AckPayload{final_sequence}) ||
        !emit(protocol::CompletePayload{request_.file_size})) {
        logger().warning("transfer.complete_undelivered", {{"transfer_id", transfer_id_to_string(id())}});
    }
    set_state(TransferState::Completed, now);
}

void TransferSession::release_file() {
    if (input_.is_open()) {
        input_.close();
    }
    if (output_.is_open()) {
        output_.close();
    }
}

void TransferSession::remove_partial() {
    if (partial_path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(partial_path_, ec);
    if (ec) {
        logger().warning("transfer.cleanup_failed", {{"path", partial_path_.string()}, {"error", ec.message()}});
    }
    partial_path_.clear();
}

}  // namespace lanshare::transfer
