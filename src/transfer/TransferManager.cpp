#include "lanshare/transfer/TransferManager.hpp"

#include "lanshare/log/StructuredLogger.hpp"
#include "lanshare/protocol/Message.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <random>
#include <system_error>

namespace lanshare::transfer {

namespace {

constexpr std::chrono::milliseconds kPollSlice{100};
constexpr std::chrono::milliseconds kLingerTimeout{500};

log::StructuredLogger& logger() {
    return log::StructuredLogger::instance();
}

std::chrono::milliseconds as_millis(std::chrono::seconds value) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(value);
}

}  // namespace

TransferManager::TransferManager(Config config, PeerIdentity local, EventCallback events)
    : config_(std::move(config)),
      events_(std::move(events)),
      local_(std::move(local)) {
    if (config_.max_concurrent_transfers == 0) {
        config_.max_concurrent_transfers = 1;
    }
    std::random_device rd;
    id_prefix_ = static_cast<std::uint64_t>(rd());
}

TransferManager::~TransferManager() {
    stop();
}

void TransferManager::start() {
    if (running_) {
        return;
    }

    listener_.listen(config_.transfer_host, config_.transfer_port);
    {
        std::scoped_lock lock(mutex_);
        stopping_ = false;
        local_.port = listener_.port();
    }
    running_ = true;
    accept_thread_ = std::thread(&TransferManager::accept_loop, this);

    logger().info("transfer.listening", {{"port", std::to_string(listener_.port())},
                                         {"max_concurrent", std::to_string(config_.max_concurrent_transfers)}});
}

void TransferManager::stop() {
    running_ = false;
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    listener_.close();

    std::deque<std::shared_ptr<Entry>> queued;
    std::vector<std::shared_ptr<Entry>> live;
    {
        std::scoped_lock lock(mutex_);
        stopping_ = true;
        queued.swap(queue_);
        for (const auto& [key, entry] : entries_) {
            if (entry->worker_started) {
                live.push_back(entry);
            }
        }
    }

    for (const auto& entry : queued) {
        entry->queued = false;
        entry->session->abort(ErrorCode::Cancelled, false, Clock::now());
    }
    for (const auto& entry : live) {
        post(*entry, Command::Cancel);
    }

    std::list<std::shared_ptr<Worker>> workers;
    {
        std::scoped_lock lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker->thread.joinable()) {
            worker->thread.join();
        }
    }
}

TransferId TransferManager::send_file(const PeerIdentity& peer, const std::filesystem::path& path) {
    return enqueue_outbound(peer, path, path.filename().string());
}

std::vector<TransferId> TransferManager::send_directory(const PeerIdentity& peer,
                                                        const std::filesystem::path& directory) {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        throw EngineError(ErrorCode::IOFailure, "Not a readable directory: " + directory.string());
    }

    std::vector<std::filesystem::path> files;
    for (auto it = std::filesystem::recursive_directory_iterator(directory, ec);
         !ec && it != std::filesystem::recursive_directory_iterator();
         it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        throw EngineError(ErrorCode::IOFailure, "Unable to list " + directory.string() + ": " + ec.message());
    }
    std::sort(files.begin(), files.end());

    const auto normal = std::filesystem::absolute(directory, ec).lexically_normal();
    auto root = normal.filename();
    if (root.empty()) {
        root = normal.parent_path().filename();
    }
    if (root.empty()) {
        root = "shared";
    }

    std::vector<TransferId> ids;
    for (const auto& file : files) {
        const auto offered = (root / file.lexically_relative(directory)).generic_string();
        try {
            ids.push_back(enqueue_outbound(peer, file, offered));
        } catch (const EngineError& ex) {
            logger().warning("transfer.directory_skipped", {{"file", file.string()}, {"error", ex.what()}});
        }
    }
    if (ids.empty()) {
        throw EngineError(ErrorCode::IOFailure, "No readable files in " + directory.string());
    }

    logger().info("transfer.directory_queued", {{"directory", directory.string()},
                                                {"files", std::to_string(ids.size())},
                                                {"peer", device_id_to_string(peer.device_id)}});
    return ids;
}

TransferId TransferManager::enqueue_outbound(const PeerIdentity& peer,
                                             const std::filesystem::path& path,
                                             const std::string& offered_name) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw EngineError(ErrorCode::IOFailure, "Not a readable file: " + path.string());
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw EngineError(ErrorCode::IOFailure, "Unable to read size of " + path.string() + ": " + ec.message());
    }

    const auto algorithm = crypto::checksum_algorithm_from_name(config_.checksum_algorithm)
                               .value_or(crypto::ChecksumAlgorithm::Sha256);

    TransferRequest request{};
    request.transfer_id = next_transfer_id();
    request.file_name = offered_name;
    request.file_size = size;
    request.checksum_algorithm = algorithm;
    request.chunk_size = config_.chunk_size == 0
                             ? adaptive_chunk_size(size)
                             : std::min(config_.chunk_size, protocol::kMaxChunkBytes);
    request.receiver = peer;
    {
        std::scoped_lock lock(mutex_);
        request.sender = local_;
    }

    auto entry = std::make_shared<Entry>();
    entry->role = TransferRole::Sender;
    entry->id = request.transfer_id;
    entry->peer = peer;
    entry->session = TransferSession::create_sender(std::move(request), path, session_options(),
                                                    make_sink(*entry), make_callback(*entry));

    bool dispatch = false;
    {
        std::scoped_lock lock(mutex_);
        if (stopping_) {
            throw EngineError(ErrorCode::IOFailure, "Transfer manager is stopped");
        }
        entries_[Key{entry->role, entry->id}] = entry;
        if (active_slots_ < config_.max_concurrent_transfers) {
            ++active_slots_;
            entry->holds_slot = true;
            entry->worker_started = true;
            dispatch = true;
        } else {
            entry->queued = true;
            queue_.push_back(entry);
        }
    }

    logger().info(dispatch ? "transfer.outbound" : "transfer.queued",
                  {{"transfer_id", transfer_id_to_string(entry->id)},
                   {"peer", device_id_to_string(peer.device_id)},
                   {"address", peer.address + ":" + std::to_string(peer.port)},
                   {"file", path.string()},
                   {"bytes", std::to_string(size)}});

    publish(EventKind::StateChanged, entry->session->status());
    if (dispatch) {
        start_worker([this, entry] { outbound_worker(entry); });
    }
    return entry->id;
}

bool TransferManager::respond(TransferId id, bool accept) {
    const auto entry = find_entry(id, TransferRole::Receiver);
    if (!entry || entry->session->state() != TransferState::Proposed) {
        return false;
    }
    post(*entry, accept ? Command::Accept : Command::Reject);
    return true;
}

bool TransferManager::cancel(TransferId id) {
    const auto entry = find_entry(id, std::nullopt);
    if (!entry || entry->session->terminal()) {
        return false;
    }

    bool was_queued = false;
    {
        std::scoped_lock lock(mutex_);
        if (entry->queued) {
            queue_.erase(std::remove(queue_.begin(), queue_.end(), entry), queue_.end());
            entry->queued = false;
            was_queued = true;
        }
    }

    if (was_queued) {
        entry->session->abort(ErrorCode::Cancelled, false, Clock::now());
    } else {
        post(*entry, Command::Cancel);
    }
    return true;
}

std::optional<TransferStatus> TransferManager::status(TransferId id) const {
    const auto entry = find_entry(id, std::nullopt);
    if (!entry) {
        return std::nullopt;
    }
    return entry->session->status();
}

std::vector<TransferStatus> TransferManager::transfers() const {
    std::vector<TransferStatus> result;
    std::scoped_lock lock(mutex_);
    result.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        result.push_back(entry->session->status());
    }
    return result;
}

std::size_t TransferManager::active_slots() const {
    std::scoped_lock lock(mutex_);
    return active_slots_;
}

void TransferManager::set_local_identity(PeerIdentity local) {
    std::scoped_lock lock(mutex_);
    if (listener_.is_open()) {
        local.port = listener_.port();
    }
    local_ = std::move(local);
}

void TransferManager::accept_loop() {
    while (running_) {
        auto connection = listener_.accept(kPollSlice);
        if (connection && running_) {
            auto shared = std::make_shared<network::TcpConnection>(std::move(*connection));
            start_worker([this, shared] { inbound_worker(std::move(*shared)); });
        }
        housekeeping(Clock::now());
    }
}

void TransferManager::housekeeping(Clock::time_point now) {
    {
        std::scoped_lock lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if ((*it)->done.load()) {
                if ((*it)->thread.joinable()) {
                    (*it)->thread.join();
                }
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }

    {
        std::scoped_lock lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            const auto& entry = it->second;
            if (entry->terminal_since && now - *entry->terminal_since > config_.terminal_grace_period) {
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
    }

    dispatch_queued();
}

void TransferManager::dispatch_queued() {
    std::vector<std::shared_ptr<Entry>> ready;
    {
        std::scoped_lock lock(mutex_);
        while (!stopping_ && !queue_.empty() && active_slots_ < config_.max_concurrent_transfers) {
            auto entry = queue_.front();
            queue_.pop_front();
            entry->queued = false;
            if (entry->session->terminal()) {
                continue;
            }
            ++active_slots_;
            entry->holds_slot = true;
            entry->worker_started = true;
            ready.push_back(std::move(entry));
        }
    }

    for (auto& entry : ready) {
        logger().info("transfer.dequeued", {{"transfer_id", transfer_id_to_string(entry->id)}});
        start_worker([this, entry] { outbound_worker(entry); });
    }
}

void TransferManager::inbound_worker(network::TcpConnection connection) {
    const auto remote = connection.remote_address();
    const auto handshake_timeout = as_millis(config_.handshake_timeout);

    auto log_refused = [&](ErrorCode reason, const std::string& detail) {
        logger().warning("transfer.inbound_refused",
                         {{"remote", remote}, {"reason", to_string(reason)}, {"detail", detail}});
    };

    connection.set_recv_timeout(handshake_timeout);
    if (!connection.wait_readable(handshake_timeout)) {
        log_refused(ErrorCode::HandshakeTimeout, "no offer received");
        return;
    }

    std::vector<std::uint8_t> frame;
    const auto read = connection.receive_frame(frame, protocol::kMaxControlFrameBytes);
    if (read != network::TcpConnection::ReadStatus::Ok) {
        log_refused(read == network::TcpConnection::ReadStatus::TooLarge ? ErrorCode::MalformedFrame
                                                                          : ErrorCode::HandshakeTimeout,
                    "offer not read");
        return;
    }

    ErrorCode error = ErrorCode::MalformedFrame;
    const auto message = protocol::decode(frame, &error);
    if (!message) {
        log_refused(error, "offer not decoded");
        return;
    }
    if (message->type() != protocol::MessageType::Offer) {
        log_refused(ErrorCode::MalformedFrame, std::string("expected offer, got ") + protocol::to_string(message->type()));
        return;
    }

    const auto& offer = std::get<protocol::OfferPayload>(message->payload);

    PeerIdentity local;
    {
        std::scoped_lock lock(mutex_);
        local = local_;
    }
    if (offer.receiver_id != local.device_id) {
        refuse(connection, message->transfer_id, ErrorCode::PeerUnreachable, "offer addressed to another device");
        return;
    }

    TransferRequest request{};
    request.transfer_id = message->transfer_id;
    request.file_name = offer.file_name;
    request.file_size = offer.file_size;
    request.checksum_algorithm = offer.checksum_algorithm;
    request.checksum = offer.checksum;
    request.chunk_size = offer.chunk_size;
    request.sender = PeerIdentity{offer.sender_id, offer.sender_name, remote, 0};
    request.receiver = local;

    auto entry = std::make_shared<Entry>();
    entry->role = TransferRole::Receiver;
    entry->id = request.transfer_id;
    entry->peer = request.sender;
    entry->connection = std::move(connection);

    const auto download_directory = config_.download_directory.empty()
                                        ? std::filesystem::current_path()
                                        : std::filesystem::path(config_.download_directory);
    entry->session = TransferSession::create_receiver(std::move(request), download_directory, session_options(),
                                                      make_sink(*entry), make_callback(*entry));

    enum class Admission { Admitted, Busy, Duplicate } admission = Admission::Admitted;
    {
        std::scoped_lock lock(mutex_);
        const Key key{entry->role, entry->id};
        if (stopping_ || active_slots_ >= config_.max_concurrent_transfers) {
            admission = Admission::Busy;
        } else if (entries_.count(key) != 0) {
            admission = Admission::Duplicate;
        } else {
            ++active_slots_;
            entry->holds_slot = true;
            entry->worker_started = true;
            entries_[key] = entry;
        }
    }

    if (admission == Admission::Busy) {
        refuse(entry->connection, entry->id, ErrorCode::Busy, "no free transfer slot");
        return;
    }
    if (admission == Admission::Duplicate) {
        refuse(entry->connection, entry->id, ErrorCode::MalformedFrame, "duplicate transfer id");
        return;
    }

    const auto status = entry->session->status();
    logger().info("transfer.offer_received", {{"transfer_id", transfer_id_to_string(entry->id)},
                                              {"from", entry->peer.display_name},
                                              {"remote", remote},
                                              {"file", status.file_name},
                                              {"bytes", std::to_string(status.total_bytes)}});
    publish(EventKind::OfferReceived, status);

    if (config_.auto_accept) {
        post(*entry, Command::Accept);
    }

    entry->connection.set_recv_timeout(as_millis(config_.idle_timeout));
    entry->connection.set_send_timeout(as_millis(config_.idle_timeout));
    try {
        run_session(*entry);
    } catch (const std::exception& ex) {
        logger().error("transfer.worker_failed", {{"transfer_id", transfer_id_to_string(entry->id)},
                                                  {"error", ex.what()}});
        entry->session->abort(ErrorCode::IOFailure, false, Clock::now());
    }
    entry->connection.graceful_close(kLingerTimeout);
}

void TransferManager::outbound_worker(std::shared_ptr<Entry> entry) {
    auto& session = *entry->session;
    // Hash before dialing so the receiver's handshake timer never covers it.
    if (!session.prepare_offer(Clock::now(), [&entry] { return entry->cancel_requested.load(); })) {
        return;
    }

    auto connection = network::TcpConnection::connect(entry->peer.address, entry->peer.port,
                                                      as_millis(config_.connect_timeout));
    if (!connection) {
        logger().warning("transfer.connect_failed", {{"transfer_id", transfer_id_to_string(entry->id)},
                                                     {"address", entry->peer.address + ":" + std::to_string(entry->peer.port)}});
        session.abort(ErrorCode::PeerUnreachable, false, Clock::now());
        return;
    }

    connection->set_recv_timeout(as_millis(config_.idle_timeout));
    connection->set_send_timeout(as_millis(config_.idle_timeout));
    entry->connection = std::move(*connection);

    try {
        if (session.send_offer(Clock::now())) {
            run_session(*entry);
        }
    } catch (const std::exception& ex) {
        logger().error("transfer.worker_failed", {{"transfer_id", transfer_id_to_string(entry->id)},
                                                  {"error", ex.what()}});
        session.abort(ErrorCode::IOFailure, false, Clock::now());
    }
    entry->connection.graceful_close(kLingerTimeout);
}

void TransferManager::run_session(Entry& entry) {
    auto& session = *entry.session;
    const auto proposed_at = Clock::now();
    const auto offer_timeout = as_millis(config_.offer_response_timeout);

    while (!session.terminal()) {
        std::deque<Command> commands;
        {
            std::scoped_lock lock(entry.commands_mutex);
            commands.swap(entry.commands);
        }
        for (const auto command : commands) {
            const auto now = Clock::now();
            switch (command) {
                case Command::Accept:
                    session.accept(now);
                    break;
                case Command::Reject:
                    session.reject(ErrorCode::Declined, now);
                    break;
                case Command::Cancel:
                    session.abort(ErrorCode::Cancelled, true, now);
                    break;
            }
        }
        if (session.terminal()) {
            break;
        }

        const auto now = Clock::now();
        const auto state = session.state();
        if (state == TransferState::Proposed && now - proposed_at > offer_timeout) {
            logger().warning("transfer.offer_timeout", {{"transfer_id", transfer_id_to_string(entry.id)}});
            session.abort(ErrorCode::Timeout, true, now);
            break;
        }
        session.check_idle(now);
        if (session.terminal()) {
            break;
        }

        const bool sending = entry.role == TransferRole::Sender && state == TransferState::InProgress &&
                             !session.all_chunks_sent();
        if (sending) {
            session.send_next_chunk(now);
        }

        const auto wait = sending ? std::chrono::milliseconds::zero() : kPollSlice;
        if (!session.terminal() && entry.connection.wait_readable(wait)) {
            process_incoming(entry);
        }
    }
}

bool TransferManager::process_incoming(Entry& entry) {
    auto& session = *entry.session;
    std::vector<std::uint8_t> frame;
    const auto read = entry.connection.receive_frame(frame, protocol::kMaxControlFrameBytes);
    if (read == network::TcpConnection::ReadStatus::TooLarge) {
        session.abort(ErrorCode::MalformedFrame, true, Clock::now());
        return false;
    }
    if (read != network::TcpConnection::ReadStatus::Ok) {
        session.handle_disconnect(Clock::now());
        return false;
    }

    ErrorCode error = ErrorCode::MalformedFrame;
    const auto message = protocol::decode(frame, &error);
    if (!message) {
        logger().warning("transfer.frame_dropped", {{"transfer_id", transfer_id_to_string(entry.id)},
                                                    {"reason", to_string(error)}});
        session.abort(error, true, Clock::now());
        return false;
    }

    if (message->type() != protocol::MessageType::ChunkHeader) {
        session.handle(*message, Clock::now());
        return true;
    }

    const auto& header = std::get<protocol::ChunkHeaderPayload>(message->payload);
    if (message->transfer_id != entry.id || header.payload_length > session.request().chunk_size) {
        session.abort(ErrorCode::MalformedFrame, true, Clock::now());
        return false;
    }

    std::vector<std::uint8_t> payload(header.payload_length);
    if (!payload.empty() && !entry.connection.recv_all(payload.data(), payload.size())) {
        session.handle_disconnect(Clock::now());
        return false;
    }
    session.handle_chunk(header, payload, Clock::now());
    return true;
}

void TransferManager::start_worker(std::function<void()> body) {
    auto worker = std::make_shared<Worker>();
    worker->thread = std::thread([worker_ptr = worker.get(), body = std::move(body)] {
        try {
            body();
        } catch (const std::exception& ex) {
            logger().error("transfer.worker_failed", {{"error", ex.what()}});
        }
        worker_ptr->done = true;
    });

    std::scoped_lock lock(workers_mutex_);
    workers_.push_back(std::move(worker));
}

void TransferManager::post(Entry& entry, Command command) {
    if (command == Command::Cancel) {
        entry.cancel_requested = true;
    }
    std::scoped_lock lock(entry.commands_mutex);
    entry.commands.push_back(command);
}

std::shared_ptr<TransferManager::Entry> TransferManager::find_entry(TransferId id,
                                                                    std::optional<TransferRole> role) const {
    std::scoped_lock lock(mutex_);
    if (role) {
        const auto it = entries_.find(Key{*role, id});
        return it == entries_.end() ? nullptr : it->second;
    }
    for (const auto candidate : {TransferRole::Sender, TransferRole::Receiver}) {
        const auto it = entries_.find(Key{candidate, id});
        if (it != entries_.end()) {
            return it->second;
        }
    }
    return nullptr;
}

TransferSession::FrameSink TransferManager::make_sink(Entry& entry) {
    network::TcpConnection::WriteWatch watch{};
    watch.slice = kPollSlice;
    watch.stall_timeout = as_millis(config_.idle_timeout);
    watch.interrupted = [target = &entry] { return target->cancel_requested.load(); };

    return [target = &entry, watch](const protocol::ControlMessage& frame, std::span<const std::uint8_t> payload) {
        using WriteStatus = network::TcpConnection::WriteStatus;
        const auto bytes = protocol::encode(frame);
        auto written = target->connection.send_frame(bytes, watch);
        if (written == WriteStatus::Ok && !payload.empty()) {
            written = target->connection.send_all(payload, watch);
        }

        switch (written) {
            case WriteStatus::Ok:
                return true;
            case WriteStatus::Interrupted:
                target->session->abort(ErrorCode::Cancelled, false, Clock::now());
                break;
            case WriteStatus::TimedOut:
                logger().warning("transfer.send_stalled", {{"transfer_id", transfer_id_to_string(target->id)}});
                target->session->abort(ErrorCode::Timeout, false, Clock::now());
                break;
            case WriteStatus::Error:
                break;
        }
        return false;
    };
}

TransferSession::StatusCallback TransferManager::make_callback(Entry& entry) {
    return [this, target = &entry](const TransferStatus& status, TransferSession::Update update) {
        on_status(*target, status, update);
    };
}

void TransferManager::on_status(Entry& entry, const TransferStatus& status, TransferSession::Update update) {
    bool released = false;
    if (update == TransferSession::Update::StateChanged && is_terminal(status.state)) {
        std::scoped_lock lock(mutex_);
        entry.terminal_since = Clock::now();
        if (entry.holds_slot) {
            entry.holds_slot = false;
            --active_slots_;
            released = true;
        }
    }

    publish(update == TransferSession::Update::StateChanged ? EventKind::StateChanged : EventKind::Progress, status);

    if (released) {
        dispatch_queued();
    }
}

void TransferManager::publish(EventKind kind, const TransferStatus& status) const {
    if (!events_) {
        return;
    }
    EngineEvent event{};
    event.kind = kind;
    event.transfer = status;
    try {
        events_(event);
    } catch (const std::exception& ex) {
        logger().error("transfer.event_failed", {{"event", to_string(kind)}, {"error", ex.what()}});
    }
}

void TransferManager::refuse(network::TcpConnection& connection,
                             TransferId id,
                             ErrorCode reason,
                             const std::string& detail) {
    protocol::ControlMessage reply{};
    reply.transfer_id = id;
    if (reason == ErrorCode::Busy || reason == ErrorCode::Declined) {
        reply.payload = protocol::RejectPayload{reason};
    } else {
        reply.payload = protocol::AbortPayload{reason};
    }

    const bool delivered = connection.send_frame(protocol::encode(reply));
    logger().warning("transfer.inbound_refused", {{"transfer_id", transfer_id_to_string(id)},
                                                  {"remote", connection.remote_address()},
                                                  {"reason", to_string(reason)},
                                                  {"detail", detail},
                                                  {"delivered", delivered ? "true" : "false"}});
    connection.graceful_close(kLingerTimeout);
}

TransferSession::Options TransferManager::session_options() const {
    TransferSession::Options options{};
    options.ack_every_chunks = config_.ack_every_chunks;
    options.idle_timeout = as_millis(config_.idle_timeout);
    return options;
}

TransferId TransferManager::next_transfer_id() {
    const auto counter = id_counter_.fetch_add(1) + 1;
    return (id_prefix_ << 32) | static_cast<std::uint64_t>(counter);
}

}  // namespace lanshare::transfer
