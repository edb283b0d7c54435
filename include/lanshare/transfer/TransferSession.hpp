#pragma once

#include "lanshare/Error.hpp"
#include "lanshare/crypto/Checksum.hpp"
#include "lanshare/protocol/Message.hpp"
#include "lanshare/transfer/TransferTypes.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace lanshare::transfer {

// State machine for one file transfer, either side. It never touches sockets:
// outgoing frames leave through the FrameSink and every status change is
// reported through the StatusCallback. All mutating calls must come from one
// thread; status() may be called from any thread.
class TransferSession {
public:
    enum class Update {
        StateChanged,
        Progress
    };

    // Returns false when the frame could not be delivered.
    using FrameSink = std::function<bool(const protocol::ControlMessage& frame,
                                         std::span<const std::uint8_t> payload)>;
    using StatusCallback = std::function<void(const TransferStatus& status, Update update)>;

    struct Options {
        std::uint32_t ack_every_chunks{8};
        std::chrono::milliseconds idle_timeout{std::chrono::seconds(30)};
        std::chrono::milliseconds progress_interval{250};
    };

    static std::unique_ptr<TransferSession> create_sender(TransferRequest request,
                                                          std::filesystem::path source_path,
                                                          Options options,
                                                          FrameSink sink,
                                                          StatusCallback callback = {});

    static std::unique_ptr<TransferSession> create_receiver(TransferRequest request,
                                                            std::filesystem::path download_directory,
                                                            Options options,
                                                            FrameSink sink,
                                                            StatusCallback callback = {});

    ~TransferSession();

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    // Sender: computes the source checksum for the Offer. Aborts with
    // IOFailure when the file cannot be read or changed size, and with
    // Cancelled when `cancelled` returns true between blocks.
    bool prepare_offer(Clock::time_point now, const std::function<bool()>& cancelled = {});

    // Sender: emits the Offer. The session stays Proposed until the peer answers.
    bool send_offer(Clock::time_point now);

    // Sender: emits the next chunk. Returns true while more chunks remain.
    bool send_next_chunk(Clock::time_point now);
    [[nodiscard]] bool all_chunks_sent() const noexcept { return final_sent_; }

    // Receiver: answers the Offer.
    void accept(Clock::time_point now);
    void reject(ErrorCode reason, Clock::time_point now);

    // Any control frame other than a chunk header.
    void handle(const protocol::ControlMessage& message, Clock::time_point now);

    // Receiver: one chunk header and its payload bytes.
    void handle_chunk(const protocol::ChunkHeaderPayload& header,
                      std::span<const std::uint8_t> payload,
                      Clock::time_point now);

    void check_idle(Clock::time_point now);
    void handle_disconnect(Clock::time_point now);

    // Moves any non-terminal state to Aborted. Idempotent.
    void abort(ErrorCode cause, bool notify_peer, Clock::time_point now);

    [[nodiscard]] TransferStatus status() const;
    [[nodiscard]] TransferState state() const;
    [[nodiscard]] bool terminal() const;
    [[nodiscard]] TransferRole role() const noexcept { return role_; }
    [[nodiscard]] TransferId id() const noexcept { return request_.transfer_id; }
    [[nodiscard]] const TransferRequest& request() const noexcept { return request_; }

    // Base name of the offered file with separators and reserved characters removed.
    static std::string sanitize_file_name(const std::string& offered);
    // Relative path of the offered name. Each '/' or '\\' separated segment is
    // sanitized; empty, "." and ".." segments are dropped.
    static std::filesystem::path sanitize_relative_path(const std::string& offered);
    // First free "<stem> (n)<ext>" in the directory, considering partial files too.
    static std::filesystem::path unique_destination(const std::filesystem::path& directory,
                                                    const std::string& file_name);
    // Picks a free destination under `directory` and creates its partial file
    // exclusively, so two sessions never share one. Creates missing parent
    // directories. Returns std::nullopt on a filesystem error.
    static std::optional<std::filesystem::path> reserve_destination(const std::filesystem::path& directory,
                                                                    const std::filesystem::path& relative);

private:
    TransferSession(TransferRole role,
                    TransferRequest request,
                    Options options,
                    FrameSink sink,
                    StatusCallback callback);

    bool emit(protocol::Payload payload, std::span<const std::uint8_t> bytes = {});
    void set_state(TransferState state, Clock::time_point now, std::optional<ErrorCode> error = std::nullopt);
    void add_progress(std::uint64_t bytes, Clock::time_point now);
    void touch(Clock::time_point now);

    void handle_accept(Clock::time_point now);
    void handle_ack(const protocol::AckPayload& ack, Clock::time_point now);
    void handle_complete(const protocol::CompletePayload& complete, Clock::time_point now);
    void finish_receive(std::uint64_t final_sequence, Clock::time_point now);

    void release_file();
    void remove_partial();

    TransferRole role_;
    TransferRequest request_;
    Options options_;
    FrameSink sink_;
    StatusCallback callback_;

    std::filesystem::path source_path_;
    std::filesystem::path download_directory_;
    std::filesystem::path final_path_;
    std::filesystem::path partial_path_;
    std::ifstream input_;
    std::ofstream output_;
    std::optional<crypto::ChecksumAccumulator> checksum_;

    std::uint64_t next_sequence_{0};
    std::uint64_t total_chunks_{1};
    std::optional<std::uint64_t> acked_sequence_{};
    std::uint32_t chunks_since_ack_{0};
    bool offer_sent_{false};
    bool final_sent_{false};
    bool aborting_{false};
    Clock::time_point last_progress_report_{};
    std::uint64_t last_progress_percent_{0};

    mutable std::mutex status_mutex_;
    TransferStatus status_;
};

}  // namespace lanshare::transfer
