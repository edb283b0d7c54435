#pragma once

#include "lanshare/Error.hpp"
#include "lanshare/Types.hpp"
#include "lanshare/crypto/Checksum.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanshare::transfer {

enum class TransferState {
    Proposed,
    Accepted,
    InProgress,
    Completed,
    Rejected,
    Aborted
};

enum class TransferRole {
    Sender,
    Receiver
};

const char* to_string(TransferState state) noexcept;
const char* to_string(TransferRole role) noexcept;
bool is_terminal(TransferState state) noexcept;

// Immutable description of a proposed transfer, as carried in an Offer.
struct TransferRequest {
    TransferId transfer_id{0};
    std::string file_name;
    std::uint64_t file_size{0};
    crypto::ChecksumAlgorithm checksum_algorithm{crypto::ChecksumAlgorithm::Sha256};
    std::vector<std::uint8_t> checksum;
    std::uint32_t chunk_size{0};
    PeerIdentity sender;
    PeerIdentity receiver;
};

struct TransferStatus {
    TransferId transfer_id{0};
    TransferRole role{TransferRole::Sender};
    TransferState state{TransferState::Proposed};
    std::uint64_t bytes_transferred{0};
    std::uint64_t total_bytes{0};
    std::uint32_t chunk_size{0};
    std::string file_name;
    PeerIdentity peer;
    std::string local_path;
    std::optional<ErrorCode> error{};
    Clock::time_point last_activity{};
};

// 64 KiB below 1 MiB, 1 MiB below 100 MiB, 4 MiB above.
std::uint32_t adaptive_chunk_size(std::uint64_t file_size) noexcept;

// Number of chunks a file of this size is split into; an empty file still sends one final chunk.
std::uint64_t chunk_count(std::uint64_t file_size, std::uint32_t chunk_size) noexcept;

}  // namespace lanshare::transfer
