#include "lanshare/transfer/TransferTypes.hpp"

namespace lanshare::transfer {

namespace {

constexpr std::uint64_t kMiB = 1024ull * 1024ull;

}  // namespace

const char* to_string(TransferState state) noexcept {
    switch (state) {
        case TransferState::Proposed:
            return "proposed";
        case TransferState::Accepted:
            return "accepted";
        case TransferState::InProgress:
            return "in_progress";
        case TransferState::Completed:
            return "completed";
        case TransferState::Rejected:
            return "rejected";
        case TransferState::Aborted:
            return "aborted";
    }
    return "unknown";
}

const char* to_string(TransferRole role) noexcept {
    return role == TransferRole::Sender ? "sender" : "receiver";
}

bool is_terminal(TransferState state) noexcept {
    return state == TransferState::Completed || state == TransferState::Rejected ||
           state == TransferState::Aborted;
}

std::uint32_t adaptive_chunk_size(std::uint64_t file_size) noexcept {
    if (file_size < kMiB) {
        return 64u * 1024u;
    }
    if (file_size < 100 * kMiB) {
        return static_cast<std::uint32_t>(kMiB);
    }
    return static_cast<std::uint32_t>(4 * kMiB);
}

std::uint64_t chunk_count(std::uint64_t file_size, std::uint32_t chunk_size) noexcept {
    if (chunk_size == 0 || file_size == 0) {
        return 1;
    }
    return (file_size + chunk_size - 1) / chunk_size;
}

}  // namespace lanshare::transfer
