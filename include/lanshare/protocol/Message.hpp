#pragma once

#include "lanshare/Error.hpp"
#include "lanshare/Types.hpp"
#include "lanshare/crypto/Checksum.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lanshare::protocol {

inline constexpr std::uint8_t kProtocolVersion = 1;
inline constexpr std::size_t kMaxDisplayNameBytes = 255;
inline constexpr std::size_t kMaxFileNameBytes = 4096;
inline constexpr std::size_t kMaxControlFrameBytes = 64 * 1024;
inline constexpr std::uint32_t kMaxChunkBytes = 8u * 1024u * 1024u;

// UDP discovery datagram.
struct Announcement {
    std::uint8_t version{kProtocolVersion};
    DeviceId device_id{};
    std::string display_name;
    std::uint16_t listen_port{0};
};

std::vector<std::uint8_t> encode_announcement(const Announcement& announcement);
std::optional<Announcement> decode_announcement(std::span<const std::uint8_t> buffer,
                                                ErrorCode* error = nullptr);

enum class MessageType : std::uint8_t {
    Offer = 0x01,
    Accept = 0x02,
    Reject = 0x03,
    ChunkHeader = 0x04,
    Ack = 0x05,
    Complete = 0x06,
    Abort = 0x07,
};

const char* to_string(MessageType type) noexcept;

struct OfferPayload {
    DeviceId sender_id{};
    DeviceId receiver_id{};
    std::string sender_name;
    std::string file_name;
    std::uint64_t file_size{0};
    crypto::ChecksumAlgorithm checksum_algorithm{crypto::ChecksumAlgorithm::Sha256};
    std::vector<std::uint8_t> checksum;
    std::uint32_t chunk_size{0};
};

struct AcceptPayload {};

struct RejectPayload {
    ErrorCode reason{ErrorCode::Declined};
};

// The raw payload of payload_length bytes follows this frame on the stream.
struct ChunkHeaderPayload {
    std::uint64_t sequence{0};
    std::uint32_t payload_length{0};
    bool is_final{false};
};

struct AckPayload {
    std::uint64_t sequence{0};
};

struct CompletePayload {
    std::uint64_t bytes{0};
};

struct AbortPayload {
    ErrorCode reason{ErrorCode::Cancelled};
};

using Payload = std::variant<OfferPayload,
                             AcceptPayload,
                             RejectPayload,
                             ChunkHeaderPayload,
                             AckPayload,
                             CompletePayload,
                             AbortPayload>;

struct ControlMessage {
    std::uint8_t version{kProtocolVersion};
    TransferId transfer_id{0};
    Payload payload{};

    [[nodiscard]] MessageType type() const noexcept;
};

std::vector<std::uint8_t> encode(const ControlMessage& message);
std::optional<ControlMessage> decode(std::span<const std::uint8_t> buffer, ErrorCode* error = nullptr);

bool is_valid_utf8(std::string_view text) noexcept;
std::string truncate_utf8(std::string_view text, std::size_t max_bytes);

}  // namespace lanshare::protocol
