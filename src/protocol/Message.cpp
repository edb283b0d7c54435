#include "lanshare/protocol/Message.hpp"

#include <cstring>
#include <type_traits>
#include <utility>

namespace lanshare::protocol {

namespace {

constexpr std::size_t kDeviceIdSize = DeviceId{}.size();
constexpr std::size_t kAnnouncementFixedBytes = 1 + kDeviceIdSize + 1 + 2;
constexpr std::size_t kControlHeaderBytes = 1 + 1 + 8;

void write_u16(std::vector<std::uint8_t>& out, std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

void write_u32(std::vector<std::uint8_t>& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

void write_u64(std::vector<std::uint8_t>& out, std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFu));
    }
}

void write_device_id(std::vector<std::uint8_t>& out, const DeviceId& id) {
    out.insert(out.end(), id.begin(), id.end());
}

// Bounds-checked cursor over a received frame.
class Reader {
public:
    explicit Reader(std::span<const std::uint8_t> buffer)
        : buffer_(buffer) {}

    [[nodiscard]] std::size_t remaining() const noexcept { return buffer_.size() - offset_; }

    bool read_u8(std::uint8_t& value) {
        if (remaining() < 1) {
            return false;
        }
        value = buffer_[offset_++];
        return true;
    }

    bool read_u16(std::uint16_t& value) {
        if (remaining() < 2) {
            return false;
        }
        value = static_cast<std::uint16_t>((buffer_[offset_] << 8) | buffer_[offset_ + 1]);
        offset_ += 2;
        return true;
    }

    bool read_u32(std::uint32_t& value) {
        if (remaining() < 4) {
            return false;
        }
        value = 0;
        for (int index = 0; index < 4; ++index) {
            value = (value << 8) | buffer_[offset_++];
        }
        return true;
    }

    bool read_u64(std::uint64_t& value) {
        if (remaining() < 8) {
            return false;
        }
        value = 0;
        for (int index = 0; index < 8; ++index) {
            value = (value << 8) | buffer_[offset_++];
        }
        return true;
    }

    bool read_device_id(DeviceId& id) {
        if (remaining() < id.size()) {
            return false;
        }
        std::memcpy(id.data(), buffer_.data() + offset_, id.size());
        offset_ += id.size();
        return true;
    }

    bool read_string(std::size_t length, std::string& value) {
        if (remaining() < length) {
            return false;
        }
        value.assign(reinterpret_cast<const char*>(buffer_.data() + offset_), length);
        offset_ += length;
        return true;
    }

    bool read_bytes(std::size_t length, std::vector<std::uint8_t>& value) {
        if (remaining() < length) {
            return false;
        }
        value.assign(buffer_.begin() + static_cast<std::ptrdiff_t>(offset_),
                     buffer_.begin() + static_cast<std::ptrdiff_t>(offset_ + length));
        offset_ += length;
        return true;
    }

private:
    std::span<const std::uint8_t> buffer_;
    std::size_t offset_{0};
};

template <typename T>
std::optional<T> fail(ErrorCode* error, ErrorCode code) {
    if (error) {
        *error = code;
    }
    return std::nullopt;
}

std::optional<ErrorCode> read_reason(Reader& reader) {
    std::uint8_t raw = 0;
    if (!reader.read_u8(raw)) {
        return std::nullopt;
    }
    return error_code_from_byte(raw);
}

std::optional<Payload> decode_offer(Reader& reader) {
    OfferPayload offer{};
    std::uint8_t name_length = 0;
    std::uint16_t file_name_length = 0;
    std::uint8_t algorithm = 0;
    std::uint8_t checksum_length = 0;

    if (!reader.read_device_id(offer.sender_id) || !reader.read_device_id(offer.receiver_id) ||
        !reader.read_u8(name_length) || !reader.read_string(name_length, offer.sender_name) ||
        !reader.read_u16(file_name_length) || !reader.read_string(file_name_length, offer.file_name) ||
        !reader.read_u64(offer.file_size) || !reader.read_u8(algorithm) ||
        !reader.read_u8(checksum_length) || !reader.read_bytes(checksum_length, offer.checksum) ||
        !reader.read_u32(offer.chunk_size)) {
        return std::nullopt;
    }

    const auto parsed_algorithm = crypto::checksum_algorithm_from_byte(algorithm);
    if (!parsed_algorithm || crypto::digest_size(*parsed_algorithm) != checksum_length) {
        return std::nullopt;
    }
    offer.checksum_algorithm = *parsed_algorithm;

    if (offer.chunk_size == 0 || offer.chunk_size > kMaxChunkBytes) {
        return std::nullopt;
    }
    if (offer.file_name.empty() || offer.file_name.size() > kMaxFileNameBytes ||
        !is_valid_utf8(offer.file_name) || !is_valid_utf8(offer.sender_name)) {
        return std::nullopt;
    }
    return Payload{std::move(offer)};
}

std::optional<Payload> decode_payload(MessageType type, Reader& reader) {
    switch (type) {
        case MessageType::Offer:
            return decode_offer(reader);
        case MessageType::Accept:
            return Payload{AcceptPayload{}};
        case MessageType::Reject: {
            const auto reason = read_reason(reader);
            if (!reason) {
                return std::nullopt;
            }
            return Payload{RejectPayload{*reason}};
        }
        case MessageType::ChunkHeader: {
            ChunkHeaderPayload header{};
            std::uint8_t is_final = 0;
            if (!reader.read_u64(header.sequence) || !reader.read_u32(header.payload_length) ||
                !reader.read_u8(is_final)) {
                return std::nullopt;
            }
            if (header.payload_length > kMaxChunkBytes || is_final > 1) {
                return std::nullopt;
            }
            header.is_final = is_final == 1;
            return Payload{header};
        }
        case MessageType::Ack: {
            AckPayload ack{};
            if (!reader.read_u64(ack.sequence)) {
                return std::nullopt;
            }
            return Payload{ack};
        }
        case MessageType::Complete: {
            CompletePayload complete{};
            if (!reader.read_u64(complete.bytes)) {
                return std::nullopt;
            }
            return Payload{complete};
        }
        case MessageType::Abort: {
            const auto reason = read_reason(reader);
            if (!reason) {
                return std::nullopt;
            }
            return Payload{AbortPayload{*reason}};
        }
    }
    return std::nullopt;
}

bool is_known_type(std::uint8_t raw) {
    return raw >= static_cast<std::uint8_t>(MessageType::Offer) &&
           raw <= static_cast<std::uint8_t>(MessageType::Abort);
}

}  // namespace

std::vector<std::uint8_t> encode_announcement(const Announcement& announcement) {
    const auto name = truncate_utf8(announcement.display_name, kMaxDisplayNameBytes);

    std::vector<std::uint8_t> out;
    out.reserve(kAnnouncementFixedBytes + name.size());
    out.push_back(announcement.version);
    write_device_id(out, announcement.device_id);
    out.push_back(static_cast<std::uint8_t>(name.size()));
    out.insert(out.end(), name.begin(), name.end());
    write_u16(out, announcement.listen_port);
    return out;
}

std::optional<Announcement> decode_announcement(std::span<const std::uint8_t> buffer, ErrorCode* error) {
    if (buffer.empty()) {
        return fail<Announcement>(error, ErrorCode::MalformedFrame);
    }
    if (buffer[0] != kProtocolVersion) {
        return fail<Announcement>(error, ErrorCode::UnsupportedVersion);
    }
    if (buffer.size() < kAnnouncementFixedBytes) {
        return fail<Announcement>(error, ErrorCode::MalformedFrame);
    }

    Reader reader(buffer);
    Announcement announcement{};
    std::uint8_t name_length = 0;
    reader.read_u8(announcement.version);
    reader.read_device_id(announcement.device_id);
    reader.read_u8(name_length);

    if (buffer.size() != kAnnouncementFixedBytes + name_length) {
        return fail<Announcement>(error, ErrorCode::MalformedFrame);
    }
    if (!reader.read_string(name_length, announcement.display_name) ||
        !reader.read_u16(announcement.listen_port)) {
        return fail<Announcement>(error, ErrorCode::MalformedFrame);
    }
    if (announcement.listen_port == 0 || !is_valid_utf8(announcement.display_name)) {
        return fail<Announcement>(error, ErrorCode::MalformedFrame);
    }
    return announcement;
}

const char* to_string(MessageType type) noexcept {
    switch (type) {
        case MessageType::Offer:
            return "offer";
        case MessageType::Accept:
            return "accept";
        case MessageType::Reject:
            return "reject";
        case MessageType::ChunkHeader:
            return "chunk";
        case MessageType::Ack:
            return "ack";
        case MessageType::Complete:
            return "complete";
        case MessageType::Abort:
            return "abort";
    }
    return "unknown";
}

MessageType ControlMessage::type() const noexcept {
    return std::visit(
        [](const auto& payload) {
            using PayloadType = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<PayloadType, OfferPayload>) {
                return MessageType::Offer;
            } else if constexpr (std::is_same_v<PayloadType, AcceptPayload>) {
                return MessageType::Accept;
            } else if constexpr (std::is_same_v<PayloadType, RejectPayload>) {
                return MessageType::Reject;
            } else if constexpr (std::is_same_v<PayloadType, ChunkHeaderPayload>) {
                return MessageType::ChunkHeader;
            } else if constexpr (std::is_same_v<PayloadType, AckPayload>) {
                return MessageType::Ack;
            } else if constexpr (std::is_same_v<PayloadType, CompletePayload>) {
                return MessageType::Complete;
            } else {
                return MessageType::Abort;
            }
        },
        payload);
}

std::vector<std::uint8_t> encode(const ControlMessage& message) {
    std::vector<std::uint8_t> out;
    out.reserve(64);
    out.push_back(message.version);
    out.push_back(static_cast<std::uint8_t>(message.type()));
    write_u64(out, message.transfer_id);

    std::visit(
        [&](const auto& payload) {
            using PayloadType = std::decay_t<decltype(payload)>;

            if constexpr (std::is_same_v<PayloadType, OfferPayload>) {
                const auto sender_name = truncate_utf8(payload.sender_name, kMaxDisplayNameBytes);
                const auto file_name = truncate_utf8(payload.file_name, kMaxFileNameBytes);
                write_device_id(out, payload.sender_id);
                write_device_id(out, payload.receiver_id);
                out.push_back(static_cast<std::uint8_t>(sender_name.size()));
                out.insert(out.end(), sender_name.begin(), sender_name.end());
                write_u16(out, static_cast<std::uint16_t>(file_name.size()));
                out.insert(out.end(), file_name.begin(), file_name.end());
                write_u64(out, payload.file_size);
                out.push_back(static_cast<std::uint8_t>(payload.checksum_algorithm));
                out.push_back(static_cast<std::uint8_t>(payload.checksum.size()));
                out.insert(out.end(), payload.checksum.begin(), payload.checksum.end());
                write_u32(out, payload.chunk_size);
            } else if constexpr (std::is_same_v<PayloadType, RejectPayload> ||
                                 std::is_same_v<PayloadType, AbortPayload>) {
                out.push_back(static_cast<std::uint8_t>(payload.reason));
            } else if constexpr (std::is_same_v<PayloadType, ChunkHeaderPayload>) {
                write_u64(out, payload.sequence);
                write_u32(out, payload.payload_length);
                out.push_back(static_cast<std::uint8_t>(payload.is_final ? 1 : 0));
            } else if constexpr (std::is_same_v<PayloadType, AckPayload>) {
                write_u64(out, payload.sequence);
            } else if constexpr (std::is_same_v<PayloadType, CompletePayload>) {
                write_u64(out, payload.bytes);
            }
        },
        message.payload);

    return out;
}

std::optional<ControlMessage> decode(std::span<const std::uint8_t> buffer, ErrorCode* error) {
    if (buffer.empty()) {
        return fail<ControlMessage>(error, ErrorCode::MalformedFrame);
    }
    if (buffer[0] != kProtocolVersion) {
        return fail<ControlMessage>(error, ErrorCode::UnsupportedVersion);
    }
    if (buffer.size() < kControlHeaderBytes || buffer.size() > kMaxControlFrameBytes) {
        return fail<ControlMessage>(error, ErrorCode::MalformedFrame);
    }

    Reader reader(buffer);
    ControlMessage message{};
    std::uint8_t raw_type = 0;
    reader.read_u8(message.version);
    reader.read_u8(raw_type);
    reader.read_u64(message.transfer_id);

    if (!is_known_type(raw_type)) {
        return fail<ControlMessage>(error, ErrorCode::MalformedFrame);
    }

    auto payload = decode_payload(static_cast<MessageType>(raw_type), reader);
    if (!payload || reader.remaining() != 0) {
        return fail<ControlMessage>(error, ErrorCode::MalformedFrame);
    }

    message.payload = std::move(*payload);
    return message;
}

bool is_valid_utf8(std::string_view text) noexcept {
    std::size_t index = 0;
    while (index < text.size()) {
        const auto lead = static_cast<unsigned char>(text[index]);
        std::size_t extra = 0;
        std::uint32_t code_point = 0;
        if (lead < 0x80) {
            ++index;
            continue;
        } else if ((lead & 0xE0u) == 0xC0u) {
            extra = 1;
            code_point = lead & 0x1Fu;
        } else if ((lead & 0xF0u) == 0xE0u) {
            extra = 2;
            code_point = lead & 0x0Fu;
        } else if ((lead & 0xF8u) == 0xF0u) {
            extra = 3;
            code_point = lead & 0x07u;
        } else {
            return false;
        }

        if (index + extra >= text.size()) {
            return false;
        }
        for (std::size_t offset = 1; offset <= extra; ++offset) {
            const auto next = static_cast<unsigned char>(text[index + offset]);
            if ((next & 0xC0u) != 0x80u) {
                return false;
            }
            code_point = (code_point << 6) | (next & 0x3Fu);
        }

        // Overlong forms, surrogates and values past U+10FFFF.
        if ((extra == 1 && code_point < 0x80) || (extra == 2 && code_point < 0x800) ||
            (extra == 3 && code_point < 0x10000) || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        index += extra + 1;
    }
    return true;
}

std::string truncate_utf8(std::string_view text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return std::string(text);
    }
    auto cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0u) == 0x80u) {
        --cut;
    }
    return std::string(text.substr(0, cut));
}

}  // namespace lanshare::protocol
