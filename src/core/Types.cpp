#include "lanshare/Types.hpp"
#include "lanshare/Error.hpp"

#include <iomanip>
#include <optional>
#include <sstream>

namespace lanshare {

namespace {
std::string to_hex(const std::uint8_t value) {
    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setw(2) << std::setfill('0') << static_cast<int>(value);
    return oss.str();
}

int hex_digit(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

}  // namespace

std::string device_id_to_string(const DeviceId& id) {
    std::ostringstream oss;
    for (const auto byte : id) {
        oss << to_hex(byte);
    }
    return oss.str();
}

std::optional<DeviceId> device_id_from_string(const std::string& text) {
    if (text.size() != DeviceId{}.size() * 2) {
        return std::nullopt;
    }

    DeviceId id{};
    for (std::size_t index = 0; index < id.size(); ++index) {
        const auto high = hex_digit(text[index * 2]);
        const auto low = hex_digit(text[index * 2 + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        id[index] = static_cast<std::uint8_t>((high << 4) | low);
    }
    return id;
}

std::string transfer_id_to_string(TransferId id) {
    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setw(16) << std::setfill('0') << id;
    return oss.str();
}

const char* to_string(PeerStatus status) noexcept {
    switch (status) {
        case PeerStatus::Online:
            return "online";
        case PeerStatus::Stale:
            return "stale";
    }
    return "unknown";
}

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::MalformedFrame:
            return "malformed_frame";
        case ErrorCode::UnsupportedVersion:
            return "unsupported_version";
        case ErrorCode::PeerUnreachable:
            return "peer_unreachable";
        case ErrorCode::Busy:
            return "busy";
        case ErrorCode::HandshakeTimeout:
            return "handshake_timeout";
        case ErrorCode::ChecksumMismatch:
            return "checksum_mismatch";
        case ErrorCode::SequencingError:
            return "sequencing_error";
        case ErrorCode::Timeout:
            return "timeout";
        case ErrorCode::IOFailure:
            return "io_failure";
        case ErrorCode::Cancelled:
            return "cancelled";
        case ErrorCode::Declined:
            return "declined";
    }
    return "unknown";
}

std::optional<ErrorCode> error_code_from_byte(std::uint8_t value) noexcept {
    if (value < static_cast<std::uint8_t>(ErrorCode::MalformedFrame) ||
        value > static_cast<std::uint8_t>(ErrorCode::Declined)) {
        return std::nullopt;
    }
    return static_cast<ErrorCode>(value);
}

}  // namespace lanshare
