#pragma once

#include "lanshare/Export.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace lanshare {

enum class ErrorCode : std::uint8_t {
    MalformedFrame = 1,
    UnsupportedVersion = 2,
    PeerUnreachable = 3,
    Busy = 4,
    HandshakeTimeout = 5,
    ChecksumMismatch = 6,
    SequencingError = 7,
    Timeout = 8,
    IOFailure = 9,
    Cancelled = 10,
    Declined = 11,
};

const char* to_string(ErrorCode code) noexcept;
std::optional<ErrorCode> error_code_from_byte(std::uint8_t value) noexcept;

// Thrown by the synchronous part of engine calls.
class LANSHARE_API EngineError : public std::runtime_error {
public:
    EngineError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

}  // namespace lanshare
