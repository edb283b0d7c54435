#pragma once

#include "lanshare/Types.hpp"
#include "lanshare/transfer/TransferTypes.hpp"

#include <functional>
#include <optional>

namespace lanshare {

enum class EventKind {
    PeerOnline,
    PeerStale,
    PeerRemoved,
    OfferReceived,
    StateChanged,
    Progress
};

const char* to_string(EventKind kind) noexcept;

struct EngineEvent {
    EventKind kind{EventKind::PeerOnline};
    std::optional<PeerRecord> peer{};
    std::optional<transfer::TransferStatus> transfer{};
};

using EventCallback = std::function<void(const EngineEvent&)>;

}  // namespace lanshare
