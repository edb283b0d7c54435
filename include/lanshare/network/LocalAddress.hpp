#pragma once

#include <string>

namespace lanshare::network {

// IPv4 address of the interface that routes off-host, or 127.0.0.1 when none does.
// Uses a connected UDP socket; no packet is sent.
std::string detect_local_address();

}  // namespace lanshare::network
