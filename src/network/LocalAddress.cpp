#include "lanshare/network/LocalAddress.hpp"

#include "lanshare/network/Socket.hpp"

#include <cstdint>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace lanshare::network {

namespace {

constexpr const char* kFallbackAddress = "127.0.0.1";
constexpr const char* kProbeAddress = "8.8.8.8";
constexpr std::uint16_t kProbePort = 80;

#ifdef _WIN32
void close_probe(SOCKET socket) {
    ::closesocket(socket);
}
#else
void close_probe(int socket) {
    ::close(socket);
}
#endif

}  // namespace

std::string detect_local_address() {
    ensure_network_runtime();

    const auto socket = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
#ifdef _WIN32
    if (socket == INVALID_SOCKET) {
        return kFallbackAddress;
    }
#else
    if (socket < 0) {
        return kFallbackAddress;
    }
#endif

    sockaddr_in probe{};
    probe.sin_family = AF_INET;
    probe.sin_port = htons(kProbePort);
    ::inet_pton(AF_INET, kProbeAddress, &probe.sin_addr);

    std::string result = kFallbackAddress;
    if (::connect(socket, reinterpret_cast<const sockaddr*>(&probe), sizeof(probe)) == 0) {
        sockaddr_in local{};
        socklen_t len = sizeof(local);
        if (::getsockname(socket, reinterpret_cast<sockaddr*>(&local), &len) == 0 &&
            local.sin_addr.s_addr != htonl(INADDR_ANY)) {
            char buffer[INET_ADDRSTRLEN]{};
            if (::inet_ntop(AF_INET, &local.sin_addr, buffer, sizeof(buffer))) {
                result = buffer;
            }
        }
    }
    close_probe(socket);
    return result;
}

}  // namespace lanshare::network
