#include "lanshare/network/Socket.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <stdexcept>
#include <utility>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#include <cerrno>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace lanshare::network {

namespace {

#ifdef _WIN32
using NativeSocket = SOCKET;
constexpr NativeSocket kInvalidNativeSocket = INVALID_SOCKET;
constexpr int kSendFlags = 0;

class WinsockRuntime {
public:
    WinsockRuntime() {
        WSADATA data{};
        if (WSAStartup(MAKEWORD(2, 2), &data) != 0) {
            throw std::runtime_error("WSAStartup failed");
        }
    }

    ~WinsockRuntime() {
        WSACleanup();
    }
};

inline int last_network_error() {
    return WSAGetLastError();
}

inline bool would_block(int error) {
    return error == WSAEWOULDBLOCK || error == WSAEINTR;
}
#else
using NativeSocket = int;
constexpr NativeSocket kInvalidNativeSocket = -1;
#ifdef MSG_NOSIGNAL
constexpr int kSendFlags = MSG_NOSIGNAL;
#else
constexpr int kSendFlags = 0;
#endif

#ifdef MSG_DONTWAIT
constexpr int kWatchedSendFlags = kSendFlags | MSG_DONTWAIT;
#else
constexpr int kWatchedSendFlags = kSendFlags;
#endif

inline int last_network_error() {
    return errno;
}

inline bool would_block(int error) {
    return error == EAGAIN || error == EWOULDBLOCK || error == EINTR;
}
#endif

constexpr std::size_t kWatchedPieceBytes = 16 * 1024;

std::array<std::uint8_t, 4> frame_prefix(std::size_t size) {
    const auto length = static_cast<std::uint32_t>(size);
    return {static_cast<std::uint8_t>((length >> 24) & 0xFFu),
            static_cast<std::uint8_t>((length >> 16) & 0xFFu),
            static_cast<std::uint8_t>((length >> 8) & 0xFFu),
            static_cast<std::uint8_t>(length & 0xFFu)};
}

NativeSocket to_native(SocketHandle handle) {
    return static_cast<NativeSocket>(handle);
}

SocketHandle from_native(NativeSocket socket) {
    if (socket == kInvalidNativeSocket) {
        return kInvalidSocket;
    }
    return static_cast<SocketHandle>(socket);
}

void close_native(SocketHandle handle) {
    if (handle == kInvalidSocket) {
        return;
    }
    auto socket = to_native(handle);
#ifdef _WIN32
    ::shutdown(socket, SD_BOTH);
    ::closesocket(socket);
#else
    ::shutdown(socket, SHUT_RDWR);
    ::close(socket);
#endif
}

bool set_non_blocking(NativeSocket socket, bool enable) {
#ifdef _WIN32
    u_long mode = enable ? 1 : 0;
    return ioctlsocket(socket, FIONBIO, &mode) == 0;
#else
    int flags = fcntl(socket, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    flags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return fcntl(socket, F_SETFL, flags) == 0;
#endif
}

bool set_reuse_address(NativeSocket socket) {
    int opt = 1;
    return ::setsockopt(socket, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&opt), sizeof(opt)) == 0;
}

bool set_socket_timeout(NativeSocket socket, int option, std::chrono::milliseconds timeout) {
#ifdef _WIN32
    DWORD value = static_cast<DWORD>(timeout.count());
    return ::setsockopt(socket, SOL_SOCKET, option, reinterpret_cast<const char*>(&value), sizeof(value)) == 0;
#else
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return ::setsockopt(socket, SOL_SOCKET, option, reinterpret_cast<const char*>(&tv), sizeof(tv)) == 0;
#endif
}

// Waits for readability (or writability) with select().
int wait_socket(NativeSocket socket, bool for_write, std::chrono::milliseconds timeout) {
    fd_set set;
    FD_ZERO(&set);
    FD_SET(socket, &set);
    timeval tv{};
    tv.tv_sec = static_cast<long>(timeout.count() / 1000);
    tv.tv_usec = static_cast<long>((timeout.count() % 1000) * 1000);
#ifdef _WIN32
    return ::select(0, for_write ? nullptr : &set, for_write ? &set : nullptr, nullptr, &tv);
#else
    return ::select(socket + 1, for_write ? nullptr : &set, for_write ? &set : nullptr, nullptr, &tv);
#endif
}

std::optional<sockaddr_in> resolve_ipv4(const std::string& host, std::uint16_t port, int socktype) {
    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_port = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &address.sin_addr) == 1) {
        return address;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = socktype;

    addrinfo* result = nullptr;
    if (const auto err = ::getaddrinfo(host.c_str(), nullptr, &hints, &result); err != 0 || result == nullptr) {
        if (result) {
            ::freeaddrinfo(result);
        }
        return std::nullopt;
    }
    address.sin_addr = reinterpret_cast<sockaddr_in*>(result->ai_addr)->sin_addr;
    ::freeaddrinfo(result);
    return address;
}

std::string address_text(const in_addr& address) {
    char buffer[INET_ADDRSTRLEN]{};
    const char* text = ::inet_ntop(AF_INET, &address, buffer, sizeof(buffer));
    return text ? std::string(text) : std::string("unknown");
}

std::uint16_t bound_port(NativeSocket socket, std::uint16_t fallback) {
    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(socket, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        return ntohs(bound.sin_port);
    }
    return fallback;
}

}  // namespace

void ensure_network_runtime() {
#ifdef _WIN32
    static WinsockRuntime runtime;
    (void)runtime;
#endif
}

TcpConnection::TcpConnection(SocketHandle handle)
    : handle_(handle) {}

TcpConnection::~TcpConnection() {
    close();
}

TcpConnection::TcpConnection(TcpConnection&& other) noexcept
    : handle_(std::exchange(other.handle_, kInvalidSocket)) {}

TcpConnection& TcpConnection::operator=(TcpConnection&& other) noexcept {
    if (this != &other) {
        close();
        handle_ = std::exchange(other.handle_, kInvalidSocket);
    }
    return *this;
}

std::optional<TcpConnection> TcpConnection::connect(const std::string& host,
                                                    std::uint16_t port,
                                                    std::chrono::milliseconds timeout) {
    ensure_network_runtime();
    const auto address = resolve_ipv4(host, port, SOCK_STREAM);
    if (!address) {
        return std::nullopt;
    }

    NativeSocket socket = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (socket == kInvalidNativeSocket) {
        return std::nullopt;
    }
    TcpConnection connection(from_native(socket));

    if (!set_non_blocking(socket, true)) {
        return std::nullopt;
    }

    if (::connect(socket, reinterpret_cast<const sockaddr*>(&*address), sizeof(*address)) < 0) {
        const auto error = last_network_error();
#ifdef _WIN32
        const bool pending = error == WSAEWOULDBLOCK || error == WSAEINPROGRESS;
#else
        const bool pending = error == EINPROGRESS || error == EWOULDBLOCK;
#endif
        if (!pending || wait_socket(socket, true, timeout) <= 0) {
            return std::nullopt;
        }

        int socket_error = 0;
        socklen_t len = sizeof(socket_error);
        if (::getsockopt(socket, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&socket_error), &len) < 0 ||
            socket_error != 0) {
            return std::nullopt;
        }
    }

    if (!set_non_blocking(socket, false)) {
        return std::nullopt;
    }
    return connection;
}

bool TcpConnection::send_all(std::span<const std::uint8_t> data) {
    if (!valid()) {
        return false;
    }
    auto socket = to_native(handle_);
    std::size_t sent_total = 0;
    while (sent_total < data.size()) {
#ifdef _WIN32
        const auto sent = ::send(socket, reinterpret_cast<const char*>(data.data() + sent_total),
                                 static_cast<int>(data.size() - sent_total), kSendFlags);
#else
        const auto sent = ::send(socket, reinterpret_cast<const char*>(data.data() + sent_total),
                                 data.size() - sent_total, kSendFlags);
#endif
        if (sent <= 0) {
            return false;
        }
        sent_total += static_cast<std::size_t>(sent);
    }
    return true;
}

TcpConnection::WriteStatus TcpConnection::send_all(std::span<const std::uint8_t> data, const WriteWatch& watch) {
    if (!valid()) {
        return WriteStatus::Error;
    }
    auto socket = to_native(handle_);
    std::size_t sent_total = 0;
    auto last_progress = std::chrono::steady_clock::now();
    while (sent_total < data.size()) {
        const int ready = wait_socket(socket, true, watch.slice);
        if (ready < 0) {
            return WriteStatus::Error;
        }
        if (ready == 0) {
            if (watch.interrupted && watch.interrupted()) {
                return WriteStatus::Interrupted;
            }
            if (std::chrono::steady_clock::now() - last_progress > watch.stall_timeout) {
                return WriteStatus::TimedOut;
            }
            continue;
        }

        const auto piece = std::min(data.size() - sent_total, kWatchedPieceBytes);
#ifdef _WIN32
        const auto sent = ::send(socket, reinterpret_cast<const char*>(data.data() + sent_total),
                                 static_cast<int>(piece), kSendFlags);
#else
        const auto sent = ::send(socket, reinterpret_cast<const char*>(data.data() + sent_total),
                                 piece, kWatchedSendFlags);
#endif
        if (sent < 0 && would_block(last_network_error())) {
            continue;
        }
        if (sent <= 0) {
            return WriteStatus::Error;
        }
        sent_total += static_cast<std::size_t>(sent);
        last_progress = std::chrono::steady_clock::now();
    }
    return WriteStatus::Ok;
}

bool TcpConnection::recv_all(std::uint8_t* buffer, std::size_t length) {
    if (!valid()) {
        return false;
    }
    auto socket = to_native(handle_);
    std::size_t received_total = 0;
    while (received_total < length) {
#ifdef _WIN32
        const auto received = ::recv(socket, reinterpret_cast<char*>(buffer + received_total),
                                     static_cast<int>(length - received_total), 0);
#else
        const auto received = ::recv(socket, reinterpret_cast<char*>(buffer + received_total),
                                     length - received_total, 0);
#endif
        if (received <= 0) {
            return false;
        }
        received_total += static_cast<std::size_t>(received);
    }
    return true;
}

bool TcpConnection::send_frame(std::span<const std::uint8_t> frame) {
    const auto prefix = frame_prefix(frame.size());
    return send_all(prefix) && send_all(frame);
}

TcpConnection::WriteStatus TcpConnection::send_frame(std::span<const std::uint8_t> frame, const WriteWatch& watch) {
    const auto prefix = frame_prefix(frame.size());
    const auto status = send_all(prefix, watch);
    if (status != WriteStatus::Ok) {
        return status;
    }
    return send_all(frame, watch);
}

TcpConnection::ReadStatus TcpConnection::receive_frame(std::vector<std::uint8_t>& frame, std::size_t max_length) {
    if (!valid()) {
        return ReadStatus::Error;
    }

    std::array<std::uint8_t, 4> prefix{};
    const auto first = ::recv(to_native(handle_), reinterpret_cast<char*>(prefix.data()), 1, 0);
    if (first == 0) {
        return ReadStatus::Closed;
    }
    if (first < 0 || !recv_all(prefix.data() + 1, prefix.size() - 1)) {
        return ReadStatus::Error;
    }

    const auto length = (static_cast<std::uint32_t>(prefix[0]) << 24) |
                        (static_cast<std::uint32_t>(prefix[1]) << 16) |
                        (static_cast<std::uint32_t>(prefix[2]) << 8) |
                        static_cast<std::uint32_t>(prefix[3]);
    if (length > max_length) {
        return ReadStatus::TooLarge;
    }

    frame.resize(length);
    if (length > 0 && !recv_all(frame.data(), frame.size())) {
        return ReadStatus::Error;
    }
    return ReadStatus::Ok;
}

bool TcpConnection::wait_readable(std::chrono::milliseconds timeout) const {
    if (!valid()) {
        return false;
    }
    return wait_socket(to_native(handle_), false, timeout) > 0;
}

bool TcpConnection::set_recv_timeout(std::chrono::milliseconds timeout) {
    return valid() && set_socket_timeout(to_native(handle_), SO_RCVTIMEO, timeout);
}

bool TcpConnection::set_send_timeout(std::chrono::milliseconds timeout) {
    return valid() && set_socket_timeout(to_native(handle_), SO_SNDTIMEO, timeout);
}

std::string TcpConnection::remote_address() const {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (valid() && ::getpeername(to_native(handle_), reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        return address_text(addr.sin_addr);
    }
    return "unknown";
}

std::string TcpConnection::remote_endpoint() const {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (valid() && ::getpeername(to_native(handle_), reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        return address_text(addr.sin_addr) + ":" + std::to_string(ntohs(addr.sin_port));
    }
    return "unknown";
}

void TcpConnection::graceful_close(std::chrono::milliseconds timeout) {
    if (!valid()) {
        return;
    }
    auto socket = to_native(handle_);
#ifdef _WIN32
    ::shutdown(socket, SD_SEND);
#else
    ::shutdown(socket, SHUT_WR);
#endif

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<char, 4096> sink{};
    while (std::chrono::steady_clock::now() < deadline) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (wait_socket(socket, false, remaining) <= 0) {
            break;
        }
#ifdef _WIN32
        const auto received = ::recv(socket, sink.data(), static_cast<int>(sink.size()), 0);
#else
        const auto received = ::recv(socket, sink.data(), sink.size(), 0);
#endif
        if (received <= 0) {
            break;
        }
    }
    close();
}

void TcpConnection::close() {
    close_native(std::exchange(handle_, kInvalidSocket));
}

TcpListener::~TcpListener() {
    close();
}

void TcpListener::listen(const std::string& host, std::uint16_t port) {
    ensure_network_runtime();
    close();

    const auto address = resolve_ipv4(host.empty() ? std::string("0.0.0.0") : host, port, SOCK_STREAM);
    if (!address) {
        throw std::runtime_error("Unable to resolve listen address " + host);
    }

    NativeSocket socket = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (socket == kInvalidNativeSocket) {
        throw std::runtime_error("Failed to create listen socket");
    }

    if (!set_reuse_address(socket)) {
        close_native(from_native(socket));
        throw std::runtime_error("Failed to configure listen socket");
    }

    if (::bind(socket, reinterpret_cast<const sockaddr*>(&*address), sizeof(*address)) < 0) {
        const auto error = last_network_error();
        close_native(from_native(socket));
        throw std::runtime_error("Failed to bind TCP port " + std::to_string(port) + ": error " + std::to_string(error));
    }

    if (::listen(socket, SOMAXCONN) < 0) {
        const auto error = last_network_error();
        close_native(from_native(socket));
        throw std::runtime_error("Failed to listen on TCP port " + std::to_string(port) + ": error " + std::to_string(error));
    }

    port_ = bound_port(socket, port);
    handle_ = from_native(socket);
}

std::optional<TcpConnection> TcpListener::accept(std::chrono::milliseconds timeout) {
    if (!is_open() || wait_socket(to_native(handle_), false, timeout) <= 0) {
        return std::nullopt;
    }

    sockaddr_in remote{};
    socklen_t len = sizeof(remote);
    NativeSocket client = ::accept(to_native(handle_), reinterpret_cast<sockaddr*>(&remote), &len);
    if (client == kInvalidNativeSocket) {
        return std::nullopt;
    }
    return TcpConnection(from_native(client));
}

void TcpListener::close() {
    close_native(std::exchange(handle_, kInvalidSocket));
}

UdpSocket::~UdpSocket() {
    close();
}

void UdpSocket::bind(std::uint16_t port) {
    ensure_network_runtime();
    close();

    NativeSocket socket = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (socket == kInvalidNativeSocket) {
        throw std::runtime_error("Failed to create UDP socket");
    }

    int enable = 1;
    if (!set_reuse_address(socket) ||
        ::setsockopt(socket, SOL_SOCKET, SO_BROADCAST, reinterpret_cast<const char*>(&enable), sizeof(enable)) < 0) {
        close_native(from_native(socket));
        throw std::runtime_error("Failed to configure UDP socket");
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);
    if (::bind(socket, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        const auto error = last_network_error();
        close_native(from_native(socket));
        throw std::runtime_error("Failed to bind UDP port " + std::to_string(port) + ": error " + std::to_string(error));
    }

    port_ = bound_port(socket, port);
    handle_ = from_native(socket);
}

bool UdpSocket::send_to(const std::string& host, std::uint16_t port, std::span<const std::uint8_t> data) {
    if (!is_open()) {
        return false;
    }
    const auto address = resolve_ipv4(host, port, SOCK_DGRAM);
    if (!address) {
        return false;
    }
#ifdef _WIN32
    const auto sent = ::sendto(to_native(handle_), reinterpret_cast<const char*>(data.data()),
                               static_cast<int>(data.size()), 0,
                               reinterpret_cast<const sockaddr*>(&*address), sizeof(*address));
#else
    const auto sent = ::sendto(to_native(handle_), reinterpret_cast<const char*>(data.data()), data.size(), 0,
                               reinterpret_cast<const sockaddr*>(&*address), sizeof(*address));
#endif
    return sent == static_cast<decltype(sent)>(data.size());
}

std::optional<UdpSocket::Datagram> UdpSocket::receive_from(std::chrono::milliseconds timeout) {
    if (!is_open() || wait_socket(to_native(handle_), false, timeout) <= 0) {
        return std::nullopt;
    }

    std::array<std::uint8_t, 2048> buffer{};
    sockaddr_in source{};
    socklen_t len = sizeof(source);
#ifdef _WIN32
    const auto received = ::recvfrom(to_native(handle_), reinterpret_cast<char*>(buffer.data()),
                                     static_cast<int>(buffer.size()), 0,
                                     reinterpret_cast<sockaddr*>(&source), &len);
#else
    const auto received = ::recvfrom(to_native(handle_), reinterpret_cast<char*>(buffer.data()), buffer.size(), 0,
                                     reinterpret_cast<sockaddr*>(&source), &len);
#endif
    if (received < 0) {
        return std::nullopt;
    }

    Datagram datagram{};
    datagram.data.assign(buffer.begin(), buffer.begin() + received);
    datagram.address = address_text(source.sin_addr);
    datagram.port = ntohs(source.sin_port);
    return datagram;
}

void UdpSocket::close() {
    close_native(std::exchange(handle_, kInvalidSocket));
}

}  // namespace lanshare::network
