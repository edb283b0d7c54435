#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace lanshare::network {

using SocketHandle = std::intptr_t;
inline constexpr SocketHandle kInvalidSocket = -1;

// Starts Winsock once per process; no-op elsewhere.
void ensure_network_runtime();

// Blocking TCP stream carrying length-prefixed frames. Move-only, closes on destruction.
class TcpConnection {
public:
    enum class ReadStatus {
        Ok,
        Closed,
        TooLarge,
        Error
    };

    enum class WriteStatus {
        Ok,
        Interrupted,
        TimedOut,
        Error
    };

    // Bounds a write to a peer that stopped reading. While the socket stays
    // unwritable the writer wakes every `slice`, gives up with Interrupted
    // once `interrupted` returns true and with TimedOut after `stall_timeout`
    // without progress.
    struct WriteWatch {
        std::chrono::milliseconds slice{100};
        std::chrono::milliseconds stall_timeout{std::chrono::seconds(30)};
        std::function<bool()> interrupted;
    };

    TcpConnection() = default;
    explicit TcpConnection(SocketHandle handle);
    ~TcpConnection();

    TcpConnection(TcpConnection&& other) noexcept;
    TcpConnection& operator=(TcpConnection&& other) noexcept;
    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    static std::optional<TcpConnection> connect(const std::string& host,
                                                std::uint16_t port,
                                                std::chrono::milliseconds timeout);

    [[nodiscard]] bool valid() const noexcept { return handle_ != kInvalidSocket; }

    bool send_all(std::span<const std::uint8_t> data);
    WriteStatus send_all(std::span<const std::uint8_t> data, const WriteWatch& watch);
    bool recv_all(std::uint8_t* buffer, std::size_t length);

    // 4-byte big-endian length prefix followed by the frame body.
    bool send_frame(std::span<const std::uint8_t> frame);
    WriteStatus send_frame(std::span<const std::uint8_t> frame, const WriteWatch& watch);
    ReadStatus receive_frame(std::vector<std::uint8_t>& frame, std::size_t max_length);

    // True when data (or EOF) is ready within the timeout.
    bool wait_readable(std::chrono::milliseconds timeout) const;

    bool set_recv_timeout(std::chrono::milliseconds timeout);
    bool set_send_timeout(std::chrono::milliseconds timeout);

    [[nodiscard]] std::string remote_address() const;
    [[nodiscard]] std::string remote_endpoint() const;

    // Half-closes, then discards inbound bytes until EOF or the timeout so the
    // peer reads our last frames instead of a reset.
    void graceful_close(std::chrono::milliseconds timeout);
    void close();

private:
    SocketHandle handle_{kInvalidSocket};
};

class TcpListener {
public:
    TcpListener() = default;
    ~TcpListener();

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    // Throws std::runtime_error when the port cannot be bound.
    void listen(const std::string& host, std::uint16_t port);

    // Returns std::nullopt when nothing arrived within the timeout.
    std::optional<TcpConnection> accept(std::chrono::milliseconds timeout);

    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }
    [[nodiscard]] bool is_open() const noexcept { return handle_ != kInvalidSocket; }
    void close();

private:
    SocketHandle handle_{kInvalidSocket};
    std::uint16_t port_{0};
};

class UdpSocket {
public:
    struct Datagram {
        std::vector<std::uint8_t> data;
        std::string address;
        std::uint16_t port{0};
    };

    UdpSocket() = default;
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    // Binds on all interfaces with SO_REUSEADDR and SO_BROADCAST. Throws std::runtime_error.
    void bind(std::uint16_t port);

    bool send_to(const std::string& host, std::uint16_t port, std::span<const std::uint8_t> data);
    std::optional<Datagram> receive_from(std::chrono::milliseconds timeout);

    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }
    [[nodiscard]] bool is_open() const noexcept { return handle_ != kInvalidSocket; }
    void close();

private:
    SocketHandle handle_{kInvalidSocket};
    std::uint16_t port_{0};
};

}  // namespace lanshare::network
