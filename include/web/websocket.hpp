#pragma once

#include <cstdint>
#include <string>

namespace rover {

// Server side of an upgraded RFC 6455 connection. Does not own the socket;
// the HTTP server closes it after the route handler returns.
class WebSocketConnection {
public:
    explicit WebSocketConnection(int fd);

    WebSocketConnection(const WebSocketConnection&) = delete;
    WebSocketConnection& operator=(const WebSocketConnection&) = delete;

    bool isOpen() const { return open_; }

    // Returns false (and marks the connection closed) if the peer is gone.
    bool sendText(const std::string& payload);

    // Services inbound control frames (ping, close) until the steady-clock
    // deadline. Returns isOpen(); a false return means the peer disconnected.
    bool serviceUntil(int64_t deadline_ns);

    void close(uint16_t code = 1000);

    // Value for the Sec-WebSocket-Accept response header.
    static std::string computeAcceptKey(const std::string& client_key);
    // Unmasked server-to-client frame.
    static std::string encodeFrame(uint8_t opcode, const std::string& payload);

private:
    // Drains whatever the socket holds without blocking. False once the peer
    // has hung up or the socket failed.
    bool receiveAvailable();
    // Handles every complete frame in rx_; a partial frame stays buffered.
    bool processBufferedFrames();
    bool handleFrame(uint8_t opcode, const std::string& payload);
    bool sendRaw(const std::string& bytes);

    static constexpr std::size_t kMaxInboundPayload = 1U << 20;

    int fd_{-1};
    bool open_{true};
    std::string rx_;
};

}  // namespace rover
