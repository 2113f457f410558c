#include "web/websocket.hpp"

#include <cerrno>

#include <openssl/evp.h>
#include <poll.h>
#include <sys/socket.h>

#include "core/base64.hpp"
#include "core/time_utils.hpp"

namespace rover {

namespace {

constexpr uint8_t kOpContinuation = 0x0;
constexpr uint8_t kOpText = 0x1;
constexpr uint8_t kOpBinary = 0x2;
constexpr uint8_t kOpClose = 0x8;
constexpr uint8_t kOpPing = 0x9;
constexpr uint8_t kOpPong = 0xA;

const char* const kHandshakeGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

}  // namespace

WebSocketConnection::WebSocketConnection(int fd) : fd_(fd) {}

std::string WebSocketConnection::computeAcceptKey(const std::string& client_key) {
    const std::string s = client_key + kHandshakeGuid;
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(s.data(), s.size(), digest, &digest_len, EVP_sha1(), nullptr) != 1) {
        return {};
    }
    return base64Encode(digest, digest_len);
}

std::string WebSocketConnection::encodeFrame(uint8_t opcode, const std::string& payload) {
    std::string out;
    out.reserve(payload.size() + 10U);
    out.push_back(static_cast<char>(0x80U | (opcode & 0x0FU)));
    const uint64_t len = payload.size();
    if (len < 126U) {
        out.push_back(static_cast<char>(len));
    } else if (len <= 0xFFFFU) {
        out.push_back(static_cast<char>(126));
        out.push_back(static_cast<char>((len >> 8) & 0xFFU));
        out.push_back(static_cast<char>(len & 0xFFU));
    } else {
        out.push_back(static_cast<char>(127));
        for (int shift = 56; shift >= 0; shift -= 8) {
            out.push_back(static_cast<char>((len >> shift) & 0xFFU));
        }
    }
    out += payload;
    return out;
}

bool WebSocketConnection::sendRaw(const std::string& bytes) {
    std::size_t sent = 0;
    while (sent < bytes.size()) {
        const ssize_t n = ::send(fd_, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            open_ = false;
            return false;
        }
        sent += static_cast<std::size_t>(n);
    }
    return true;
}

bool WebSocketConnection::sendText(const std::string& payload) {
    if (!open_) {
        return false;
    }
    return sendRaw(encodeFrame(kOpText, payload));
}

bool WebSocketConnection::receiveAvailable() {
    char buf[4096];
    // One maximal frame at most; the rest stays in the kernel until processed.
    while (rx_.size() < kMaxInboundPayload + 14U) {
        const ssize_t n = ::recv(fd_, buf, sizeof(buf), MSG_DONTWAIT);
        if (n > 0) {
            rx_.append(buf, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            open_ = false;
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        open_ = false;
        return false;
    }
    return true;
}

bool WebSocketConnection::processBufferedFrames() {
    while (open_) {
        const auto* p = reinterpret_cast<const unsigned char*>(rx_.data());
        const std::size_t avail = rx_.size();
        if (avail < 2U) {
            return true;
        }
        const uint8_t opcode = p[0] & 0x0FU;
        const bool masked = (p[1] & 0x80U) != 0U;
        uint64_t len = p[1] & 0x7FU;
        std::size_t header = 2U;
        if (len == 126U) {
            header += 2U;
            if (avail < header) {
                return true;
            }
            len = (static_cast<uint64_t>(p[2]) << 8) | p[3];
        } else if (len == 127U) {
            header += 8U;
            if (avail < header) {
                return true;
            }
            len = 0;
            for (std::size_t i = 2; i < 10U; ++i) {
                len = (len << 8) | p[i];
            }
        }
        if (len > kMaxInboundPayload) {
            close(1009);
            return false;
        }
        const std::size_t mask_at = header;
        if (masked) {
            header += 4U;
        }
        const std::size_t total = header + static_cast<std::size_t>(len);
        if (avail < total) {
            return true;
        }

        std::string payload = rx_.substr(header, static_cast<std::size_t>(len));
        if (masked) {
            for (std::size_t i = 0; i < payload.size(); ++i) {
                payload[i] = static_cast<char>(static_cast<unsigned char>(payload[i]) ^ p[mask_at + (i % 4U)]);
            }
        }
        rx_.erase(0, total);
        if (!handleFrame(opcode, payload)) {
            return false;
        }
    }
    return false;
}

bool WebSocketConnection::handleFrame(uint8_t opcode, const std::string& payload) {
    switch (opcode) {
        case kOpClose:
            close(1000);
            return false;
        case kOpPing:
            return sendRaw(encodeFrame(kOpPong, payload));
        case kOpPong:
        case kOpText:
        case kOpBinary:
        case kOpContinuation:
            // Streams are push-only; client data frames are read and dropped.
            return true;
        default:
            close(1002);
            return false;
    }
}

bool WebSocketConnection::serviceUntil(int64_t deadline_ns) {
    while (open_) {
        const int64_t remaining_ns = deadline_ns - nowSteadyNs();
        const int timeout_ms = remaining_ns > 0 ? static_cast<int>((remaining_ns + 999999LL) / 1000000LL) : 0;
        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        const int r = ::poll(&pfd, 1, timeout_ms);
        if (r < 0) {
            if (errno == EINTR) {
                continue;
            }
            open_ = false;
            break;
        }
        if (r == 0) {
            break;
        }
        if ((pfd.revents & (POLLERR | POLLNVAL)) != 0) {
            open_ = false;
            break;
        }
        if (!receiveAvailable() || !processBufferedFrames()) {
            break;
        }
        if (remaining_ns <= 0) {
            break;
        }
    }
    return open_;
}

void WebSocketConnection::close(uint16_t code) {
    if (!open_) {
        return;
    }
    std::string payload;
    payload.push_back(static_cast<char>((code >> 8) & 0xFFU));
    payload.push_back(static_cast<char>(code & 0xFFU));
    (void)sendRaw(encodeFrame(kOpClose, payload));
    open_ = false;
}

}  // namespace rover
