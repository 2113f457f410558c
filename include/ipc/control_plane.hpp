#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

namespace rover::ipc {

// Line-oriented request/reply server on a UNIX stream socket: one request
// line per connection, the handler's return value is written back and the
// connection closed.
class UnixControlServer {
public:
    using Handler = std::function<std::string(const std::string&)>;

    UnixControlServer() = default;
    ~UnixControlServer();

    UnixControlServer(const UnixControlServer&) = delete;
    UnixControlServer& operator=(const UnixControlServer&) = delete;

    bool start(const std::string& socket_path, Handler handler, std::string& error);
    void stop();
    bool isRunning() const { return running_.load(); }
    const std::string& socketPath() const { return socket_path_; }
    uint64_t requestsServed() const { return requests_served_.load(); }

private:
    void serveLoop();

    std::atomic<bool> running_{false};
    std::string socket_path_{};
    Handler handler_{};
    std::thread thread_{};
    int listen_fd_{-1};
    std::atomic<uint64_t> requests_served_{0};
};

// Sends `request` and collects the reply until the peer closes. Fails when
// the socket is missing, refuses, or stays silent past `timeout_ms`.
bool unixControlRequest(
    const std::string& socket_path,
    const std::string& request,
    std::string& response,
    std::string& error,
    int timeout_ms = 2000);

// Request text with surrounding whitespace and the trailing newline removed.
std::string normalizeControlLine(const std::string& raw);

}  // namespace rover::ipc
