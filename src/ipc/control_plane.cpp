#include "ipc/control_plane.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>

#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

namespace rover::ipc {

namespace {

bool fillAddress(const std::string& path, sockaddr_un& addr, std::string& error) {
    addr = sockaddr_un{};
    addr.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
        error = "invalid control socket path: '" + path + "'";
        return false;
    }
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", path.c_str());
    return true;
}

void setTimeouts(int fd, int timeout_ms) {
    timeval tv{};
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

bool sendAll(int fd, const std::string& data) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        const ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        sent += static_cast<std::size_t>(n);
    }
    return true;
}

}  // namespace

std::string normalizeControlLine(const std::string& raw) {
    const auto b = raw.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) {
        return {};
    }
    std::string line = raw.substr(b);
    const auto nl = line.find('\n');
    if (nl != std::string::npos) {
        line = line.substr(0, nl);
    }
    const auto e = line.find_last_not_of(" \t\r");
    return line.substr(0, e + 1);
}

UnixControlServer::~UnixControlServer() {
    stop();
}

bool UnixControlServer::start(const std::string& socket_path, Handler handler, std::string& error) {
    stop();

    sockaddr_un addr{};
    if (!fillAddress(socket_path, addr, error)) {
        return false;
    }
    const int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        error = std::string("control socket: ") + std::strerror(errno);
        return false;
    }
    ::unlink(socket_path.c_str());
    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || listen(fd, 8) < 0) {
        error = "control socket bind/listen failed on " + socket_path + ": " + std::strerror(errno);
        ::close(fd);
        return false;
    }

    listen_fd_ = fd;
    socket_path_ = socket_path;
    handler_ = std::move(handler);
    running_.store(true);
    thread_ = std::thread(&UnixControlServer::serveLoop, this);
    error.clear();
    return true;
}

void UnixControlServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (listen_fd_ >= 0) {
        shutdown(listen_fd_, SHUT_RDWR);
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    ::unlink(socket_path_.c_str());
}

void UnixControlServer::serveLoop() {
    while (running_.load()) {
        const int client_fd = accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (running_.load()) {
                continue;
            }
            break;
        }
        setTimeouts(client_fd, 2000);

        std::string request;
        char buf[512];
        while (request.find('\n') == std::string::npos && request.size() < 4096U) {
            const ssize_t n = recv(client_fd, buf, sizeof(buf), 0);
            if (n <= 0) {
                break;
            }
            request.append(buf, static_cast<std::size_t>(n));
        }

        std::string reply = "ERR empty\n";
        const std::string line = normalizeControlLine(request);
        if (!line.empty()) {
            reply = handler_ ? handler_(line) : "ERR no-handler\n";
        }
        if (reply.empty() || reply.back() != '\n') {
            reply.push_back('\n');
        }
        if (!sendAll(client_fd, reply)) {
            std::cerr << "control: reply to '" << line << "' not delivered\n";
        }
        requests_served_.fetch_add(1);
        ::close(client_fd);
    }
}

bool unixControlRequest(
    const std::string& socket_path,
    const std::string& request,
    std::string& response,
    std::string& error,
    int timeout_ms) {
    sockaddr_un addr{};
    if (!fillAddress(socket_path, addr, error)) {
        return false;
    }
    const int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        error = "socket failed";
        return false;
    }
    setTimeouts(fd, timeout_ms);
    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        error = "connect to " + socket_path + " failed: " + std::strerror(errno);
        ::close(fd);
        return false;
    }
    if (!sendAll(fd, request)) {
        error = "send failed";
        ::close(fd);
        return false;
    }
    response.clear();
    char buf[2048];
    while (true) {
        const ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            error = (errno == EAGAIN || errno == EWOULDBLOCK) ? "timed out waiting for reply" : "recv failed";
            ::close(fd);
            return false;
        }
        if (n == 0) {
            break;
        }
        response.append(buf, static_cast<std::size_t>(n));
    }
    ::close(fd);
    error.clear();
    return true;
}

}  // namespace rover::ipc
