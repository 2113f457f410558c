#include "web/http_server.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <sstream>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace rover {

namespace {

constexpr std::size_t kMaxHeadBytes = 16U * 1024U;
constexpr std::size_t kMaxBodyBytes = 64U * 1024U;
constexpr int kSocketTimeoutMs = 5000;

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) {
        return {};
    }
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

const char* reasonPhrase(int status) {
    switch (status) {
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        default: return "OK";
    }
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

HttpResponse jsonError(int status, const std::string& detail) {
    HttpResponse r;
    r.status = status;
    r.body = "{\"detail\":\"" + detail + "\"}";
    return r;
}

}  // namespace

std::string HttpRequest::header(const std::string& lower_name) const {
    const auto it = headers.find(lower_name);
    return it == headers.end() ? std::string() : it->second;
}

HttpServer::HttpServer() = default;

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::addRoute(const std::string& method, const std::string& path, Handler handler) {
    std::lock_guard<std::mutex> lock(routes_mutex_);
    routes_[method + " " + path] = std::move(handler);
}

void HttpServer::addWebSocketRoute(const std::string& path, WebSocketHandler handler) {
    std::lock_guard<std::mutex> lock(routes_mutex_);
    ws_routes_[path] = std::move(handler);
}

bool HttpServer::parseRequestHead(const std::string& head, HttpRequest& out) {
    std::istringstream is(head);
    std::string line;
    if (!std::getline(is, line)) {
        return false;
    }
    line = trim(line);
    // e.g. "GET /ws/zed?x=1 HTTP/1.1"
    const auto sp1 = line.find(' ');
    const auto sp2 = (sp1 == std::string::npos) ? std::string::npos : line.find(' ', sp1 + 1);
    if (sp1 == std::string::npos || sp2 == std::string::npos || sp2 <= sp1 + 1) {
        return false;
    }
    out.method = line.substr(0, sp1);
    std::string target = line.substr(sp1 + 1, sp2 - sp1 - 1);
    if (line.compare(sp2 + 1, 5, "HTTP/") != 0 || target.empty() || target[0] != '/') {
        return false;
    }
    const auto q = target.find('?');
    if (q != std::string::npos) {
        out.query = target.substr(q + 1);
        target = target.substr(0, q);
    }
    out.path = target;

    out.headers.clear();
    while (std::getline(is, line)) {
        line = trim(line);
        if (line.empty()) {
            break;
        }
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        out.headers[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return true;
}

std::string HttpServer::serializeResponse(const HttpResponse& response) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << response.status << " " << reasonPhrase(response.status) << "\r\n"
        << "Access-Control-Allow-Origin: *\r\n"
        << "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n"
        << "Access-Control-Allow-Headers: Content-Type\r\n"
        << "Cache-Control: no-cache\r\n"
        << "Connection: close\r\n";
    if (response.status != 204) {
        oss << "Content-Type: " << response.content_type << "\r\n"
            << "Content-Length: " << response.body.size() << "\r\n";
    }
    oss << "\r\n";
    if (response.status != 204) {
        oss << response.body;
    }
    return oss.str();
}

bool HttpServer::start(uint16_t port, std::string& error) {
    if (running_.load()) {
        error = "server already running";
        return false;
    }

    const int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        error = std::string("socket failed: ") + std::strerror(errno);
        return false;
    }
    int yes = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);
    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        error = "bind to port " + std::to_string(port) + " failed: " + std::strerror(errno);
        close(fd);
        return false;
    }
    if (listen(fd, 16) < 0) {
        error = std::string("listen failed: ") + std::strerror(errno);
        close(fd);
        return false;
    }
    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = port;
    }

    listen_fd_ = fd;
    running_.store(true);
    server_thread_ = std::thread(&HttpServer::serveLoop, this);
    error.clear();
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (listen_fd_ >= 0) {
        shutdown(listen_fd_, SHUT_RDWR);
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    if (listen_fd_ >= 0) {
        close(listen_fd_);
        listen_fd_ = -1;
    }
    {
        // Wake every connection blocked in recv/poll so its handler returns.
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (auto& c : clients_) {
            shutdown(c.fd, SHUT_RDWR);
        }
    }
    reapFinishedClients(true);
}

std::size_t HttpServer::activeConnections() {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    std::size_t n = 0;
    for (const auto& c : clients_) {
        if (!c.done->load()) {
            n++;
        }
    }
    return n;
}

void HttpServer::reapFinishedClients(bool all) {
    std::list<Client> finished;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (auto it = clients_.begin(); it != clients_.end();) {
            if (all || it->done->load()) {
                finished.splice(finished.end(), clients_, it++);
            } else {
                ++it;
            }
        }
    }
    for (auto& c : finished) {
        if (c.thread.joinable()) {
            c.thread.join();
        }
        close(c.fd);
    }
}

void HttpServer::serveLoop() {
    while (running_.load()) {
        const int client_fd = accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (running_.load()) {
                continue;
            }
            break;
        }
        reapFinishedClients(false);

        timeval tv{};
        tv.tv_sec = kSocketTimeoutMs / 1000;
        tv.tv_usec = (kSocketTimeoutMs % 1000) * 1000;
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> lock(clients_mutex_);
        Client c;
        c.fd = client_fd;
        c.done = done;
        c.thread = std::thread([this, client_fd, done]() {
            handleClient(client_fd);
            // Signals end of response; the fd itself is closed by the reaper.
            shutdown(client_fd, SHUT_RDWR);
            done->store(true);
        });
        clients_.push_back(std::move(c));
    }
}

bool HttpServer::readRequest(int client_fd, HttpRequest& out, int& error_status) {
    std::string data;
    char buf[2048];
    std::size_t head_end = std::string::npos;
    while ((head_end = data.find("\r\n\r\n")) == std::string::npos) {
        if (data.size() > kMaxHeadBytes) {
            error_status = 413;
            return false;
        }
        const ssize_t n = recv(client_fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            error_status = 0;
            return false;
        }
        data.append(buf, static_cast<std::size_t>(n));
    }

    if (!parseRequestHead(data.substr(0, head_end + 2), out)) {
        error_status = 400;
        return false;
    }

    std::size_t content_length = 0;
    const std::string cl = out.header("content-length");
    if (!cl.empty()) {
        try {
            content_length = static_cast<std::size_t>(std::stoul(cl));
        } catch (const std::exception&) {
            error_status = 400;
            return false;
        }
    }
    if (content_length > kMaxBodyBytes) {
        error_status = 413;
        return false;
    }

    out.body = data.substr(head_end + 4);
    while (out.body.size() < content_length) {
        const ssize_t n = recv(client_fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            error_status = 400;
            return false;
        }
        out.body.append(buf, static_cast<std::size_t>(n));
    }
    out.body.resize(content_length);
    return true;
}

void HttpServer::handleWebSocket(int client_fd, const HttpRequest& request, const WebSocketHandler& handler) {
    const std::string key = request.header("sec-websocket-key");
    if (toLower(request.header("upgrade")) != "websocket" || key.empty()) {
        (void)sendAll(client_fd, serializeResponse(jsonError(400, "WebSocket upgrade required")));
        return;
    }
    const std::string handshake =
        "HTTP/1.1 101 Switching Protocols\r\n"
        "Upgrade: websocket\r\n"
        "Connection: Upgrade\r\n"
        "Sec-WebSocket-Accept: " + WebSocketConnection::computeAcceptKey(key) + "\r\n\r\n";
    if (!sendAll(client_fd, handshake)) {
        return;
    }

    WebSocketConnection conn(client_fd);
    try {
        handler(conn);
    } catch (const std::exception& e) {
        std::cerr << "web: websocket handler for " << request.path << " failed: " << e.what() << "\n";
    }
    conn.close(running_.load() ? 1000 : 1001);
}

void HttpServer::handleClient(int client_fd) {
    HttpRequest request;
    int error_status = 0;
    if (!readRequest(client_fd, request, error_status)) {
        if (error_status != 0) {
            (void)sendAll(client_fd, serializeResponse(jsonError(error_status, reasonPhrase(error_status))));
        }
        return;
    }

    WebSocketHandler ws_handler;
    Handler handler;
    bool path_known = false;
    {
        std::lock_guard<std::mutex> lock(routes_mutex_);
        const auto ws = ws_routes_.find(request.path);
        if (ws != ws_routes_.end() && request.method == "GET") {
            ws_handler = ws->second;
        }
        const auto it = routes_.find(request.method + " " + request.path);
        if (it != routes_.end()) {
            handler = it->second;
        }
        if (ws != ws_routes_.end()) {
            path_known = true;
        }
        for (const auto& r : routes_) {
            if (r.first.substr(r.first.find(' ') + 1) == request.path) {
                path_known = true;
                break;
            }
        }
    }

    if (ws_handler) {
        handleWebSocket(client_fd, request, ws_handler);
        return;
    }

    HttpResponse response;
    if (request.method == "OPTIONS" && path_known) {
        response.status = 204;
    } else if (handler) {
        try {
            response = handler(request);
        } catch (const std::exception& e) {
            std::cerr << "web: handler for " << request.method << " " << request.path << " failed: " << e.what() << "\n";
            response = jsonError(500, "Internal Server Error");
        }
    } else if (path_known) {
        response = jsonError(405, "Method Not Allowed");
    } else {
        response = jsonError(404, "Not Found");
    }
    (void)sendAll(client_fd, serializeResponse(response));
}

}  // namespace rover
