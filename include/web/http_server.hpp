#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "web/websocket.hpp"

namespace rover {

struct HttpRequest {
    std::string method;
    std::string path;   // without query string
    std::string query;
    std::map<std::string, std::string> headers;  // keys lower-cased
    std::string body;

    std::string header(const std::string& lower_name) const;
};

struct HttpResponse {
    int status{200};
    std::string content_type{"application/json"};
    std::string body;
};

// Minimal HTTP/1.1 listener: one request per connection, each connection on
// its own thread. WebSocket routes hand the upgraded socket to a handler that
// runs until the client leaves or the server stops.
class HttpServer {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;
    using WebSocketHandler = std::function<void(WebSocketConnection&)>;

    HttpServer();
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void addRoute(const std::string& method, const std::string& path, Handler handler);
    void addWebSocketRoute(const std::string& path, WebSocketHandler handler);

    // Port 0 binds an ephemeral port; see boundPort().
    bool start(uint16_t port, std::string& error);
    void stop();
    bool isRunning() const { return running_.load(); }
    uint16_t boundPort() const { return bound_port_; }
    std::size_t activeConnections();

    static bool parseRequestHead(const std::string& head, HttpRequest& out);
    static std::string serializeResponse(const HttpResponse& response);

private:
    struct Client {
        std::thread thread;
        int fd{-1};
        std::shared_ptr<std::atomic<bool>> done;
    };

    void serveLoop();
    void handleClient(int client_fd);
    bool readRequest(int client_fd, HttpRequest& out, int& error_status);
    void handleWebSocket(int client_fd, const HttpRequest& request, const WebSocketHandler& handler);
    void reapFinishedClients(bool all);

    std::atomic<bool> running_{false};
    uint16_t bound_port_{0};
    int listen_fd_{-1};
    std::thread server_thread_;

    std::mutex routes_mutex_;
    std::map<std::string, Handler> routes_;  // "METHOD path"
    std::map<std::string, WebSocketHandler> ws_routes_;

    std::mutex clients_mutex_;
    std::list<Client> clients_;
};

}  // namespace rover
