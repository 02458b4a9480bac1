#pragma once
#include "http.hpp"

#include <string>
#include <functional>
#include <map>
#include <list>
#include <memory>
#include <atomic>
#include <thread>
#include <vector>
#include <cstdint>

namespace hookrelay {

// A parsed inbound HTTP request.
struct HttpRequest {
    std::string method;       // as sent, e.g. "POST"
    std::string path;         // without query string, e.g. "/webhook"
    std::map<std::string, std::string> headers;  // header names lowercased
    std::string body;
    std::string remote_addr;  // peer IP of the TCP connection

    // Return a header value (name is case-insensitive), or "" if absent.
    std::string header(const std::string& name) const;
    bool has_header(const std::string& name) const;
};

struct HttpReply {
    int         status       = 200;
    std::string content_type = "application/json";
    std::string body;
    std::vector<Header> headers;  // extra response headers
};

// Minimal HTTP/1.1 server: one request per connection, each connection
// served on its own worker thread. The accept loop runs in a background
// thread and stop() joins it together with all workers. Intended to sit
// behind a TLS-terminating reverse proxy.
class HttpServer {
public:
    using Handler = std::function<HttpReply(const HttpRequest&)>;

    static constexpr size_t kMaxWorkers = 64;

    // listen_addr: "host:port", e.g. "0.0.0.0:5000"; port 0 picks a free port
    // max_body:    maximum request body size in bytes; larger bodies get 413
    HttpServer(std::string listen_addr, uint32_t max_body, Handler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Start background accept thread. Returns false and populates error on failure.
    bool start(std::string& error);

    // Signal the accept thread to stop, then join it and every worker.
    void stop();

    // Port actually bound (useful when listen_addr asked for port 0).
    uint16_t port() const { return bound_port_; }

private:
    struct Worker {
        std::thread thread;
        std::atomic<bool> done{false};
    };

    void accept_loop();
    void reap_workers(bool all);
    void handle_connection(int client_fd, const std::string& peer) const;

    std::string listen_addr_;
    uint32_t    max_body_;
    Handler     handler_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    uint16_t bound_port_   = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;
    std::list<std::unique_ptr<Worker>> workers_;  // touched only by the accept thread and stop()
};

// Parse "host:port" into host and port. Returns false if the string is
// malformed or the port is out of range. Port 0 is accepted only when
// allow_ephemeral is true.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port,
                       bool allow_ephemeral = false);

// Standard reason phrase for a status code ("OK", "Not Found", ...).
const char* reason_phrase(int status);

} // namespace hookrelay
