#include "server/http_server.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace hookrelay {

// ── HttpRequest ───────────────────────────────────────────────────────────────

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it != headers.end() ? it->second : "";
}

bool HttpRequest::has_header(const std::string& name) const {
    return headers.count(to_lower(name)) > 0;
}

// ── Address parsing ───────────────────────────────────────────────────────────

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port,
                       bool allow_ephemeral) {
    auto pos = addr.rfind(':');
    if (pos == std::string::npos || pos == 0) return false;
    host = addr.substr(0, pos);
    if (host.empty()) return false;
    std::string digits = addr.substr(pos + 1);
    if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos)
        return false;
    if (digits.size() > 5) return false;
    int p = std::stoi(digits);
    if (p > 65535) return false;
    if (p == 0 && !allow_ephemeral) return false;
    port = static_cast<uint16_t>(p);
    return true;
}

const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

// ── HttpServer ────────────────────────────────────────────────────────────────

HttpServer::HttpServer(std::string listen_addr,
                       uint32_t max_body,
                       Handler handler)
    : listen_addr_(std::move(listen_addr))
    , max_body_(max_body)
    , handler_(std::move(handler))
{}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start(std::string& error) {
    std::string host;
    uint16_t port;
    if (!parse_listen_addr(listen_addr_, host, port, true)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    if (::pipe(shutdown_pipe_) != 0) {
        error = "Failed to create shutdown pipe";
        return false;
    }

    auto close_all = [this]() {
        if (server_fd_ >= 0) { ::close(server_fd_); server_fd_ = -1; }
        ::close(shutdown_pipe_[0]); shutdown_pipe_[0] = -1;
        ::close(shutdown_pipe_[1]); shutdown_pipe_[1] = -1;
    };

    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        error = "Failed to create server socket";
        close_all();
        return false;
    }

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

#ifdef SO_NOSIGPIPE  // macOS
    ::setsockopt(server_fd_, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) != 1) {
        error = "Invalid bind address: " + host;
        close_all();
        return false;
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        error = std::string("bind failed: ") + std::strerror(errno);
        close_all();
        return false;
    }

    if (::listen(server_fd_, 64) != 0) {
        error = std::string("listen failed: ") + std::strerror(errno);
        close_all();
        return false;
    }

    struct sockaddr_in bound{};
    socklen_t blen = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &blen) == 0)
        bound_port_ = ntohs(bound.sin_port);
    else
        bound_port_ = port;

    running_.store(true);
    thread_ = std::thread([this]() { accept_loop(); });
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;
    char b = 0;
    if (shutdown_pipe_[1] >= 0 && ::write(shutdown_pipe_[1], &b, 1) < 0)
        std::cerr << "[server] shutdown signal failed: " << std::strerror(errno) << "\n";
    if (thread_.joinable()) thread_.join();
    reap_workers(true);
    if (server_fd_ >= 0)         { ::close(server_fd_);         server_fd_ = -1; }
    if (shutdown_pipe_[0] >= 0)  { ::close(shutdown_pipe_[0]);  shutdown_pipe_[0] = -1; }
    if (shutdown_pipe_[1] >= 0)  { ::close(shutdown_pipe_[1]);  shutdown_pipe_[1] = -1; }
}

void HttpServer::reap_workers(bool all) {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (all || (*it)->done.load()) {
            if ((*it)->thread.joinable()) (*it)->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

// ── HTTP helpers ──────────────────────────────────────────────────────────────

// HEAD replies carry the headers of the equivalent GET but no body.
static void send_http_response(int fd, const HttpReply& reply, bool head_only = false) {
    std::string resp =
        "HTTP/1.1 " + std::to_string(reply.status) + " " + reason_phrase(reply.status) + "\r\n";
    if (!reply.content_type.empty())
        resp += "Content-Type: " + reply.content_type + "\r\n";
    for (const auto& h : reply.headers)
        resp += h.first + ": " + h.second + "\r\n";
    resp += "Content-Length: " + std::to_string(reply.body.size()) + "\r\n"
            "Connection: close\r\n\r\n";
    if (!head_only) resp += reply.body;

    const char* p = resp.c_str();
    size_t left = resp.size();
    while (left > 0) {
        ssize_t n = ::send(fd, p, left, MSG_NOSIGNAL);
        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            return;  // peer went away
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
}

static void send_plain(int fd, int status, const std::string& text) {
    HttpReply r;
    r.status = status;
    r.content_type = "text/plain";
    r.body = text;
    send_http_response(fd, r);
}

void HttpServer::accept_loop() {
    while (running_.load()) {
        struct pollfd fds[2];
        fds[0].fd = server_fd_;         fds[0].events = POLLIN;
        fds[1].fd = shutdown_pipe_[0];  fds[1].events = POLLIN;

        int ret = ::poll(fds, 2, 1000);
        reap_workers(false);
        if (ret <= 0) continue;              // timeout or transient error
        if (fds[1].revents & POLLIN) break;  // shutdown signal
        if (!(fds[0].revents & POLLIN)) continue;

        struct sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        int cfd = ::accept(server_fd_, reinterpret_cast<sockaddr*>(&peer), &plen);
        if (cfd < 0) continue;

        struct timeval tv{10, 0};  // 10s recv timeout
        ::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        if (workers_.size() >= kMaxWorkers) {
            send_plain(cfd, 503, "Server busy");
            ::close(cfd);
            continue;
        }

        char ip[INET_ADDRSTRLEN] = {0};
        ::inet_ntop(AF_INET, &peer.sin_addr, ip, sizeof(ip));
        std::string peer_ip = ip;

        auto worker = std::make_unique<Worker>();
        Worker* w = worker.get();
        workers_.push_back(std::move(worker));
        w->thread = std::thread([this, w, cfd, peer_ip]() {
            handle_connection(cfd, peer_ip);
            ::close(cfd);
            w->done.store(true);
        });
    }
}

void HttpServer::handle_connection(int fd, const std::string& peer) const {
    // Read until end-of-headers (CRLFCRLF), cap at 16 KB.
    std::string buf;
    buf.reserve(4096);
    char tmp[4096];

    while (buf.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) return;
        buf.append(tmp, static_cast<size_t>(n));
        if (buf.size() > 16384) {
            send_plain(fd, 400, "Headers too large");
            return;
        }
    }

    auto hdr_end  = buf.find("\r\n\r\n");
    std::string headers_raw = buf.substr(0, hdr_end);
    std::string leftover    = buf.substr(hdr_end + 4);

    // Parse request line.
    auto rl_end = headers_raw.find("\r\n");
    if (rl_end == std::string::npos) rl_end = headers_raw.size();

    HttpRequest req;
    req.remote_addr = peer;
    {
        std::istringstream ss(headers_raw.substr(0, rl_end));
        std::string pq, ver;
        if (!(ss >> req.method >> pq >> ver) || ver.rfind("HTTP/", 0) != 0) {
            send_plain(fd, 400, "Malformed request line");
            return;
        }
        req.path = url_decode(pq.substr(0, pq.find('?')));
    }

    // Parse headers. Repeated headers are joined with ", ".
    size_t pos = rl_end + 2;
    while (pos < headers_raw.size()) {
        auto ne = headers_raw.find("\r\n", pos);
        if (ne == std::string::npos) ne = headers_raw.size();
        std::string hline = headers_raw.substr(pos, ne - pos);
        pos = ne + 2;
        auto col = hline.find(':');
        if (col == std::string::npos) continue;
        std::string name  = to_lower(trim(hline.substr(0, col)));
        std::string value = trim(hline.substr(col + 1));
        auto existing = req.headers.find(name);
        if (existing != req.headers.end())
            existing->second += ", " + value;
        else
            req.headers[name] = value;
    }

    if (req.has_header("transfer-encoding")) {
        send_plain(fd, 411, "Length required");
        return;
    }

    // Read body when one is announced.
    size_t content_len = 0;
    auto it = req.headers.find("content-length");
    if (it != req.headers.end()) {
        const std::string& v = it->second;
        if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos || v.size() > 12) {
            send_plain(fd, 400, "Invalid Content-Length");
            return;
        }
        content_len = static_cast<size_t>(std::stoull(v));
    }

    if (content_len > max_body_) {
        send_plain(fd, 413, "Payload too large");
        return;
    }

    req.body = std::move(leftover);
    while (req.body.size() < content_len) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) return;  // client gave up or timed out mid-body
        req.body.append(tmp, static_cast<size_t>(n));
    }
    if (req.body.size() > content_len) req.body.resize(content_len);

    HttpReply reply;
    try {
        reply = handler_(req);
    } catch (const std::exception& e) {
        std::cerr << "[server] handler error: " << e.what() << "\n";
        reply = HttpReply{};
        reply.status = 500;
        reply.content_type = "text/plain";
        reply.body = "Internal server error";
    }
    send_http_response(fd, reply, req.method == "HEAD");
}

} // namespace hookrelay
