// Linux HTTP/HTTPS client using POSIX sockets + OpenSSL.
// Implements the same public API as http.cpp (libcurl) with identical
// interface behaviour: http_init/cleanup are no-ops (OpenSSL 1.1+ auto-inits).
#ifdef __linux__

#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <arpa/inet.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <cerrno>
#include <ctime>
#include <memory>
#include <string>
#include <stdexcept>
#include <thread>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace hookrelay {

static const std::atomic<bool>* g_socket_abort_flag = nullptr;

void http_init() {}
void http_cleanup() {}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_socket_abort_flag = flag;
}

static bool abort_requested() {
    return g_socket_abort_flag &&
           g_socket_abort_flag->load(std::memory_order_relaxed);
}

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result{};
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::runtime_error("invalid URL: " + url);

    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https")
        throw std::runtime_error("unsupported protocol: " + scheme);
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    result.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    if (result.host.empty())
        throw std::runtime_error("invalid URL: " + url);
    return result;
}

static std::string ssl_error_string() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

static bool is_default_port(const ParsedUrl& url) {
    return url.port == (url.tls ? "443" : "80");
}

static bool is_ip_literal(const std::string& host) {
    unsigned char buf[sizeof(struct in6_addr)];
    return inet_pton(AF_INET, host.c_str(), buf) == 1 ||
           inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

// ── Name resolution ────────────────────────────────────────────

// In-flight getaddrinfo_a() request. Owns the strings and hints the
// resolver thread reads until the lookup completes.
struct PendingLookup {
    std::string     host;
    std::string     port;
    struct addrinfo hints{};
    struct gaicb    cb{};
    struct gaicb*   list[1] = {&cb};

    ~PendingLookup() {
        if (cb.ar_result) freeaddrinfo(cb.ar_result);
    }
};

// ── RAII connection (TCP + optional TLS) ──────────────────────

using Clock = std::chrono::steady_clock;

struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;

    Clock::time_point deadline;
    long        timeout_ms = 0;
    std::string error;   // first failure, empty while healthy

    explicit Connection(long timeout_secs)
        : deadline(Clock::now() + std::chrono::seconds(timeout_secs))
        , timeout_ms(timeout_secs * 1000) {}
    ~Connection() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    long remaining_ms() const {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now()).count();
        return left > 0 ? static_cast<long>(left) : 0;
    }

    bool fail(const std::string& msg) {
        if (error.empty()) error = msg;
        return false;
    }

    bool fail_timeout() {
        return fail("timeout of " + std::to_string(timeout_ms) + "ms exceeded");
    }

    // Resolve within the deadline. A lookup still running at the deadline
    // is cancelled, or handed to a reaper thread when glibc cannot cancel it.
    bool resolve(const ParsedUrl& url, struct addrinfo*& res) {
        std::unique_ptr<PendingLookup> lookup(new PendingLookup);
        lookup->host = url.host;
        lookup->port = url.port;
        lookup->hints.ai_family   = AF_UNSPEC;
        lookup->hints.ai_socktype = SOCK_STREAM;
        lookup->cb.ar_name    = lookup->host.c_str();
        lookup->cb.ar_service = lookup->port.c_str();
        lookup->cb.ar_request = &lookup->hints;

        int rc = getaddrinfo_a(GAI_NOWAIT, lookup->list, 1, nullptr);
        if (rc != 0)
            return fail("getaddrinfo " + url.host + ": " + gai_strerror(rc));

        while ((rc = gai_error(&lookup->cb)) == EAI_INPROGRESS) {
            long left = remaining_ms();
            if (left == 0 || abort_requested()) break;
            long slice = std::min(left, 1000L);
            struct timespec ts{slice / 1000, (slice % 1000) * 1000000L};
            gai_suspend(lookup->list, 1, &ts);
        }

        if (rc == EAI_INPROGRESS) {
            gai_cancel(&lookup->cb);
            if (gai_error(&lookup->cb) == EAI_INPROGRESS) {
                PendingLookup* orphan = lookup.release();
                std::thread([orphan] {
                    while (gai_error(&orphan->cb) == EAI_INPROGRESS)
                        gai_suspend(orphan->list, 1, nullptr);
                    delete orphan;
                }).detach();
            }
            if (abort_requested()) return fail("request aborted");
            return fail_timeout();
        }
        if (rc != 0)
            return fail("getaddrinfo " + url.host + ": " + gai_strerror(rc));

        res = lookup->cb.ar_result;
        lookup->cb.ar_result = nullptr;
        return true;
    }

    bool connect(const ParsedUrl& url) {
        struct addrinfo* res = nullptr;
        if (!resolve(url, res)) return false;

        bool connected = false;
        std::string last_error = "no usable address";
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) { last_error = std::strerror(errno); continue; }

            // Non-blocking connect so the deadline covers the handshake.
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                fcntl(fd, F_SETFL, flags);
                connected = true;
            } else if (errno == EINPROGRESS) {
                struct pollfd pfd{fd, POLLOUT, 0};
                rc = ::poll(&pfd, 1, static_cast<int>(remaining_ms()));
                if (rc > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                    if (err == 0) {
                        fcntl(fd, F_SETFL, flags);
                        connected = true;
                    } else {
                        last_error = std::strerror(err);
                    }
                } else if (rc == 0) {
                    last_error = "timeout of " + std::to_string(timeout_ms) + "ms exceeded";
                } else {
                    last_error = std::strerror(errno);
                }
            } else {
                last_error = std::strerror(errno);
            }
            if (!connected) { ::close(fd); fd = -1; }
        }
        freeaddrinfo(res);
        if (!connected)
            return fail("connect " + url.host + ":" + url.port + ": " + last_error);

        if (url.tls) {
            set_socket_timeout_ms(std::max(remaining_ms(), 1L));

            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) return fail("TLS: " + ssl_error_string());
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) return fail("TLS: " + ssl_error_string());
            SSL_set_fd(ssl, fd);

            // The certificate must name the host we dialled.
            if (is_ip_literal(url.host)) {
                if (X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl), url.host.c_str()) != 1)
                    return fail("TLS: cannot verify against " + url.host);
            } else {
                SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI
                if (SSL_set1_host(ssl, url.host.c_str()) != 1)
                    return fail("TLS: cannot verify against " + url.host);
            }

            if (SSL_connect(ssl) != 1) {
                if (remaining_ms() == 0) return fail_timeout();
                long verify = SSL_get_verify_result(ssl);
                if (verify != X509_V_OK)
                    return fail("TLS handshake with " + url.host +
                                " failed: certificate verify failed: " +
                                X509_verify_cert_error_string(verify));
                return fail("TLS handshake with " + url.host + " failed: " + ssl_error_string());
            }
        }

        return true;
    }

    // I/O waits in slices of at most one second so the deadline and the
    // abort flag are checked while a slow peer keeps us waiting.

    // Read some bytes; returns >0 on data, 0 on EOF, -1 on failure (error set).
    ssize_t read_some(char* buf, size_t len) {
        while (true) {
            if (abort_requested()) { fail("request aborted"); return -1; }
            long left = remaining_ms();
            if (left == 0) { fail_timeout(); return -1; }
            set_socket_timeout_ms(std::min(left, 1000L));

            ssize_t n;
            if (ssl) {
                n = SSL_read(ssl, buf, static_cast<int>(len));
                if (n > 0) return n;
                int err = SSL_get_error(ssl, static_cast<int>(n));
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    continue;
                if (err == SSL_ERROR_SYSCALL &&
                    (errno == EAGAIN || errno == EWOULDBLOCK))
                    continue; // 1-second slice expired
                if (err == SSL_ERROR_SYSCALL && n == 0) return 0;
                fail("TLS read failed: " + ssl_error_string());
                return -1;
            } else {
                n = ::recv(fd, buf, len, 0);
                if (n > 0) return n;
                if (n == 0) return 0;
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                fail(std::string("read failed: ") + std::strerror(errno));
                return -1;
            }
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            if (abort_requested()) return fail("request aborted");
            long left = remaining_ms();
            if (left == 0) return fail_timeout();
            set_socket_timeout_ms(std::min(left, 1000L));

            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    return fail("TLS write failed: " + ssl_error_string());
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                    return fail(std::string("write failed: ") + std::strerror(errno));
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    void set_socket_timeout_ms(long ms) {
        struct timeval tv{ms / 1000, static_cast<suseconds_t>((ms % 1000) * 1000)};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
};

// ── Request building ───────────────────────────────────────────

static std::string build_request(const std::string& method,
                                  const ParsedUrl& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += method + " " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host;
    if (!is_default_port(url)) req += ":" + url.port;
    req += "\r\n";

    bool has_content_length = false;
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
        if (h.first == "Content-Length") has_content_length = true;
    }
    if (method == "POST" && !has_content_length)
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
// Returns false on EOF or failure before a full line arrived.
static bool read_line(Connection& conn, std::string& leftover, std::string& line) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        char buf[4096];
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        leftover.append(buf, static_cast<size_t>(n));
    }
}

struct BodyFraming {
    bool   chunked        = false;
    bool   has_length     = false;
    size_t content_length = 0;
};

// Parse status line + headers; returns 0 with conn.error set on failure.
static long parse_response_headers(Connection& conn, std::string& leftover,
                                    BodyFraming& framing) {
    std::string status_line;
    if (!read_line(conn, leftover, status_line)) {
        conn.fail("empty reply from server");
        return 0;
    }

    // "HTTP/1.1 200 OK" — extract the three-digit code
    size_t sp1 = status_line.find(' ');
    long status = 0;
    if (status_line.rfind("HTTP/", 0) == 0 && sp1 != std::string::npos) {
        try { status = std::stol(status_line.substr(sp1 + 1, 3)); }
        catch (const std::exception&) { status = 0; }
    }
    if (status < 100 || status > 999) {
        conn.fail("malformed status line: " + status_line);
        return 0;
    }

    std::string line;
    while (true) {
        if (!read_line(conn, leftover, line)) {
            conn.fail("connection closed while reading response headers");
            return 0;
        }
        if (line.empty()) break; // blank line → end of headers

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name  = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
            value.erase(0, 1);

        for (auto& c : name)  c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
        for (auto& c : value) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));

        if (name == "transfer-encoding") {
            framing.chunked = (value.find("chunked") != std::string::npos);
        } else if (name == "content-length") {
            try {
                framing.content_length = std::stoul(value);
                framing.has_length = true;
            } catch (const std::exception&) {
                conn.fail("invalid Content-Length: " + value);
                return 0;
            }
        }
    }
    return status;
}

// Read exactly n bytes, consuming leftover first.
static bool read_exactly(Connection& conn, std::string& leftover,
                          size_t n, std::string& out) {
    while (n > 0) {
        if (!leftover.empty()) {
            size_t take = std::min(n, leftover.size());
            out.append(leftover, 0, take);
            leftover.erase(0, take);
            n -= take;
            continue;
        }
        char buf[4096];
        ssize_t got = conn.read_some(buf, std::min(n, sizeof(buf)));
        if (got <= 0) return false;
        out.append(buf, static_cast<size_t>(got));
        n -= static_cast<size_t>(got);
    }
    return true;
}

// Returns false when the connection failed before the peer closed it.
static bool read_until_eof(Connection& conn, std::string& leftover,
                            std::string& out) {
    out += leftover;
    leftover.clear();
    char buf[4096];
    for (;;) {
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n == 0) return true;
        if (n < 0) return false;
        out.append(buf, static_cast<size_t>(n));
    }
}

// Accumulate the full body (chunked, Content-Length or read-to-close).
// Returns false when the body ended short of its framing.
static bool read_body(Connection& conn, std::string& leftover,
                      const BodyFraming& framing, std::string& body) {
    if (framing.chunked) {
        std::string size_line;
        while (true) {
            if (!read_line(conn, leftover, size_line)) return false;
            // Chunk size is hex, may have extensions after ';'
            size_t chunk_size = std::strtoul(size_line.c_str(), nullptr, 16);
            if (chunk_size == 0) return true;
            if (!read_exactly(conn, leftover, chunk_size, body)) return false;
            std::string crlf;
            if (!read_exactly(conn, leftover, 2, crlf)) return false; // trailing \r\n
        }
    }
    if (framing.has_length)
        return read_exactly(conn, leftover, framing.content_length, body);
    return read_until_eof(conn, leftover, body);
}

// ── Core request executor ──────────────────────────────────────

static HttpResponse do_request(const std::string& method,
                                const std::string& url_str,
                                const std::string& body,
                                const std::vector<Header>& headers,
                                long timeout_secs) {
    HttpResponse resp;

    ParsedUrl url;
    try {
        url = parse_url(url_str);
    } catch (const std::runtime_error& e) {
        resp.error = e.what();
        return resp;
    }

    Connection conn(timeout_secs);
    if (!conn.connect(url)) {
        resp.error = conn.error;
        return resp;
    }

    std::string request = build_request(method, url, body, headers);
    if (!conn.write_all(request.c_str(), request.size())) {
        resp.error = conn.error;
        return resp;
    }

    std::string leftover;
    BodyFraming framing;
    long status = parse_response_headers(conn, leftover, framing);
    if (status == 0) {
        resp.error = conn.error;
        return resp;
    }

    // A response is only delivered once its body is complete; a timeout or
    // abort after the status line is still a transport failure.
    bool no_body = status == 204 || status == 304 || status < 200;
    if (!no_body && !read_body(conn, leftover, framing, resp.body)) {
        resp.body.clear();
        resp.error = conn.error.empty()
            ? "connection closed before the response body was complete"
            : conn.error;
        return resp;
    }

    resp.status_code = status;
    return resp;
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::post(const std::string& url,
                                     const std::string& body,
                                     const std::vector<Header>& headers,
                                     long timeout_seconds) {
    return http_post(url, body, headers, timeout_seconds);
}

HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds) {
    return do_request("POST", url, body, headers, timeout_seconds);
}

} // namespace hookrelay

#endif // __linux__
