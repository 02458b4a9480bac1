#include <catch2/catch.hpp>
#include "http.hpp"

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>

using namespace hookrelay;

namespace {

// Self-signed P-256 certificate whose only name is `dns_name`.
struct TlsIdentity {
    EVP_PKEY* key  = nullptr;
    X509*     cert = nullptr;

    explicit TlsIdentity(const std::string& dns_name) {
        EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr);
        if (!pctx || EVP_PKEY_keygen_init(pctx) != 1 ||
            EVP_PKEY_CTX_set_ec_paramgen_curve_nid(pctx, NID_X9_62_prime256v1) != 1 ||
            EVP_PKEY_keygen(pctx, &key) != 1) {
            EVP_PKEY_CTX_free(pctx);
            throw std::runtime_error("key generation failed");
        }
        EVP_PKEY_CTX_free(pctx);

        cert = X509_new();
        X509_set_version(cert, 2);
        ASN1_INTEGER_set(X509_get_serialNumber(cert), 1);
        X509_gmtime_adj(X509_getm_notBefore(cert), -60);
        X509_gmtime_adj(X509_getm_notAfter(cert), 3600);
        X509_set_pubkey(cert, key);

        X509_NAME* name = X509_get_subject_name(cert);
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
            reinterpret_cast<const unsigned char*>(dns_name.c_str()), -1, -1, 0);
        X509_set_issuer_name(cert, name);

        X509V3_CTX v3;
        X509V3_set_ctx_nodb(&v3);
        X509V3_set_ctx(&v3, cert, cert, nullptr, nullptr, 0);
        std::string san = "DNS:" + dns_name;
        X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &v3, NID_subject_alt_name, san.c_str());
        if (!ext) throw std::runtime_error("subjectAltName failed");
        X509_add_ext(cert, ext, -1);
        X509_EXTENSION_free(ext);

        if (X509_sign(cert, key, EVP_sha256()) == 0)
            throw std::runtime_error("certificate signing failed");
    }

    ~TlsIdentity() {
        X509_free(cert);
        EVP_PKEY_free(key);
    }

    TlsIdentity(const TlsIdentity&) = delete;
    TlsIdentity& operator=(const TlsIdentity&) = delete;
};

// Points OpenSSL's default trust store at one certificate for the scope.
struct TrustOnly {
    std::string path;
    std::string saved;
    bool had_saved = false;

    explicit TrustOnly(X509* cert) {
        char tmpl[] = "/tmp/hookrelay_ca_XXXXXX";
        int fd = ::mkstemp(tmpl);
        if (fd < 0) throw std::runtime_error("mkstemp failed");
        path = tmpl;
        FILE* f = ::fdopen(fd, "w");
        PEM_write_X509(f, cert);
        std::fclose(f);

        if (const char* v = std::getenv("SSL_CERT_FILE")) { saved = v; had_saved = true; }
        ::setenv("SSL_CERT_FILE", path.c_str(), 1);
    }

    ~TrustOnly() {
        if (had_saved) ::setenv("SSL_CERT_FILE", saved.c_str(), 1);
        else ::unsetenv("SSL_CERT_FILE");
        std::remove(path.c_str());
    }
};

// One-shot TLS server on 127.0.0.1 answering 200 "ok".
class TlsServer {
public:
    explicit TlsServer(const TlsIdentity& id) {
        ctx_ = SSL_CTX_new(TLS_server_method());
        if (!ctx_ || SSL_CTX_use_certificate(ctx_, id.cert) != 1 ||
            SSL_CTX_use_PrivateKey(ctx_, id.key) != 1)
            throw std::runtime_error("server TLS setup failed");

        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        struct sockaddr_in sa{};
        sa.sin_family = AF_INET;
        ::inet_pton(AF_INET, "127.0.0.1", &sa.sin_addr);
        socklen_t len = sizeof(sa);
        if (fd_ < 0 ||
            ::bind(fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0 ||
            ::listen(fd_, 4) != 0 ||
            ::getsockname(fd_, reinterpret_cast<sockaddr*>(&sa), &len) != 0)
            throw std::runtime_error("server bind failed");
        port_ = ntohs(sa.sin_port);
        thread_ = std::thread([this] { serve(); });
    }

    ~TlsServer() {
        stop_.store(true);
        if (thread_.joinable()) thread_.join();
        ::close(fd_);
        SSL_CTX_free(ctx_);
    }

    uint16_t port() const { return port_; }

private:
    void serve() {
        struct pollfd pfd{fd_, POLLIN, 0};
        while (!stop_.load()) {
            if (::poll(&pfd, 1, 100) > 0) break;
        }
        if (stop_.load()) return;

        int cfd = ::accept(fd_, nullptr, nullptr);
        if (cfd < 0) return;
        struct timeval tv{3, 0};
        ::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        SSL* ssl = SSL_new(ctx_);
        SSL_set_fd(ssl, cfd);
        if (SSL_accept(ssl) == 1) {
            std::string request;
            char buf[4096];
            while (request.find("\r\n\r\n{}") == std::string::npos) {
                int n = SSL_read(ssl, buf, sizeof(buf));
                if (n <= 0) break;
                request.append(buf, static_cast<size_t>(n));
            }
            const std::string reply =
                "HTTP/1.1 200 OK\r\nContent-Length: 2\r\nConnection: close\r\n\r\nok";
            SSL_write(ssl, reply.data(), static_cast<int>(reply.size()));
            SSL_shutdown(ssl);
        }
        SSL_free(ssl);
        ::close(cfd);
    }

    SSL_CTX* ctx_ = nullptr;
    int fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> stop_{false};
    std::thread thread_;
};

std::string https_url(const std::string& host, uint16_t port) {
    return "https://" + host + ":" + std::to_string(port) + "/internal-webhook";
}

} // namespace

TEST_CASE("https: certificate naming the host is accepted", "[http_tls]") {
    TlsIdentity id("localhost");
    TrustOnly trust(id.cert);
    TlsServer server(id);

    auto resp = http_post(https_url("localhost", server.port()), "{}",
                          {{"Content-Type", "application/json"}}, 5);
    REQUIRE(resp.error.empty());
    REQUIRE(resp.status_code == 200);
    REQUIRE(resp.body == "ok");
}

TEST_CASE("https: trusted certificate for another host is rejected", "[http_tls]") {
    TlsIdentity id("relay.example.com");
    TrustOnly trust(id.cert);
    TlsServer server(id);

    auto resp = http_post(https_url("localhost", server.port()), "{}",
                          {{"Content-Type", "application/json"}}, 5);
    REQUIRE(resp.status_code == 0);
    REQUIRE(resp.error.find("certificate verify failed") != std::string::npos);
    REQUIRE(resp.error.find(X509_verify_cert_error_string(X509_V_ERR_HOSTNAME_MISMATCH))
            != std::string::npos);
}

TEST_CASE("https: IP literal must appear in the certificate", "[http_tls]") {
    TlsIdentity id("localhost");
    TrustOnly trust(id.cert);
    TlsServer server(id);

    auto resp = http_post(https_url("127.0.0.1", server.port()), "{}",
                          {{"Content-Type", "application/json"}}, 5);
    REQUIRE(resp.status_code == 0);
    REQUIRE(resp.error.find("certificate verify failed") != std::string::npos);
}
