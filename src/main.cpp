#include "config.hpp"
#include "http.hpp"
#include "relay.hpp"
#include "router.hpp"
#include "server/http_server.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: hookrelay [options]\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config PATH      Load settings from a JSON file\n"
              << "  -p, --port N           Listen port (default: 5000)\n"
              << "  --host ADDR            Listen address (default: 0.0.0.0)\n"
              << "  --local-server URL     Downstream base URL (default: http://localhost:8081)\n"
              << "  -h, --help             Show this help\n"
              << "\n"
              << "Endpoints:\n"
              << "  GET  /                 Liveness and configuration summary\n"
              << "  POST /webhook          Receive a signal and relay it to the local server\n"
              << "  *    /test             Send a synthetic signal to <local server>/webhook\n"
              << "  GET  /status           Operational info\n"
              << "\n"
              << "Environment variables:\n"
              << "  LOCAL_SERVER_URL       Downstream base URL\n"
              << "  PORT                   Listen port\n"
              << "  HOST                   Listen address\n"
              << "  RELAY_ENV              Environment name reported by /status\n"
              << "  HOOKRELAY_CONFIG       JSON config file (same as --config)\n";
}

int main(int argc, char* argv[]) try {
    std::string config_path;
    std::string port_arg;
    std::string host_arg;
    std::string local_server_arg;

    if (const char* v = std::getenv("HOOKRELAY_CONFIG"))
        config_path = v;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((std::strcmp(argv[i], "-p") == 0 || std::strcmp(argv[i], "--port") == 0) && i + 1 < argc) {
            port_arg = argv[++i];
        } else if (std::strcmp(argv[i], "--host") == 0 && i + 1 < argc) {
            host_arg = argv[++i];
        } else if (std::strcmp(argv[i], "--local-server") == 0 && i + 1 < argc) {
            local_server_arg = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    hookrelay::Config loaded;
    try {
        loaded = hookrelay::Config::load(config_path);
        if (!port_arg.empty())
            loaded.port = hookrelay::parse_port(port_arg, "--port");
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    if (!host_arg.empty())
        loaded.listen_host = host_arg;
    if (!local_server_arg.empty())
        loaded.local_server_url = local_server_arg;
    const hookrelay::Config config = loaded;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    hookrelay::http_init();
    hookrelay::http_set_abort_flag(&g_shutdown);

    hookrelay::PlatformHttpClient http_client;
    hookrelay::WebhookRelay relay(config, http_client);
    hookrelay::Router router;
    relay.install(router);

    hookrelay::HttpServer server(
        config.listen_addr(),
        config.max_body,
        [&router](const hookrelay::HttpRequest& req) { return router.dispatch(req); });

    std::string error;
    if (!server.start(error)) {
        std::cerr << "Error: " << error << "\n";
        hookrelay::http_cleanup();
        return 1;
    }

    std::cerr << "[server] hookrelay started\n"
              << "[server] Listening on " << config.listen_addr() << "\n"
              << "[server] Local server: " << config.local_server_url << "\n"
              << "[server] Internal endpoint: "
              << hookrelay::WebhookRelay::internal_endpoint(config.local_server_url)
              << "/internal-webhook\n";

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[server] Shutting down.\n";
    server.stop();
    hookrelay::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
