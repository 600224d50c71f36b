/*
 * Calculator MCP Server
 * =====================
 * Exposes the calculator tools over stdio, plain HTTP or streamable HTTP.
 *
 * Usage:
 *   ./calculator-server
 *   ./calculator-server --config config.json
 *   ./calculator-server --transport streamable --host 127.0.0.1 --port 8080
 */

#include <calcmcp/calculator_tools.hpp>
#include <calcmcp/config.hpp>
#include <calcmcp/http_transport.hpp>
#include <calcmcp/mcp_server.hpp>
#include <calcmcp/stdio_transport.hpp>
#include <calcmcp/streamable_http_transport.hpp>
#include <csignal>
#include <iostream>
#include <pthread.h>
#include <string>
#include <thread>

namespace {

constexpr std::chrono::seconds kShutdownTimeout(30);

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config FILE       Path to JSON configuration file\n"
              << "  --transport MODE    Transport: stdio, http or streamable (default: stdio)\n"
              << "  --host HOST         Listen address for the HTTP transports\n"
              << "  --port PORT         Listen port for the HTTP transports\n"
              << "  --help              Show this help message\n\n"
              << "Examples:\n"
              << "  " << program_name << " --transport http --port 8080\n"
              << "  " << program_name << " --config config.json --transport streamable\n"
              << std::endl;
}

// Blocks SIGINT/SIGTERM for every thread started afterwards and stops the
// transport from a dedicated thread once one of them arrives.
template <class Transport>
int serve_until_signalled(Transport& transport) {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    bool clean_shutdown = true;
    std::thread waiter([&transport, &signals, &clean_shutdown] {
        int received = 0;
        sigwait(&signals, &received);
        std::cerr << "Received signal " << received << ", shutting down..." << std::endl;
        clean_shutdown = transport.stop(kShutdownTimeout);
    });

    try {
        transport.start();
    } catch (const std::exception& e) {
        std::cerr << "Server error: " << e.what() << std::endl;
        // Wake the waiter so it can be joined
        pthread_kill(waiter.native_handle(), SIGTERM);
        waiter.join();
        return 1;
    }

    waiter.join();
    if (!clean_shutdown) {
        std::cerr << "Server shutdown error" << std::endl;
        return 1;
    }
    std::cerr << "Server stopped" << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string transport;
    std::string host;
    int port = 0;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        }
        else if (arg == "--transport" && i + 1 < argc) {
            transport = argv[++i];
        }
        else if (arg == "--host" && i + 1 < argc) {
            host = argv[++i];
        }
        else if (arg == "--port" && i + 1 < argc) {
            try {
                port = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: invalid port '" << argv[i] << "'" << std::endl;
                return 1;
            }
        }
        else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    calcmcp::ServerConfig config;
    if (!config_path.empty()) {
        calcmcp::ConfigLoader loader(config_path);
        if (!loader.load()) {
            std::cerr << "Failed to load configuration" << std::endl;
            return 1;
        }
        config = loader.get_config();
    }

    // Command line wins over the file
    if (!transport.empty()) config.transport = transport;
    if (!host.empty()) config.http.host = host;
    if (port != 0) config.http.port = port;

    try {
        config.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    calcmcp::MCPServer server(config.name, config.version);
    calcmcp::register_calculator_tools(server);

    std::cerr << "Calculator MCP server " << config.version
              << " (transport: " << config.transport << ")" << std::endl;

    if (config.transport == "http") {
        calcmcp::HTTPTransport http(server, config.to_http_config());
        return serve_until_signalled(http);
    }

    if (config.transport == "streamable") {
        calcmcp::StreamableHTTPTransport streamable(server, config.to_streamable_config());
        return serve_until_signalled(streamable);
    }

    calcmcp::StdioTransport stdio(server);
    try {
        return stdio.run(std::cin, std::cout);
    } catch (const std::exception& e) {
        std::cerr << "Server error: " << e.what() << std::endl;
        return 1;
    }
}
