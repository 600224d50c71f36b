#ifndef CALCMCP_HTTP_TRANSPORT_HPP
#define CALCMCP_HTTP_TRANSPORT_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <calcmcp/cors.hpp>
#include <calcmcp/http_server_host.hpp>
#include <calcmcp/mcp_server.hpp>

namespace calcmcp {

// HTTP transport configuration
struct HTTPConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    bool cors_enabled = true;
    std::vector<std::string> cors_origins{"*"};
    std::chrono::seconds read_timeout{30};
    std::chrono::seconds write_timeout{30};
    std::chrono::seconds idle_timeout{120};
    std::size_t max_connections = 100;
    std::string version = "1.1.0";  // reported by /health and /metrics
};

/**
 * Request/response HTTP transport.
 *
 *   POST /mcp      one JSON-RPC request, one JSON-RPC response
 *   GET  /health   liveness probe
 *   GET  /tools    shortcut for tools/list
 *   GET  /metrics  request counters
 *
 * Dispatch errors are mapped onto HTTP status codes.
 */
class HTTPTransport {
public:
    HTTPTransport(const MCPServer& server, HTTPConfig config = HTTPConfig());

    // Blocks until stop() is called from another thread
    void start();
    void start_background();
    bool stop(std::chrono::milliseconds timeout);

    std::string get_addr() const { return host_.address(); }
    int port() const { return host_.port(); }

    // Route handlers
    bool handle_cors(const httplib::Request& req, httplib::Response& res) const;
    void handle_mcp(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res) const;
    void handle_tools_list(const httplib::Request& req, httplib::Response& res) const;
    void handle_metrics(const httplib::Request& req, httplib::Response& res) const;

private:
    void setup_routes();
    void write_json_response(httplib::Response& res, const json& data, int status) const;

    const MCPServer& server_;
    HTTPConfig config_;
    CorsPolicy cors_;
    HttpServerHost host_;

    std::chrono::system_clock::time_point start_time_;
    std::atomic<std::uint64_t> requests_total_{0};
    std::atomic<std::uint64_t> requests_success_{0};
    std::atomic<std::uint64_t> requests_errors_{0};
};

// RFC 3339 timestamp in UTC, second precision
std::string format_rfc3339(std::chrono::system_clock::time_point tp);

// Compact duration text ("1h2m3s")
std::string format_uptime(std::chrono::seconds elapsed);

} // namespace calcmcp

#endif // CALCMCP_HTTP_TRANSPORT_HPP
