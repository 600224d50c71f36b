#ifndef CALCMCP_STREAMABLE_HTTP_TRANSPORT_HPP
#define CALCMCP_STREAMABLE_HTTP_TRANSPORT_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>
#include <calcmcp/cors.hpp>
#include <calcmcp/http_server_host.hpp>
#include <calcmcp/mcp_server.hpp>
#include <calcmcp/periodic_task.hpp>
#include <calcmcp/session_store.hpp>

namespace calcmcp {

constexpr const char* kProtocolVersionHeader = "MCP-Protocol-Version";
constexpr const char* kSessionIdHeader = "Mcp-Session-Id";
constexpr const char* kEventStreamType = "text/event-stream";

// Streamable HTTP transport configuration
struct StreamableHTTPConfig {
    std::string host = "127.0.0.1";
    int port = 8080;
    std::chrono::milliseconds session_timeout = std::chrono::minutes(5);
    std::size_t max_connections = 100;
    bool cors_enabled = true;
    std::vector<std::string> cors_origins{"*"};
    std::chrono::milliseconds heartbeat_interval = std::chrono::seconds(30);
    std::chrono::milliseconds cleanup_interval = std::chrono::seconds(60);
    std::chrono::seconds read_timeout{30};
    std::chrono::seconds write_timeout{30};
    std::chrono::seconds idle_timeout{120};
};

// One SSE frame: "id: ...\nevent: ...\ndata: ...\n\n"
std::string format_sse_event(const std::string& id, const std::string& event, const std::string& data);

/**
 * Body of a GET /mcp event stream.
 *
 * Used as an httplib chunked content provider: the first call emits the
 * connection event, every later call blocks until the next heartbeat is due
 * and emits it. The stream finishes as soon as the cancellation signal fires
 * and aborts when the client is no longer writable.
 */
class SseStream {
public:
    SseStream(std::string session_id, std::chrono::milliseconds heartbeat_interval,
              const CancellationSignal& cancel);

    bool operator()(std::size_t offset, httplib::DataSink& sink);

    std::size_t heartbeats_sent() const { return heartbeats_; }

private:
    bool write_event(httplib::DataSink& sink, const std::string& event, const std::string& data);

    std::string session_id_;
    std::chrono::milliseconds heartbeat_interval_;
    const CancellationSignal& cancel_;
    bool connected_ = false;
    std::size_t heartbeats_ = 0;
};

/**
 * MCP streamable HTTP transport.
 *
 * A single /mcp endpoint. Every request must carry MCP-Protocol-Version; a
 * Mcp-Session-Id, when present, must name a live session. POST executes one
 * request and answers with JSON, or with a single SSE event for tools/call
 * when the client accepts text/event-stream. GET opens a long-lived event
 * stream and creates a session if the client has none.
 */
class StreamableHTTPTransport {
public:
    StreamableHTTPTransport(const MCPServer& server, StreamableHTTPConfig config = StreamableHTTPConfig());
    ~StreamableHTTPTransport();

    // Blocks until stop() is called from another thread
    void start();
    void start_background();

    // Ends open event streams, stops the reaper and drains the server.
    bool stop(std::chrono::milliseconds timeout);

    std::string get_addr() const { return host_.address(); }
    int port() const { return host_.port(); }

    SessionStore& sessions() { return sessions_; }

    // Route handlers
    bool handle_cors(const httplib::Request& req, httplib::Response& res) const;
    void handle_mcp(const httplib::Request& req, httplib::Response& res);

private:
    void setup_routes();
    void handle_post(const httplib::Request& req, httplib::Response& res, const std::string& session_id);
    void handle_get(const httplib::Request& req, httplib::Response& res, std::string session_id);

    // Only tool calls are worth streaming
    bool should_stream(const Request& request) const;

    void write_sse_response(httplib::Response& res, const Response& response, const std::string& session_id);
    void write_json_response(httplib::Response& res, const Response& response, const std::string& session_id);
    void setup_sse_stream(httplib::Response& res, const std::string& session_id);

    const MCPServer& server_;
    StreamableHTTPConfig config_;
    CorsPolicy cors_;
    SessionStore sessions_;
    CancellationSignal shutdown_;
    HttpServerHost host_;
};

} // namespace calcmcp

#endif // CALCMCP_STREAMABLE_HTTP_TRANSPORT_HPP
