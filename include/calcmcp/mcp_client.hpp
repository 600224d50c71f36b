#ifndef CALCMCP_MCP_CLIENT_HPP
#define CALCMCP_MCP_CLIENT_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace calcmcp {

// Tool metadata as advertised by tools/list
struct RemoteTool {
    std::string name;
    std::string description;
    json input_schema;
};

// Outcome of one HTTP exchange
struct HttpReply {
    long status = 0;
    std::string body;
    std::string content_type;
    std::string session_id;
};

/**
 * MCP client for the HTTP transports.
 *
 * connect_http() talks to the plain transport (POST <url>), connect_streamable()
 * to the streamable one, adding the protocol version header and the session id
 * obtained by open_session(). Transport failures throw std::runtime_error;
 * JSON-RPC errors are returned inside the response object.
 */
class MCPClient {
public:
    MCPClient(const std::string& name = "calcmcp-client", const std::string& version = "1.0.0");
    ~MCPClient();

    MCPClient(const MCPClient&) = delete;
    MCPClient& operator=(const MCPClient&) = delete;

    // Connection methods
    bool connect_http(const std::string& url);
    bool connect_streamable(const std::string& url);
    void disconnect();
    bool is_connected() const { return connected_; }

    // MCP Protocol methods
    bool initialize();
    std::vector<RemoteTool> list_tools();
    json call_tool(const std::string& name, const json& arguments);

    // Full JSON-RPC response for an arbitrary method
    json send_request(const std::string& method, const json& params = nullptr);

    // Streamable mode: open the event stream long enough to obtain a session.
    // Returns the session id, or an empty string on failure.
    std::string open_session();

    // Ask for SSE framing of tool results (streamable mode)
    void set_prefer_event_stream(bool prefer) { prefer_event_stream_ = prefer; }

    // Raw exchange, exposed for status-code checks
    HttpReply post(const std::string& body);

    std::string get_server_name() const { return server_name_; }
    std::string get_server_version() const { return server_version_; }
    std::string get_protocol_version() const { return protocol_version_; }
    std::string get_session_id() const { return session_id_; }

private:
    enum class TransportType { HTTP, STREAMABLE };

    std::vector<std::string> request_headers(bool event_stream_get) const;

    std::string client_name_;
    std::string client_version_;
    std::string server_name_;
    std::string server_version_;
    std::string protocol_version_;

    bool connected_ = false;
    int request_id_ = 0;
    bool prefer_event_stream_ = false;

    TransportType transport_type_ = TransportType::HTTP;
    std::string url_;
    std::string session_id_;
};

// Payload of the first "data:" line of an SSE frame; empty if there is none
std::string extract_sse_data(const std::string& frame);

} // namespace calcmcp

#endif // CALCMCP_MCP_CLIENT_HPP
