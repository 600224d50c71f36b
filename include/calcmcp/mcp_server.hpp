#ifndef CALCMCP_MCP_SERVER_HPP
#define CALCMCP_MCP_SERVER_HPP

#include <string>
#include <calcmcp/jsonrpc.hpp>
#include <calcmcp/tool_registry.hpp>

namespace calcmcp {

/**
 * MCP dispatch engine.
 *
 * Resolves the JSON-RPC method of a request to initialize, tools/list or
 * tools/call and produces exactly one response. Holds no per-request state;
 * every failure is returned as an Error inside the response.
 */
class MCPServer {
public:
    MCPServer(const std::string& name, const std::string& version = "1.0.0");

    // Register tools
    void add_tool(const std::string& name, const std::string& description,
                  const json& input_schema, ToolFunction func);

    Response handle_request(const Request& request) const;

    // Convenience for callers holding a decoded JSON message
    json handle_message(const json& message) const;

    const ToolRegistry& tools() const { return tools_; }

    // Get server info
    std::string get_name() const { return server_name_; }
    std::string get_version() const { return server_version_; }

private:
    std::string server_name_;
    std::string server_version_;
    ToolRegistry tools_;

    json handle_initialize() const;
    json handle_tools_list() const;
    Response handle_tools_call(const Request& request) const;
};

} // namespace calcmcp

#endif // CALCMCP_MCP_SERVER_HPP
