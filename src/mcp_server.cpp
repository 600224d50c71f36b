#include <calcmcp/mcp_server.hpp>
#include <exception>
#include <stdexcept>

namespace calcmcp {

MCPServer::MCPServer(const std::string& name, const std::string& version)
    : server_name_(name), server_version_(version) {
}

void MCPServer::add_tool(const std::string& name, const std::string& description,
                         const json& input_schema, ToolFunction func) {
    tools_.add_tool(name, description, input_schema, std::move(func));
}

json MCPServer::handle_initialize() const {
    // MCP protocol requires capabilities to be objects, not booleans
    return {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", {
            {"tools", json::object()}
        }},
        {"serverInfo", {
            {"name", server_name_},
            {"version", server_version_}
        }}
    };
}

json MCPServer::handle_tools_list() const {
    json tools_array = json::array();

    for (const auto& tool : tools_.list()) {
        tools_array.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.input_schema}
        });
    }

    return {{"tools", tools_array}};
}

Response MCPServer::handle_tools_call(const Request& request) const {
    const json& params = request.params;

    if (!params.is_object()) {
        return make_error_response(request.id, ErrorCode::InvalidParams, "Invalid parameters",
                                   "params must be an object");
    }

    std::string tool_name;
    auto name_it = params.find("name");
    if (name_it != params.end() && !name_it->is_null()) {
        if (!name_it->is_string()) {
            return make_error_response(request.id, ErrorCode::InvalidParams, "Invalid parameters",
                                       "name must be a string");
        }
        tool_name = name_it->get<std::string>();
    }

    json arguments = json::object();
    auto args_it = params.find("arguments");
    if (args_it != params.end() && !args_it->is_null()) {
        if (!args_it->is_object()) {
            return make_error_response(request.id, ErrorCode::InvalidParams, "Invalid parameters",
                                       "arguments must be an object");
        }
        arguments = *args_it;
    }

    const Tool* tool = tools_.find(tool_name);
    if (tool == nullptr) {
        return make_error_response(request.id, ErrorCode::MethodNotFound, "Tool not found", tool_name);
    }

    json result;
    try {
        result = tool->function(arguments);
    } catch (const std::exception& e) {
        return make_error_response(request.id, ErrorCode::InternalError, "Tool execution failed",
                                   e.what());
    }

    // MCP tool results are a list of content blocks
    return make_result_response(request.id, {
        {"content", json::array({
            {
                {"type", "text"},
                {"text", result.dump(-1, ' ', false, json::error_handler_t::replace)}
            }
        })}
    });
}

Response MCPServer::handle_request(const Request& request) const {
    try {
        if (request.method == "initialize") {
            return make_result_response(request.id, handle_initialize());
        }
        if (request.method == "tools/list") {
            return make_result_response(request.id, handle_tools_list());
        }
        if (request.method == "tools/call") {
            return handle_tools_call(request);
        }
        return make_error_response(request.id, ErrorCode::MethodNotFound, "Method not found",
                                   request.method);
    } catch (const std::exception& e) {
        // Serializing a result can still throw (invalid UTF-8 from a tool).
        return make_error_response(request.id, ErrorCode::InternalError, "Internal error", e.what());
    }
}

json MCPServer::handle_message(const json& message) const {
    try {
        return handle_request(parse_request(message)).to_json();
    } catch (const std::invalid_argument& e) {
        json id = message.is_object() ? message.value("id", json()) : json();
        if (!id.is_null() && !id.is_string() && !id.is_number()) {
            id = nullptr;
        }
        return make_error_response(id, ErrorCode::InvalidRequest, "Invalid JSON-RPC request",
                                   e.what()).to_json();
    }
}

} // namespace calcmcp
