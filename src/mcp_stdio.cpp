#include <calcmcp/stdio_transport.hpp>
#include <iostream>
#include <stdexcept>

namespace calcmcp {

namespace {

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

StdioTransport::StdioTransport(const MCPServer& server)
    : server_(server) {
}

std::string StdioTransport::handle_line(const std::string& line) const {
    if (is_blank(line)) {
        return {};
    }

    Request request;
    try {
        request = parse_request(line);
    } catch (const json::exception& e) {
        std::cerr << "JSON error: " << e.what() << std::endl;
        return make_error_response(nullptr, ErrorCode::InvalidRequest, "Parse error", e.what())
            .dump();
    } catch (const std::invalid_argument& e) {
        return make_error_response(recover_request_id(line), ErrorCode::InvalidRequest,
                                   "Invalid JSON-RPC request", e.what()).dump();
    }

    return server_.handle_request(request).dump();
}

int StdioTransport::run(std::istream& in, std::ostream& out) {
    std::cerr << "MCP Server '" << server_.get_name() << "' starting in STDIO mode..." << std::endl;

    std::string line;
    while (std::getline(in, line)) {
        std::string response = handle_line(line);
        if (response.empty()) {
            continue;
        }
        out << response << '\n';
        out.flush();
    }

    if (in.bad()) {
        throw std::runtime_error("failed to read from input stream");
    }

    std::cerr << "STDIO input closed, shutting down" << std::endl;
    return 0;
}

} // namespace calcmcp
