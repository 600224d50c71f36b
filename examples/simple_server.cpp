/**
 * Simple MCP Server Example
 *
 * Registers one custom tool next to the calculator tools and serves them
 * over stdio or plain HTTP.
 */

#include <calcmcp/calculator_tools.hpp>
#include <calcmcp/http_transport.hpp>
#include <calcmcp/mcp_server.hpp>
#include <calcmcp/stdio_transport.hpp>
#include <iostream>

int main(int argc, char* argv[]) {
    // Create MCP server
    calcmcp::MCPServer server("simple-example", "1.0.0");
    calcmcp::register_calculator_tools(server);

    server.add_tool(
        "hypotenuse",
        "Length of the hypotenuse of a right triangle",
        {
            {"type", "object"},
            {"properties", {
                {"a", {{"type", "number"}, {"description", "First leg"}}},
                {"b", {{"type", "number"}, {"description", "Second leg"}}}
            }},
            {"required", {"a", "b"}}
        },
        [](const json& args) -> json {
            double a = args.at("a").get<double>();
            double b = args.at("b").get<double>();
            return calcmcp::evaluate_expression("sqrt(a^2 + b^2)", {{"a", a}, {"b", b}});
        }
    );

    if (argc < 2) {
        std::cerr << "Usage:\n"
                  << "  STDIO mode: " << argv[0] << " stdio\n"
                  << "  HTTP mode:  " << argv[0] << " http [port]\n";
        return 1;
    }

    std::string mode = argv[1];
    if (mode == "stdio") {
        calcmcp::StdioTransport transport(server);
        return transport.run(std::cin, std::cout);
    } else if (mode == "http") {
        calcmcp::HTTPConfig config;
        config.port = (argc > 2) ? std::stoi(argv[2]) : 8080;
        calcmcp::HTTPTransport transport(server, config);
        transport.start();
        return 0;
    }

    std::cerr << "Error: Unknown mode '" << mode << "'\n";
    return 1;
}
