/**
 * MCP Client Example
 *
 * Connects to a running calculator server, lists its tools and evaluates a
 * few calculations.
 */

#include <calcmcp/mcp_client.hpp>
#include <iostream>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <server-url> [--streamable]\n";
        std::cerr << "Example: " << argv[0] << " http://localhost:8080/mcp\n";
        return 1;
    }

    std::string url = argv[1];
    bool streamable = argc > 2 && std::string(argv[2]) == "--streamable";

    calcmcp::MCPClient client("example-client", "1.0.0");

    bool connected = streamable ? client.connect_streamable(url) : client.connect_http(url);
    if (!connected) {
        std::cerr << "Failed to connect to server\n";
        return 1;
    }

    std::cout << "Server: " << client.get_server_name()
              << " v" << client.get_server_version() << "\n";
    std::cout << "Protocol: " << client.get_protocol_version() << "\n\n";

    try {
        if (streamable) {
            client.open_session();
            client.set_prefer_event_stream(true);
        }

        std::cout << "Available tools:\n";
        for (const auto& tool : client.list_tools()) {
            std::cout << "  - " << tool.name << ": " << tool.description << "\n";
        }
        std::cout << "\n";

        auto sum = client.call_tool("basic_math", {{"operation", "add"}, {"operands", {5, 3}}});
        std::cout << "5 + 3 = " << sum.dump() << "\n";

        auto expr = client.call_tool("expression_eval", {
            {"expression", "2 * x + y"},
            {"variables", {{"x", 4}, {"y", 1.5}}}
        });
        std::cout << "2 * x + y = " << expr.dump() << "\n";

        auto miles = client.call_tool("unit_conversion", {
            {"value", 10}, {"fromUnit", "km"}, {"toUnit", "mi"}, {"category", "length"}
        });
        std::cout << "10 km in miles: " << miles.dump() << "\n\n";
    } catch (const std::exception& e) {
        std::cerr << "Request failed: " << e.what() << "\n";
        return 1;
    }

    client.disconnect();
    std::cout << "Disconnected.\n";
    return 0;
}
