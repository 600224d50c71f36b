// End-to-end tests: real servers on loopback, driven by the libcurl client
#include <calcmcp/calculator_tools.hpp>
#include <calcmcp/http_transport.hpp>
#include <calcmcp/mcp_client.hpp>
#include <calcmcp/streamable_http_transport.hpp>
#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>

using namespace calcmcp;
using namespace std::chrono_literals;

namespace {

std::string first_text(const json& result) {
    return result["content"][0]["text"].get<std::string>();
}

} // namespace

int main() {
    std::cout << "Running client tests...\n";

    MCPServer server("e2e-server", "3.1.4");
    register_calculator_tools(server);

    // Test 1: Client creation
    MCPClient idle("test-client", "1.0.0");
    assert(!idle.is_connected());
    assert(extract_sse_data("id: 1\nevent: message\ndata: {\"a\":1}\n\n") == "{\"a\":1}");
    assert(extract_sse_data("event: x\n\n").empty());
    std::cout << "✓ Client created\n";

    // Test 2: Plain HTTP transport
    {
        HTTPConfig config;
        config.host = "127.0.0.1";
        config.port = 0;
        HTTPTransport transport(server, config);
        transport.start_background();
        assert(transport.port() > 0);

        MCPClient client("test-client", "1.0.0");
        assert(client.connect_http("http://127.0.0.1:" + std::to_string(transport.port()) + "/mcp"));
        assert(client.get_server_name() == "e2e-server");
        assert(client.get_server_version() == "3.1.4");
        assert(client.get_protocol_version() == kProtocolVersion);

        assert(client.list_tools().size() == 6);
        json result = client.call_tool("basic_math", {{"operation", "add"}, {"operands", {5, 3}}});
        assert(first_text(result) == "8");

        HttpReply reply = client.post(
            R"({"jsonrpc":"2.0","id":"x","method":"tools/call","params":{"name":"nonexistent"}})");
        assert(reply.status == 404);
        json body = json::parse(reply.body);
        assert(body["id"] == "x");
        assert(body["error"]["code"] == -32601);

        json error = client.send_request("tools/call", {{"name", "statistics"},
                                                        {"arguments", {{"operation", "mean"}}}});
        assert(error["error"]["code"] == -32603);

        client.disconnect();
        assert(transport.stop(5s));
    }
    std::cout << "✓ HTTP round trip\n";

    // Test 3: Streamable HTTP transport
    {
        StreamableHTTPConfig config;
        config.port = 0;
        config.heartbeat_interval = 100ms;
        StreamableHTTPTransport transport(server, config);
        transport.start_background();

        MCPClient client("test-client", "1.0.0");
        assert(client.connect_streamable("http://127.0.0.1:" + std::to_string(transport.port()) + "/mcp"));
        assert(client.get_server_name() == "e2e-server");

        std::string session = client.open_session();
        assert(session.size() == 32);
        assert(transport.sessions().is_valid(session));

        client.set_prefer_event_stream(true);
        json result = client.call_tool("expression_eval", {{"expression", "6 * 7"}});
        assert(first_text(result) == "42");
        assert(client.get_session_id() == session);

        client.set_prefer_event_stream(false);
        assert(client.list_tools().size() == 6);

        client.disconnect();
        assert(transport.stop(5s));
    }
    std::cout << "✓ Streamable HTTP round trip\n";

    // Test 4: Stopping with an event stream open ends the stream promptly
    {
        StreamableHTTPConfig config;
        config.host = "127.0.0.1";
        config.port = 0;
        config.heartbeat_interval = 10s;
        StreamableHTTPTransport transport(server, config);
        transport.start_background();

        std::atomic<bool> connected{false};
        std::atomic<bool> stream_ended{false};
        std::thread listener([&] {
            httplib::Client cli("127.0.0.1", transport.port());
            httplib::Headers headers = {
                {"Accept", kEventStreamType},
                {kProtocolVersionHeader, kProtocolVersion}
            };
            cli.Get("/mcp", headers, [&](const char* data, size_t size) {
                if (std::string(data, size).find("event: connection") != std::string::npos) {
                    connected = true;
                }
                return true;
            });
            stream_ended = true;
        });

        for (int i = 0; i < 200 && !connected; i++) {
            std::this_thread::sleep_for(10ms);
        }
        assert(connected);

        auto started = std::chrono::steady_clock::now();
        assert(transport.stop(2s));
        assert(std::chrono::steady_clock::now() - started < 2s);

        listener.join();
        assert(stream_ended);
    }
    std::cout << "✓ Stop ends open streams\n";

    // Test 5: A handler running past the deadline makes stop() report failure
    {
        MCPServer slow_server("slow-server", "1.0.0");
        std::atomic<bool> handler_started{false};
        slow_server.add_tool("slow", "Sleeps before answering", {{"type", "object"}},
                             [&](const json&) -> json {
                                 handler_started = true;
                                 std::this_thread::sleep_for(500ms);
                                 return "done";
                             });

        HTTPConfig config;
        config.host = "127.0.0.1";
        config.port = 0;
        HTTPTransport transport(slow_server, config);
        transport.start_background();

        std::thread caller([&] {
            httplib::Client cli("127.0.0.1", transport.port());
            cli.Post("/mcp",
                     R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"slow"}})",
                     "application/json");
        });

        for (int i = 0; i < 200 && !handler_started; i++) {
            std::this_thread::sleep_for(10ms);
        }
        assert(handler_started);

        assert(!transport.stop(50ms));
        caller.join();
        // The transport destructor waits for the late handler
    }
    std::cout << "✓ Deadline exceeded reported\n";

    // Test 6: Connecting to nothing fails cleanly
    MCPClient unreachable("test-client", "1.0.0");
    assert(!unreachable.connect_http("http://127.0.0.1:1/mcp"));
    std::cout << "✓ Connection failure reported\n";

    std::cout << "\nAll tests passed!\n";
    return 0;
}
