// Streamable HTTP transport tests, driving the route handlers directly
#include <calcmcp/calculator_tools.hpp>
#include <calcmcp/mcp_client.hpp>
#include <calcmcp/streamable_http_transport.hpp>
#include <cassert>
#include <iostream>
#include <thread>

using namespace calcmcp;
using namespace std::chrono_literals;

namespace {

const char* kAddRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"basic_math","arguments":{"operation":"add","operands":[5,3]}}})";

httplib::Request make_request(const std::string& method, const std::string& body = "",
                              const std::string& accept = "application/json") {
    httplib::Request req;
    req.method = method;
    req.path = "/mcp";
    req.body = body;
    req.set_header(kProtocolVersionHeader, kProtocolVersion);
    if (!accept.empty()) {
        req.set_header("Accept", accept);
    }
    if (!body.empty()) {
        req.set_header("Content-Type", "application/json");
    }
    return req;
}

// Sink that records everything written to it
struct RecordingSink {
    httplib::DataSink sink;
    std::string written;
    bool writable = true;
    bool finished = false;

    RecordingSink() {
        sink.write = [this](const char* data, size_t size) {
            if (!writable) {
                return false;
            }
            written.append(data, size);
            return true;
        };
        sink.is_writable = [this] { return writable; };
        sink.done = [this] { finished = true; };
    }
};

} // namespace

int main() {
    std::cout << "Running streamable HTTP transport tests...\n";

    MCPServer server("streamable-test", "1.0.0");
    register_calculator_tools(server);

    StreamableHTTPConfig config;
    config.session_timeout = 200ms;
    config.heartbeat_interval = 50ms;
    StreamableHTTPTransport transport(server, config);

    // Test 1: Protocol version header is mandatory
    for (const std::string verb : {"GET", "POST", "DELETE", "PUT"}) {
        httplib::Request req;
        req.method = verb;
        req.path = "/mcp";
        req.body = kAddRequest;
        req.set_header("Accept", "application/json, text/event-stream");
        httplib::Response res;
        transport.handle_mcp(req, res);
        assert(res.status == 400);
    }
    std::cout << "✓ Missing MCP-Protocol-Version is HTTP 400\n";

    // Test 2: JSON POST
    httplib::Response res;
    transport.handle_mcp(make_request("POST", kAddRequest), res);
    assert(res.status == 200);
    json body = json::parse(res.body);
    assert(body["result"]["content"][0]["text"] == "8");
    assert(!res.has_header(kSessionIdHeader));
    std::cout << "✓ POST answered with JSON\n";

    // Test 3: SSE POST for tools/call
    res = httplib::Response();
    transport.handle_mcp(make_request("POST", kAddRequest, "application/json, text/event-stream"), res);
    assert(res.status == 200);
    assert(res.get_header_value("Content-Type") == kEventStreamType);
    assert(res.body.compare(0, 4, "id: ") == 0);
    assert(res.body.find("\nevent: message\n") != std::string::npos);
    assert(res.body.size() >= 2 && res.body.substr(res.body.size() - 2) == "\n\n");
    body = json::parse(extract_sse_data(res.body));
    assert(body["id"] == 1);
    assert(body["result"]["content"][0]["type"] == "text");
    assert(body["result"]["content"][0]["text"] == "8");
    std::cout << "✓ tools/call streamed as one SSE message\n";

    // Test 4: Other methods stay JSON even when SSE is accepted
    res = httplib::Response();
    transport.handle_mcp(make_request("POST", R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})",
                                      "text/event-stream, application/json"), res);
    assert(res.get_header_value("Content-Type") == "application/json");
    assert(json::parse(res.body)["result"]["tools"].size() == 6);
    std::cout << "✓ tools/list not streamed\n";

    // Test 5: Dispatch error status on JSON POST
    res = httplib::Response();
    transport.handle_mcp(make_request("POST",
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"nonexistent"}})"), res);
    assert(res.status == 404);
    assert(json::parse(res.body)["error"]["code"] == -32601);

    res = httplib::Response();
    transport.handle_mcp(make_request("POST", R"({"jsonrpc":"2.0","id":9,"method":[]})"), res);
    assert(res.status == 400);
    body = json::parse(res.body);
    assert(body["id"] == 9);
    assert(body["error"]["code"] == -32600);

    res = httplib::Response();
    transport.handle_mcp(make_request("POST", "{\"id\":1,\"method\":\"x\xff\"}"), res);
    assert(res.status == 400);
    assert(json::parse(res.body)["error"]["code"] == -32600);
    std::cout << "✓ Errors on POST\n";

    // Test 6: Accept header checks and verbs
    res = httplib::Response();
    transport.handle_mcp(make_request("POST", kAddRequest, "text/html"), res);
    assert(res.status == 400);

    res = httplib::Response();
    transport.handle_mcp(make_request("GET", "", "application/json"), res);
    assert(res.status == 400);

    res = httplib::Response();
    transport.handle_mcp(make_request("DELETE"), res);
    assert(res.status == 405);
    std::cout << "✓ Accept header and verb checks\n";

    // Test 7: GET opens a stream and creates a session
    std::size_t sessions_before = transport.sessions().size();
    res = httplib::Response();
    transport.handle_mcp(make_request("GET", "", kEventStreamType), res);
    assert(res.status == 200);
    std::string session_id = res.get_header_value(kSessionIdHeader);
    assert(session_id.size() == 32);
    assert(res.get_header_value("Cache-Control") == "no-cache");
    assert(transport.sessions().size() == sessions_before + 1);
    assert(transport.sessions().is_valid(session_id));
    std::cout << "✓ GET creates a session\n";

    // Test 8: Session header is validated and echoed
    httplib::Request with_session = make_request("POST", kAddRequest);
    with_session.set_header(kSessionIdHeader, session_id);
    res = httplib::Response();
    transport.handle_mcp(with_session, res);
    assert(res.status == 200);
    assert(res.get_header_value(kSessionIdHeader) == session_id);

    httplib::Request bogus = make_request("POST", kAddRequest);
    bogus.set_header(kSessionIdHeader, "not-a-session");
    res = httplib::Response();
    transport.handle_mcp(bogus, res);
    assert(res.status == 401);
    std::cout << "✓ Session header validated\n";

    // Test 9: Sessions expire after the idle timeout
    std::this_thread::sleep_for(300ms);
    res = httplib::Response();
    transport.handle_mcp(with_session, res);
    assert(res.status == 401);
    assert(transport.sessions().reap_expired() >= 1);
    std::cout << "✓ Idle session rejected\n";

    // Test 10: SSE stream emits connection then heartbeats, ends on cancel
    CancellationSignal cancel;
    SseStream stream("abc", 20ms, cancel);
    RecordingSink recorder;
    assert(stream(0, recorder.sink));
    assert(recorder.written.find("event: connection\n") != std::string::npos);
    json connected = json::parse(extract_sse_data(recorder.written));
    assert(connected["type"] == "connected");
    assert(connected["session_id"] == "abc");

    recorder.written.clear();
    assert(stream(0, recorder.sink));
    assert(recorder.written.find("event: heartbeat\n") != std::string::npos);
    assert(json::parse(extract_sse_data(recorder.written))["type"] == "ping");
    assert(stream(0, recorder.sink));
    assert(stream.heartbeats_sent() == 2);

    std::thread canceller([&cancel] {
        std::this_thread::sleep_for(5ms);
        cancel.cancel();
    });
    SseStream slow("def", 10s, cancel);
    RecordingSink slow_recorder;
    assert(slow(0, slow_recorder.sink));
    auto started = std::chrono::steady_clock::now();
    assert(slow(0, slow_recorder.sink));
    canceller.join();
    assert(slow_recorder.finished);
    assert(std::chrono::steady_clock::now() - started < 5s);
    assert(slow.heartbeats_sent() == 0);
    std::cout << "✓ SSE stream lifecycle\n";

    // Test 11: Stream gives up on a client that went away
    CancellationSignal never;
    SseStream orphan("ghi", 10s, never);
    RecordingSink gone;
    assert(orphan(0, gone.sink));
    gone.writable = false;
    assert(!orphan(0, gone.sink));
    assert(!gone.finished);
    std::cout << "✓ Disconnected client ends stream\n";

    // Test 12: Frame format
    assert(format_sse_event("1", "message", "{}") == "id: 1\nevent: message\ndata: {}\n\n");
    std::cout << "✓ SSE framing\n";

    // Test 13: CORS pre-flight with MCP headers
    httplib::Request preflight;
    preflight.method = "OPTIONS";
    preflight.path = "/mcp";
    preflight.set_header("Origin", "http://x.test");
    res = httplib::Response();
    assert(transport.handle_cors(preflight, res));
    assert(res.status == 200);
    assert(res.get_header_value("Access-Control-Allow-Origin") == "http://x.test");
    assert(res.get_header_value("Access-Control-Allow-Headers").find("Mcp-Session-Id") != std::string::npos);
    std::cout << "✓ CORS pre-flight\n";

    std::cout << "\nAll tests passed!\n";
    return 0;
}
