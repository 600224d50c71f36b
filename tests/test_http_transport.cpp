// HTTP transport tests, driving the route handlers directly
#include <calcmcp/calculator_tools.hpp>
#include <calcmcp/http_transport.hpp>
#include <cassert>
#include <iostream>

using namespace calcmcp;

namespace {

httplib::Request make_post(const std::string& body, const std::string& content_type = "application/json") {
    httplib::Request req;
    req.method = "POST";
    req.path = "/mcp";
    req.body = body;
    if (!content_type.empty()) {
        req.set_header("Content-Type", content_type);
    }
    return req;
}

httplib::Request make_get(const std::string& path) {
    httplib::Request req;
    req.method = "GET";
    req.path = path;
    return req;
}

} // namespace

int main() {
    std::cout << "Running HTTP transport tests...\n";

    MCPServer server("http-test", "1.0.0");
    register_calculator_tools(server);

    HTTPConfig config;
    config.version = "9.9.9";
    HTTPTransport transport(server, config);

    // Test 1: Successful tools/call
    httplib::Response res;
    transport.handle_mcp(make_post(
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"basic_math","arguments":{"operation":"add","operands":[5,3]}}})"),
        res);
    assert(res.status == 200);
    assert(res.get_header_value("Content-Type") == "application/json");
    json body = json::parse(res.body);
    assert(body["id"] == 1);
    assert(body["result"]["content"][0]["text"] == "8");
    std::cout << "✓ POST /mcp tools/call\n";

    // Test 2: Unknown tool maps to 404
    res = httplib::Response();
    transport.handle_mcp(make_post(
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"nonexistent"}})"), res);
    assert(res.status == 404);
    body = json::parse(res.body);
    assert(body["error"]["code"] == -32601);
    assert(body["error"]["data"] == "nonexistent");
    std::cout << "✓ Unknown tool is HTTP 404\n";

    // Test 3: Other dispatch errors
    res = httplib::Response();
    transport.handle_mcp(make_post(R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":[]})"), res);
    assert(res.status == 400);
    assert(json::parse(res.body)["error"]["code"] == -32602);

    res = httplib::Response();
    transport.handle_mcp(make_post(
        R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"basic_math","arguments":{"operation":"divide","operands":[1,0]}}})"),
        res);
    assert(res.status == 500);
    assert(json::parse(res.body)["error"]["code"] == -32603);

    res = httplib::Response();
    transport.handle_mcp(make_post(R"({"jsonrpc":"2.0","id":5,"method":"unknown"})"), res);
    assert(res.status == 404);
    std::cout << "✓ Error status mapping\n";

    // Test 4: Malformed bodies
    res = httplib::Response();
    transport.handle_mcp(make_post("{nope"), res);
    assert(res.status == 400);
    body = json::parse(res.body);
    assert(body["id"].is_null());
    assert(body["error"]["code"] == -32600);

    res = httplib::Response();
    transport.handle_mcp(make_post(R"({"id":6,"method":42})"), res);
    assert(res.status == 400);
    assert(json::parse(res.body)["id"] == 6);

    res = httplib::Response();
    transport.handle_mcp(make_post("{\"id\":1,\"method\":\"x\xff\"}"), res);
    assert(res.status == 400);
    assert(json::parse(res.body)["error"]["code"] == -32600);
    std::cout << "✓ Invalid JSON-RPC is HTTP 400\n";

    // Test 5: Content type and verb checks
    res = httplib::Response();
    transport.handle_mcp(make_post(R"({"id":1,"method":"initialize"})", "text/plain"), res);
    assert(res.status == 400);

    res = httplib::Response();
    transport.handle_mcp(make_post(R"({"id":1,"method":"initialize"})", ""), res);
    assert(res.status == 400);

    res = httplib::Response();
    transport.handle_mcp(make_get("/mcp"), res);
    assert(res.status == 405);

    res = httplib::Response();
    httplib::Request post_health = make_post("{}");
    post_health.path = "/health";
    transport.handle_health(post_health, res);
    assert(res.status == 405);
    std::cout << "✓ Content type and method checks\n";

    // Test 6: Health
    res = httplib::Response();
    transport.handle_health(make_get("/health"), res);
    assert(res.status == 200);
    body = json::parse(res.body);
    assert(body["status"] == "healthy");
    assert(body["version"] == "9.9.9");
    assert(body["timestamp"].get<std::string>().back() == 'Z');
    std::cout << "✓ GET /health\n";

    // Test 7: Tools shortcut
    res = httplib::Response();
    transport.handle_tools_list(make_get("/tools"), res);
    assert(res.status == 200);
    body = json::parse(res.body);
    assert(body["id"] == "tools-list");
    assert(body["result"]["tools"].size() == 6);
    std::cout << "✓ GET /tools\n";

    // Test 8: Metrics count /mcp requests
    res = httplib::Response();
    transport.handle_metrics(make_get("/metrics"), res);
    assert(res.status == 200);
    body = json::parse(res.body);
    assert(body["server"]["transport"] == "http");
    assert(body["server"]["version"] == "9.9.9");
    assert(body["requests"]["total"] == 9);
    assert(body["requests"]["success"] == 1);
    assert(body["requests"]["errors"] == 8);
    std::cout << "✓ GET /metrics\n";

    // Test 9: CORS pre-flight
    httplib::Request preflight;
    preflight.method = "OPTIONS";
    preflight.path = "/mcp";
    preflight.set_header("Origin", "http://x.test");
    res = httplib::Response();
    assert(transport.handle_cors(preflight, res));
    assert(res.status == 200);
    assert(res.get_header_value("Access-Control-Allow-Origin") == "http://x.test");
    assert(res.get_header_value("Access-Control-Allow-Methods") == "GET, POST, OPTIONS");
    assert(res.get_header_value("Access-Control-Max-Age") == "86400");
    std::cout << "✓ CORS pre-flight\n";

    // Test 10: CORS allow-list and disabled policy
    CorsPolicy restricted(true, {"http://allowed.test"}, "Content-Type");
    httplib::Request cross = make_get("/health");
    cross.set_header("Origin", "http://other.test");
    res = httplib::Response();
    assert(!restricted.apply(cross, res));
    assert(!res.has_header("Access-Control-Allow-Origin"));
    assert(restricted.is_origin_allowed("http://allowed.test"));

    CorsPolicy disabled(false, {"*"}, "Content-Type");
    res = httplib::Response();
    assert(!disabled.apply(preflight, res));
    assert(!res.has_header("Access-Control-Allow-Origin"));
    std::cout << "✓ CORS origins\n";

    // Test 11: Formatting helpers
    assert(format_uptime(std::chrono::seconds(0)) == "0s");
    assert(format_uptime(std::chrono::seconds(75)) == "1m15s");
    assert(format_uptime(std::chrono::seconds(3723)) == "1h2m3s");
    assert(format_rfc3339(std::chrono::system_clock::time_point()) == "1970-01-01T00:00:00Z");
    std::cout << "✓ Uptime and timestamp formatting\n";

    std::cout << "\nAll tests passed!\n";
    return 0;
}
