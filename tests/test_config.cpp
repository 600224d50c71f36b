// Configuration tests
#include <calcmcp/config.hpp>
#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <unistd.h>

using namespace calcmcp;
using namespace std::chrono_literals;

namespace {

bool rejects(const ServerConfig& config) {
    try {
        config.validate();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

std::string write_temp_file(const std::string& content) {
    std::string path = "/tmp/calcmcp_config_test_" + std::to_string(getpid()) + ".json";
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

int main() {
    std::cout << "Running config tests...\n";

    // Test 1: Durations
    assert(parse_duration("250ms") == 250ms);
    assert(parse_duration("30s") == 30s);
    assert(parse_duration("5m") == 5min);
    assert(parse_duration("2h") == 2h);
    assert(parse_duration("45") == 45s);
    assert(parse_duration(json(12)) == 12s);
    for (const json& bad : {json("fast"), json("10d"), json(1.5), json(true)}) {
        bool threw = false;
        try {
            parse_duration(bad);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }
    std::cout << "✓ Duration parsing\n";

    // Test 2: Defaults
    ServerConfig defaults = ConfigLoader::from_json(json::object());
    assert(defaults.name == "calculator-server");
    assert(defaults.version == "1.1.0");
    assert(defaults.transport == "stdio");
    assert(defaults.http.host == "0.0.0.0");
    assert(defaults.http.port == 8080);
    assert(defaults.http.session_timeout == 5min);
    assert(defaults.http.max_connections == 100);
    assert(defaults.http.heartbeat_interval == 30s);
    assert(defaults.http.cleanup_interval == 60s);
    assert(defaults.http.cors.enabled);
    assert(defaults.http.cors.origins == std::vector<std::string>{"*"});
    assert(defaults.http.timeout.idle == 120s);
    defaults.validate();
    std::cout << "✓ Defaults\n";

    // Test 3: Full document
    json document = {
        {"server", {
            {"name", "calc"},
            {"transport", "streamable"},
            {"http", {
                {"host", "127.0.0.1"},
                {"port", 9090},
                {"session_timeout", "10m"},
                {"max_connections", 8},
                {"heartbeat_interval", "5s"},
                {"cleanup_interval", "1m"},
                {"cors", {{"enabled", true}, {"origins", {"http://a.test", "http://b.test"}}}},
                {"timeout", {{"read", "10s"}, {"write", 15}, {"idle", "1m"}}}
            }}
        }}
    };
    ServerConfig config = ConfigLoader::from_json(document);
    assert(config.name == "calc");
    assert(config.version == "1.1.0");
    assert(config.transport == "streamable");
    assert(config.http.port == 9090);
    assert(config.http.session_timeout == 10min);
    assert(config.http.cors.origins.size() == 2);
    assert(config.http.timeout.write == 15s);
    config.validate();
    std::cout << "✓ Document parsed\n";

    // Test 4: Conversion to transport settings
    StreamableHTTPConfig streamable = config.to_streamable_config();
    assert(streamable.host == "127.0.0.1");
    assert(streamable.port == 9090);
    assert(streamable.session_timeout == 10min);
    assert(streamable.heartbeat_interval == 5s);
    assert(streamable.cleanup_interval == 1min);
    assert(streamable.max_connections == 8);
    assert(streamable.read_timeout == 10s);
    assert(streamable.idle_timeout == 60s);

    HTTPConfig http = config.to_http_config();
    assert(http.port == 9090);
    assert(http.version == "1.1.0");
    assert(http.cors_origins == config.http.cors.origins);
    std::cout << "✓ Transport settings\n";

    // Test 5: Validation
    ServerConfig invalid = defaults;
    invalid.transport = "websocket";
    assert(rejects(invalid));
    invalid = defaults;
    invalid.http.port = 0;
    assert(rejects(invalid));
    invalid = defaults;
    invalid.http.port = 70000;
    assert(rejects(invalid));
    invalid = defaults;
    invalid.http.session_timeout = 0ms;
    assert(rejects(invalid));
    invalid = defaults;
    invalid.http.max_connections = 0;
    assert(rejects(invalid));
    invalid = defaults;
    invalid.http.cors.origins.clear();
    assert(rejects(invalid));
    invalid.http.cors.enabled = false;
    assert(!rejects(invalid));
    std::cout << "✓ Validation\n";

    // Test 6: Loader
    std::string path = write_temp_file(R"({"server": {"transport": "http", "http": {"port": 8181}}})");
    ConfigLoader loader(path);
    assert(loader.load());
    assert(loader.get_config().transport == "http");
    assert(loader.get_config().http.port == 8181);
    std::remove(path.c_str());

    path = write_temp_file("{ not json");
    ConfigLoader broken(path);
    assert(!broken.load());
    std::remove(path.c_str());

    ConfigLoader missing("/nonexistent/calcmcp.json");
    assert(!missing.load());
    std::cout << "✓ Config loader\n";

    std::cout << "\nAll tests passed!\n";
    return 0;
}
