#ifndef CALCMCP_CONFIG_HPP
#define CALCMCP_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <calcmcp/http_transport.hpp>
#include <calcmcp/streamable_http_transport.hpp>

using json = nlohmann::json;

namespace calcmcp {

// ==================== CONFIGURATION STRUCTURES ====================

struct CorsConfig {
    bool enabled = true;
    std::vector<std::string> origins{"*"};
};

struct TimeoutConfig {
    std::chrono::milliseconds read = std::chrono::seconds(30);
    std::chrono::milliseconds write = std::chrono::seconds(30);
    std::chrono::milliseconds idle = std::chrono::seconds(120);
};

struct HttpServerConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    std::chrono::milliseconds session_timeout = std::chrono::minutes(5);
    std::size_t max_connections = 100;
    std::chrono::milliseconds heartbeat_interval = std::chrono::seconds(30);
    std::chrono::milliseconds cleanup_interval = std::chrono::seconds(60);
    CorsConfig cors;
    TimeoutConfig timeout;
};

struct ServerConfig {
    std::string name = "calculator-server";
    std::string version = "1.1.0";
    std::string transport = "stdio";  // stdio, http or streamable
    HttpServerConfig http;

    // Throws std::invalid_argument naming the first offending setting
    void validate() const;

    HTTPConfig to_http_config() const;
    StreamableHTTPConfig to_streamable_config() const;
};

// "250ms", "30s", "5m", "1h" or a bare number of seconds
std::chrono::milliseconds parse_duration(const json& value);

// ==================== CONFIGURATION LOADER ====================

class ConfigLoader {
public:
    explicit ConfigLoader(const std::string& config_path);

    // Reads and merges the file over the defaults. Logs and returns false on failure.
    bool load();

    const ServerConfig& get_config() const { return config_; }
    ServerConfig& get_config() { return config_; }

    // Merge a parsed document over the defaults. Throws on malformed values.
    static ServerConfig from_json(const json& document);

private:
    std::string config_path_;
    ServerConfig config_;
};

} // namespace calcmcp

#endif // CALCMCP_CONFIG_HPP
