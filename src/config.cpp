#include <calcmcp/config.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace calcmcp {

namespace {

std::chrono::seconds whole_seconds(std::chrono::milliseconds ms) {
    auto s = std::chrono::duration_cast<std::chrono::seconds>(ms);
    return s.count() > 0 ? s : std::chrono::seconds(1);
}

void read_duration(const json& obj, const char* key, std::chrono::milliseconds& out) {
    if (obj.contains(key)) {
        out = parse_duration(obj.at(key));
    }
}

} // namespace

std::chrono::milliseconds parse_duration(const json& value) {
    if (value.is_number_integer() || value.is_number_unsigned()) {
        return std::chrono::seconds(value.get<long long>());
    }
    if (!value.is_string()) {
        throw std::invalid_argument("duration must be a string or an integer number of seconds");
    }

    const std::string text = value.get<std::string>();
    std::size_t pos = 0;
    long long amount = 0;
    try {
        amount = std::stoll(text, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid duration: '" + text + "'");
    }

    const std::string unit = text.substr(pos);
    if (unit.empty() || unit == "s") {
        return std::chrono::seconds(amount);
    }
    if (unit == "ms") {
        return std::chrono::milliseconds(amount);
    }
    if (unit == "m") {
        return std::chrono::minutes(amount);
    }
    if (unit == "h") {
        return std::chrono::hours(amount);
    }
    throw std::invalid_argument("invalid duration unit in '" + text + "'");
}

void ServerConfig::validate() const {
    if (transport != "stdio" && transport != "http" && transport != "streamable") {
        throw std::invalid_argument("server.transport must be 'stdio', 'http' or 'streamable', got '" +
                                    transport + "'");
    }
    if (http.host.empty()) {
        throw std::invalid_argument("server.http.host must not be empty");
    }
    if (http.port < 1 || http.port > 65535) {
        throw std::invalid_argument("server.http.port must be between 1 and 65535");
    }
    if (http.session_timeout.count() <= 0) {
        throw std::invalid_argument("server.http.session_timeout must be positive");
    }
    if (http.max_connections == 0) {
        throw std::invalid_argument("server.http.max_connections must be positive");
    }
    if (http.heartbeat_interval.count() <= 0 || http.cleanup_interval.count() <= 0) {
        throw std::invalid_argument("server.http heartbeat and cleanup intervals must be positive");
    }
    if (http.timeout.read.count() <= 0 || http.timeout.write.count() <= 0 || http.timeout.idle.count() <= 0) {
        throw std::invalid_argument("server.http.timeout values must be positive");
    }
    if (http.cors.enabled && http.cors.origins.empty()) {
        throw std::invalid_argument("server.http.cors.origins must not be empty when CORS is enabled");
    }
}

HTTPConfig ServerConfig::to_http_config() const {
    HTTPConfig out;
    out.host = http.host;
    out.port = http.port;
    out.cors_enabled = http.cors.enabled;
    out.cors_origins = http.cors.origins;
    out.read_timeout = whole_seconds(http.timeout.read);
    out.write_timeout = whole_seconds(http.timeout.write);
    out.idle_timeout = whole_seconds(http.timeout.idle);
    out.max_connections = http.max_connections;
    out.version = version;
    return out;
}

StreamableHTTPConfig ServerConfig::to_streamable_config() const {
    StreamableHTTPConfig out;
    out.host = http.host;
    out.port = http.port;
    out.session_timeout = http.session_timeout;
    out.max_connections = http.max_connections;
    out.cors_enabled = http.cors.enabled;
    out.cors_origins = http.cors.origins;
    out.heartbeat_interval = http.heartbeat_interval;
    out.cleanup_interval = http.cleanup_interval;
    out.read_timeout = whole_seconds(http.timeout.read);
    out.write_timeout = whole_seconds(http.timeout.write);
    out.idle_timeout = whole_seconds(http.timeout.idle);
    return out;
}

ConfigLoader::ConfigLoader(const std::string& config_path)
    : config_path_(config_path) {}

ServerConfig ConfigLoader::from_json(const json& document) {
    ServerConfig config;
    if (!document.is_object()) {
        throw std::invalid_argument("configuration must be a JSON object");
    }

    const json server = document.value("server", json::object());
    config.name = server.value("name", config.name);
    config.version = server.value("version", config.version);
    config.transport = server.value("transport", config.transport);

    const json http = server.value("http", json::object());
    config.http.host = http.value("host", config.http.host);
    config.http.port = http.value("port", config.http.port);
    config.http.max_connections = http.value("max_connections", config.http.max_connections);
    read_duration(http, "session_timeout", config.http.session_timeout);
    read_duration(http, "heartbeat_interval", config.http.heartbeat_interval);
    read_duration(http, "cleanup_interval", config.http.cleanup_interval);

    if (http.contains("cors")) {
        const json& cors = http.at("cors");
        config.http.cors.enabled = cors.value("enabled", config.http.cors.enabled);
        if (cors.contains("origins")) {
            config.http.cors.origins = cors.at("origins").get<std::vector<std::string>>();
        }
    }

    if (http.contains("timeout")) {
        const json& timeout = http.at("timeout");
        read_duration(timeout, "read", config.http.timeout.read);
        read_duration(timeout, "write", config.http.timeout.write);
        read_duration(timeout, "idle", config.http.timeout.idle);
    }

    return config;
}

bool ConfigLoader::load() {
    try {
        std::ifstream file(config_path_);
        if (!file.is_open()) {
            std::cerr << "Failed to open config file: " << config_path_ << std::endl;
            return false;
        }

        json document;
        file >> document;
        config_ = from_json(document);

        std::cerr << "Loaded configuration from " << config_path_
                  << " (transport: " << config_.transport << ")" << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << std::endl;
        return false;
    }
}

} // namespace calcmcp
