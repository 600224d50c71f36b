#include <calcmcp/http_transport.hpp>
#include <ctime>
#include <iostream>

namespace calcmcp {

namespace {

ListenOptions listen_options(const HTTPConfig& config) {
    ListenOptions options;
    options.host = config.host;
    options.port = config.port;
    options.read_timeout = config.read_timeout;
    options.write_timeout = config.write_timeout;
    options.idle_timeout = config.idle_timeout;
    options.max_connections = config.max_connections;
    return options;
}

void method_not_allowed(httplib::Response& res) {
    res.status = 405;
    res.set_content("Method not allowed", "text/plain");
}

} // namespace

std::string format_rfc3339(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

std::string format_uptime(std::chrono::seconds elapsed) {
    long long total = elapsed.count();
    long long hours = total / 3600;
    long long minutes = (total % 3600) / 60;
    long long seconds = total % 60;

    std::string out;
    if (hours > 0) {
        out += std::to_string(hours) + "h";
    }
    if (hours > 0 || minutes > 0) {
        out += std::to_string(minutes) + "m";
    }
    out += std::to_string(seconds) + "s";
    return out;
}

HTTPTransport::HTTPTransport(const MCPServer& server, HTTPConfig config)
    : server_(server)
    , config_(std::move(config))
    , cors_(config_.cors_enabled, config_.cors_origins, "Content-Type, Authorization")
    , host_(listen_options(config_))
    , start_time_(std::chrono::system_clock::now()) {
    setup_routes();
}

void HTTPTransport::setup_routes() {
    auto& svr = host_.server();

    svr.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        return handle_cors(req, res) ? httplib::Server::HandlerResponse::Handled
                                     : httplib::Server::HandlerResponse::Unhandled;
    });

    auto mcp = [this](const httplib::Request& req, httplib::Response& res) { handle_mcp(req, res); };
    auto health = [this](const httplib::Request& req, httplib::Response& res) { handle_health(req, res); };
    auto tools = [this](const httplib::Request& req, httplib::Response& res) { handle_tools_list(req, res); };
    auto metrics = [this](const httplib::Request& req, httplib::Response& res) { handle_metrics(req, res); };

    for (const auto& [path, handler] : std::vector<std::pair<std::string, httplib::Server::Handler>>{
             {"/mcp", mcp}, {"/health", health}, {"/tools", tools}, {"/metrics", metrics}}) {
        svr.Get(path, handler);
        svr.Post(path, handler);
        svr.Put(path, handler);
        svr.Patch(path, handler);
        svr.Delete(path, handler);
    }
}

bool HTTPTransport::handle_cors(const httplib::Request& req, httplib::Response& res) const {
    return cors_.apply(req, res);
}

void HTTPTransport::write_json_response(httplib::Response& res, const json& data, int status) const {
    res.status = status;
    res.set_content(data.dump(-1, ' ', false, json::error_handler_t::replace) + "\n", "application/json");
}

void HTTPTransport::handle_mcp(const httplib::Request& req, httplib::Response& res) {
    if (req.method != "POST") {
        method_not_allowed(res);
        return;
    }

    requests_total_++;

    // Check content type
    if (req.get_header_value("Content-Type").find("application/json") == std::string::npos) {
        requests_errors_++;
        res.status = 400;
        res.set_content("Content-Type must be application/json", "text/plain");
        return;
    }

    Request request;
    try {
        request = parse_request(req.body);
    } catch (const std::exception& e) {
        requests_errors_++;
        // Include the id if it can still be found in the raw payload
        Response response = make_error_response(recover_request_id(req.body), ErrorCode::InvalidRequest,
                                                "Invalid JSON-RPC request", e.what());
        write_json_response(res, response.to_json(), 400);
        return;
    }

    Response response = server_.handle_request(request);
    int status = http_status_for(response);
    if (status == 200) {
        requests_success_++;
    } else {
        requests_errors_++;
    }
    write_json_response(res, response.to_json(), status);
}

void HTTPTransport::handle_health(const httplib::Request& req, httplib::Response& res) const {
    if (req.method != "GET") {
        method_not_allowed(res);
        return;
    }

    json health = {
        {"status", "healthy"},
        {"timestamp", format_rfc3339(std::chrono::system_clock::now())},
        {"version", config_.version}
    };
    write_json_response(res, health, 200);
}

void HTTPTransport::handle_tools_list(const httplib::Request& req, httplib::Response& res) const {
    if (req.method != "GET") {
        method_not_allowed(res);
        return;
    }

    Request request;
    request.id = "tools-list";
    request.method = "tools/list";

    Response response = server_.handle_request(request);
    write_json_response(res, response.to_json(), response.ok() ? 200 : 500);
}

void HTTPTransport::handle_metrics(const httplib::Request& req, httplib::Response& res) const {
    if (req.method != "GET") {
        method_not_allowed(res);
        return;
    }

    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now() - start_time_);

    json metrics = {
        {"server", {
            {"uptime", format_uptime(uptime)},
            {"version", config_.version},
            {"transport", "http"},
            {"start_time", format_rfc3339(start_time_)}
        }},
        {"requests", {
            {"total", requests_total_.load()},
            {"success", requests_success_.load()},
            {"errors", requests_errors_.load()}
        }}
    };
    write_json_response(res, metrics, 200);
}

void HTTPTransport::start() {
    std::cerr << "MCP Server '" << server_.get_name() << "' starting in HTTP mode on "
              << config_.host << ":" << config_.port << "..." << std::endl;
    host_.start();
}

void HTTPTransport::start_background() {
    host_.start_background();
    std::cerr << "MCP Server '" << server_.get_name() << "' serving HTTP on " << get_addr() << std::endl;
}

bool HTTPTransport::stop(std::chrono::milliseconds timeout) {
    std::cerr << "Shutting down HTTP server..." << std::endl;
    return host_.stop(timeout);
}

} // namespace calcmcp
