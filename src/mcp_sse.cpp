#include <calcmcp/streamable_http_transport.hpp>
#include <algorithm>
#include <iostream>
#include <memory>

namespace calcmcp {

namespace {

// How often a waiting stream checks whether its client went away
constexpr std::chrono::milliseconds kDisconnectPoll(250);

ListenOptions listen_options(const StreamableHTTPConfig& config) {
    ListenOptions options;
    options.host = config.host;
    options.port = config.port;
    options.read_timeout = config.read_timeout;
    options.write_timeout = config.write_timeout;
    options.idle_timeout = config.idle_timeout;
    options.max_connections = config.max_connections;
    return options;
}

bool accepts(const std::string& accept, const char* media_type) {
    return accept.find(media_type) != std::string::npos;
}

std::string generate_event_id() {
    return generate_random_hex(8);
}

} // namespace

std::string format_sse_event(const std::string& id, const std::string& event, const std::string& data) {
    return "id: " + id + "\n" + "event: " + event + "\n" + "data: " + data + "\n\n";
}

// ==================== SSE STREAM ====================

SseStream::SseStream(std::string session_id, std::chrono::milliseconds heartbeat_interval,
                     const CancellationSignal& cancel)
    : session_id_(std::move(session_id))
    , heartbeat_interval_(heartbeat_interval)
    , cancel_(cancel) {
}

bool SseStream::write_event(httplib::DataSink& sink, const std::string& event, const std::string& data) {
    std::string frame = format_sse_event(generate_event_id(), event, data);
    if (!sink.write(frame.data(), frame.size())) {
        std::cerr << "Failed to write to SSE sink, client disconnected: " << session_id_ << std::endl;
        return false;
    }
    return true;
}

bool SseStream::operator()(std::size_t /*offset*/, httplib::DataSink& sink) {
    if (!connected_) {
        connected_ = true;
        json connected = {
            {"type", "connected"},
            {"session_id", session_id_}
        };
        return write_event(sink, "connection", connected.dump());
    }

    auto due = std::chrono::steady_clock::now() + heartbeat_interval_;
    for (;;) {
        if (cancel_.cancelled()) {
            sink.done();
            return true;
        }
        if (sink.is_writable && !sink.is_writable()) {
            std::cerr << "SSE client went away: " << session_id_ << std::endl;
            return false;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= due) {
            break;
        }
        auto slice = std::min<std::chrono::steady_clock::duration>(due - now, kDisconnectPoll);
        if (cancel_.wait_for(slice)) {
            sink.done();
            return true;
        }
    }

    ++heartbeats_;
    return write_event(sink, "heartbeat", R"({"type":"ping"})");
}

// ==================== TRANSPORT ====================

StreamableHTTPTransport::StreamableHTTPTransport(const MCPServer& server, StreamableHTTPConfig config)
    : server_(server)
    , config_(std::move(config))
    , cors_(config_.cors_enabled, config_.cors_origins,
            "Content-Type, Accept, MCP-Protocol-Version, Mcp-Session-Id")
    , sessions_(config_.session_timeout)
    , host_(listen_options(config_)) {
    setup_routes();
}

StreamableHTTPTransport::~StreamableHTTPTransport() {
    // Let open streams finish before host_ drains its workers
    shutdown_.cancel();
    sessions_.stop_reaper();
}

void StreamableHTTPTransport::setup_routes() {
    auto& svr = host_.server();

    svr.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        return handle_cors(req, res) ? httplib::Server::HandlerResponse::Handled
                                     : httplib::Server::HandlerResponse::Unhandled;
    });

    // Single MCP endpoint for every verb
    httplib::Server::Handler mcp = [this](const httplib::Request& req, httplib::Response& res) {
        handle_mcp(req, res);
    };
    svr.Get("/mcp", mcp);
    svr.Post("/mcp", mcp);
    svr.Put("/mcp", mcp);
    svr.Patch("/mcp", mcp);
    svr.Delete("/mcp", mcp);
}

bool StreamableHTTPTransport::handle_cors(const httplib::Request& req, httplib::Response& res) const {
    return cors_.apply(req, res);
}

void StreamableHTTPTransport::handle_mcp(const httplib::Request& req, httplib::Response& res) {
    if (req.get_header_value(kProtocolVersionHeader).empty()) {
        res.status = 400;
        res.set_content("MCP-Protocol-Version header required", "text/plain");
        return;
    }

    std::string session_id = req.get_header_value(kSessionIdHeader);
    if (!session_id.empty()) {
        if (!sessions_.touch(session_id)) {
            res.status = 401;
            res.set_content("Invalid or expired session", "text/plain");
            return;
        }
    }

    if (req.method == "POST") {
        handle_post(req, res, session_id);
    } else if (req.method == "GET") {
        handle_get(req, res, session_id);
    } else {
        res.status = 405;
        res.set_content("Method not allowed", "text/plain");
    }
}

void StreamableHTTPTransport::handle_post(const httplib::Request& req, httplib::Response& res,
                                          const std::string& session_id) {
    std::string accept = req.get_header_value("Accept");
    if (!accepts(accept, "application/json") && !accepts(accept, kEventStreamType)) {
        res.status = 400;
        res.set_content("Accept header must include application/json or text/event-stream", "text/plain");
        return;
    }

    Request request;
    try {
        request = parse_request(req.body);
    } catch (const std::exception& e) {
        write_json_response(res,
                            make_error_response(recover_request_id(req.body), ErrorCode::InvalidRequest,
                                                "Invalid JSON-RPC request", e.what()),
                            session_id);
        return;
    }

    Response response = server_.handle_request(request);

    if (accepts(accept, kEventStreamType) && should_stream(request)) {
        write_sse_response(res, response, session_id);
    } else {
        write_json_response(res, response, session_id);
    }
}

void StreamableHTTPTransport::handle_get(const httplib::Request& req, httplib::Response& res,
                                         std::string session_id) {
    if (!accepts(req.get_header_value("Accept"), kEventStreamType)) {
        res.status = 400;
        res.set_content("Accept header must include text/event-stream for GET requests", "text/plain");
        return;
    }

    if (session_id.empty()) {
        session_id = sessions_.create();
        std::cerr << "Created new session: " << session_id << std::endl;
    }

    setup_sse_stream(res, session_id);
}

bool StreamableHTTPTransport::should_stream(const Request& request) const {
    return request.method == "tools/call";
}

void StreamableHTTPTransport::write_sse_response(httplib::Response& res, const Response& response,
                                                 const std::string& session_id) {
    res.set_header("Cache-Control", "no-cache");
    if (!session_id.empty()) {
        res.set_header(kSessionIdHeader, session_id);
    }

    res.status = 200;
    res.set_content(format_sse_event(generate_event_id(), "message", response.dump()),
                    kEventStreamType);
}

void StreamableHTTPTransport::write_json_response(httplib::Response& res, const Response& response,
                                                  const std::string& session_id) {
    if (!session_id.empty()) {
        res.set_header(kSessionIdHeader, session_id);
    }

    res.status = http_status_for(response);
    res.set_content(response.dump() + "\n", "application/json");
}

void StreamableHTTPTransport::setup_sse_stream(httplib::Response& res, const std::string& session_id) {
    res.status = 200;
    res.set_header("Cache-Control", "no-cache");
    res.set_header("X-Accel-Buffering", "no");  // Disable buffering for nginx
    res.set_header(kSessionIdHeader, session_id);

    auto stream = std::make_shared<SseStream>(session_id, config_.heartbeat_interval, shutdown_);

    res.set_chunked_content_provider(
        kEventStreamType,
        [stream](std::size_t offset, httplib::DataSink& sink) { return (*stream)(offset, sink); },
        [session_id](bool success) {
            std::cerr << "SSE stream ended for: " << session_id
                      << (success ? "" : " (client disconnected)") << std::endl;
        });
}

void StreamableHTTPTransport::start() {
    std::cerr << "MCP Server '" << server_.get_name() << "' starting in streamable HTTP mode on "
              << config_.host << ":" << config_.port << "..." << std::endl;
    shutdown_.reset();
    sessions_.start_reaper(config_.cleanup_interval);
    host_.start();
}

void StreamableHTTPTransport::start_background() {
    shutdown_.reset();
    sessions_.start_reaper(config_.cleanup_interval);
    host_.start_background();
    std::cerr << "MCP Server '" << server_.get_name() << "' serving streamable HTTP on "
              << get_addr() << "/mcp" << std::endl;
}

bool StreamableHTTPTransport::stop(std::chrono::milliseconds timeout) {
    std::cerr << "Shutting down MCP streamable HTTP server..." << std::endl;
    shutdown_.cancel();
    sessions_.stop_reaper();
    return host_.stop(timeout);
}

} // namespace calcmcp
