#include <calcmcp/mcp_client.hpp>
#include <calcmcp/jsonrpc.hpp>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <curl/curl.h>

namespace calcmcp {

namespace {

// Helper for CURL responses
size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

// Collects the body of an event stream until the first complete frame
size_t first_frame_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* buffer = static_cast<std::string*>(userp);
    buffer->append(static_cast<char*>(contents), size * nmemb);
    if (buffer->find("\n\n") != std::string::npos) {
        return 0;  // abort the transfer, the frame is complete
    }
    return size * nmemb;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t length = size * nitems;
    std::string line(buffer, length);

    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == "mcp-session-id") {
            std::string value = line.substr(colon + 1);
            auto begin = value.find_first_not_of(" \t");
            auto end = value.find_last_not_of(" \t\r\n");
            *static_cast<std::string*>(userdata) =
                begin == std::string::npos ? std::string() : value.substr(begin, end - begin + 1);
        }
    }
    return length;
}

class CurlHandle {
public:
    CurlHandle() : curl_(curl_easy_init()) {
        if (!curl_) {
            throw std::runtime_error("Failed to initialize CURL");
        }
    }
    ~CurlHandle() {
        curl_slist_free_all(headers_);
        curl_easy_cleanup(curl_);
    }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    void add_header(const std::string& header) {
        headers_ = curl_slist_append(headers_, header.c_str());
    }

    CURL* get() { return curl_; }

    CURLcode perform() {
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
        return curl_easy_perform(curl_);
    }

    long status() {
        long http_code = 0;
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
        return http_code;
    }

    std::string content_type() {
        char* type = nullptr;
        curl_easy_getinfo(curl_, CURLINFO_CONTENT_TYPE, &type);
        return type ? type : "";
    }

private:
    CURL* curl_;
    curl_slist* headers_ = nullptr;
};

} // namespace

std::string extract_sse_data(const std::string& frame) {
    std::size_t pos = 0;
    while (pos < frame.size()) {
        std::size_t end = frame.find('\n', pos);
        if (end == std::string::npos) {
            end = frame.size();
        }
        std::string line = frame.substr(pos, end - pos);
        if (line.compare(0, 5, "data:") == 0) {
            std::string data = line.substr(5);
            if (!data.empty() && data[0] == ' ') {
                data.erase(0, 1);
            }
            return data;
        }
        pos = end + 1;
    }
    return {};
}

MCPClient::MCPClient(const std::string& name, const std::string& version)
    : client_name_(name)
    , client_version_(version) {
}

MCPClient::~MCPClient() {
    disconnect();
}

bool MCPClient::connect_http(const std::string& url) {
    std::cerr << "Connecting to MCP server via HTTP: " << url << std::endl;
    transport_type_ = TransportType::HTTP;
    url_ = url;
    connected_ = true;
    return initialize();
}

bool MCPClient::connect_streamable(const std::string& url) {
    std::cerr << "Connecting to MCP server via streamable HTTP: " << url << std::endl;
    transport_type_ = TransportType::STREAMABLE;
    url_ = url;
    session_id_.clear();
    connected_ = true;
    return initialize();
}

void MCPClient::disconnect() {
    if (!connected_) return;
    connected_ = false;
    session_id_.clear();
    std::cerr << "Disconnected from MCP server" << std::endl;
}

std::vector<std::string> MCPClient::request_headers(bool event_stream_get) const {
    std::vector<std::string> headers;
    if (event_stream_get) {
        headers.push_back("Accept: text/event-stream");
    } else {
        headers.push_back("Content-Type: application/json");
        headers.push_back(prefer_event_stream_ ? "Accept: application/json, text/event-stream"
                                               : "Accept: application/json");
    }
    if (transport_type_ == TransportType::STREAMABLE) {
        headers.push_back(std::string("MCP-Protocol-Version: ") + kProtocolVersion);
        if (!session_id_.empty()) {
            headers.push_back("Mcp-Session-Id: " + session_id_);
        }
    }
    return headers;
}

HttpReply MCPClient::post(const std::string& body) {
    CurlHandle curl;
    HttpReply reply;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &reply.body);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &reply.session_id);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 10L);
    for (const auto& header : request_headers(false)) {
        curl.add_header(header);
    }

    CURLcode res = curl.perform();
    if (res != CURLE_OK) {
        throw std::runtime_error(std::string("CURL request failed: ") + curl_easy_strerror(res));
    }

    reply.status = curl.status();
    reply.content_type = curl.content_type();
    return reply;
}

std::string MCPClient::open_session() {
    if (transport_type_ != TransportType::STREAMABLE) {
        std::cerr << "Sessions are only available in streamable mode" << std::endl;
        return {};
    }

    CurlHandle curl;
    std::string frame;
    std::string session_id;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, first_frame_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &frame);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &session_id);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 10L);
    for (const auto& header : request_headers(true)) {
        curl.add_header(header);
    }

    // The stream never ends on its own; the write callback aborts it after
    // the connection event, which curl reports as a write error.
    CURLcode res = curl.perform();
    if (res != CURLE_OK && res != CURLE_WRITE_ERROR) {
        std::cerr << "Failed to open event stream: " << curl_easy_strerror(res) << std::endl;
        return {};
    }

    long status = curl.status();
    if (status != 200) {
        std::cerr << "Event stream rejected with HTTP " << status << std::endl;
        return {};
    }

    std::string data = extract_sse_data(frame);
    if (data.empty()) {
        std::cerr << "Event stream closed before the connection event" << std::endl;
        return {};
    }

    json event = json::parse(data, nullptr, false);
    if (event.is_discarded() || event.value("type", "") != "connected") {
        std::cerr << "Unexpected first event: " << data << std::endl;
        return {};
    }

    session_id_ = session_id.empty() ? event.value("session_id", "") : session_id;
    std::cerr << "✓ Session: " << session_id_ << std::endl;
    return session_id_;
}

bool MCPClient::initialize() {
    json params = {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", json::object()},
        {"clientInfo", {
            {"name", client_name_},
            {"version", client_version_}
        }}
    };

    json response;
    try {
        response = send_request("initialize", params);
    } catch (const std::exception& e) {
        std::cerr << "Initialize failed: " << e.what() << std::endl;
        connected_ = false;
        return false;
    }

    if (response.contains("error")) {
        std::cerr << "Initialize failed: " << response["error"].dump() << std::endl;
        return false;
    }

    if (response.contains("result")) {
        const auto& result = response["result"];

        if (result.contains("serverInfo")) {
            server_name_ = result["serverInfo"].value("name", "");
            server_version_ = result["serverInfo"].value("version", "");
        }

        protocol_version_ = result.value("protocolVersion", "");

        std::cerr << "✓ Connected to: " << server_name_ << " v" << server_version_ << std::endl;
        std::cerr << "✓ Protocol: " << protocol_version_ << std::endl;
        return true;
    }

    return false;
}

std::vector<RemoteTool> MCPClient::list_tools() {
    json response = send_request("tools/list");
    std::vector<RemoteTool> tools;

    if (response.contains("result") && response["result"].contains("tools")) {
        for (const auto& tool_json : response["result"]["tools"]) {
            RemoteTool tool;
            tool.name = tool_json["name"].get<std::string>();
            tool.description = tool_json.value("description", "");
            tool.input_schema = tool_json.value("inputSchema", json::object());
            tools.push_back(tool);
        }
    }

    return tools;
}

json MCPClient::call_tool(const std::string& name, const json& arguments) {
    json params = {
        {"name", name},
        {"arguments", arguments}
    };

    json response = send_request("tools/call", params);

    if (response.contains("result")) {
        return response["result"];
    }

    return response;
}

json MCPClient::send_request(const std::string& method, const json& params) {
    if (!connected_) {
        throw std::runtime_error("Not connected to an MCP server");
    }

    json request = {
        {"jsonrpc", kJsonRpcVersion},
        {"id", ++request_id_},
        {"method", method}
    };

    if (!params.is_null()) {
        request["params"] = params;
    }

    HttpReply reply = post(request.dump());

    if (!reply.session_id.empty()) {
        session_id_ = reply.session_id;
    }

    std::string payload = reply.body;
    if (reply.content_type.find("text/event-stream") != std::string::npos) {
        payload = extract_sse_data(reply.body);
    }

    // Error statuses carry a JSON-RPC body unless the transport itself refused the request
    json response = json::parse(payload, nullptr, false);
    if (response.is_discarded() || !response.is_object()) {
        std::cerr << "HTTP error " << reply.status << ": " << reply.body << std::endl;
        throw std::runtime_error("HTTP request failed with code " + std::to_string(reply.status));
    }

    return response;
}

} // namespace calcmcp
