#ifndef CALCMCP_JSONRPC_HPP
#define CALCMCP_JSONRPC_HPP

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace calcmcp {

constexpr const char* kJsonRpcVersion = "2.0";
constexpr const char* kProtocolVersion = "2024-11-05";

// Wire error codes. The numeric values are part of the protocol contract.
enum class ErrorCode : int {
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603
};

struct Error {
    ErrorCode code;
    std::string message;
    json data;  // null when there is nothing to report
};

struct Request {
    std::string jsonrpc = kJsonRpcVersion;
    json id;  // number, string or null; echoed back untouched
    std::string method;
    json params;  // raw until the method handler parses it
};

struct Response {
    json id;
    json result;
    std::optional<Error> error;

    bool ok() const { return !error.has_value(); }
    json to_json() const;

    // Wire text of to_json(). Invalid UTF-8 in strings is replaced with U+FFFD
    // rather than thrown.
    std::string dump() const;
};

// Parse a request object. Throws std::invalid_argument when the envelope
// has the wrong shape and json::parse_error when the text is not JSON.
Request parse_request(const json& message);
Request parse_request(const std::string& text);

// Best-effort recovery of the id of a payload that failed to parse as a request.
json recover_request_id(const std::string& text);

Response make_result_response(const json& id, const json& result);
Response make_error_response(const json& id, ErrorCode code, const std::string& message,
                             const json& data = nullptr);

// HTTP status used by the HTTP transports for a dispatch outcome.
int http_status_for(const Response& response);

// Integral doubles become integers so that 8.0 serializes as 8.
json canonical_number(double value);

} // namespace calcmcp

#endif // CALCMCP_JSONRPC_HPP
