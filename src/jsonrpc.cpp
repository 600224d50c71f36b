#include <calcmcp/jsonrpc.hpp>
#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace calcmcp {

namespace {

bool is_valid_id(const json& id) {
    return id.is_null() || id.is_string() || id.is_number();
}

} // namespace

json Response::to_json() const {
    json out = {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id}
    };

    if (error) {
        json err = {
            {"code", static_cast<int>(error->code)},
            {"message", error->message}
        };
        if (!error->data.is_null()) {
            err["data"] = error->data;
        }
        out["error"] = err;
    } else {
        out["result"] = result;
    }
    return out;
}

std::string Response::dump() const {
    return to_json().dump(-1, ' ', false, json::error_handler_t::replace);
}

Request parse_request(const json& message) {
    if (!message.is_object()) {
        throw std::invalid_argument("request must be a JSON object");
    }

    Request request;

    auto jsonrpc_it = message.find("jsonrpc");
    if (jsonrpc_it != message.end() && !jsonrpc_it->is_null()) {
        if (!jsonrpc_it->is_string()) {
            throw std::invalid_argument("jsonrpc must be a string");
        }
        request.jsonrpc = jsonrpc_it->get<std::string>();
    }

    auto method_it = message.find("method");
    if (method_it != message.end() && !method_it->is_null()) {
        if (!method_it->is_string()) {
            throw std::invalid_argument("method must be a string");
        }
        request.method = method_it->get<std::string>();
    }

    auto id_it = message.find("id");
    if (id_it != message.end()) {
        if (!is_valid_id(*id_it)) {
            throw std::invalid_argument("id must be a number, a string or null");
        }
        request.id = *id_it;
    }

    auto params_it = message.find("params");
    if (params_it != message.end()) {
        request.params = *params_it;
    }

    return request;
}

Request parse_request(const std::string& text) {
    return parse_request(json::parse(text));
}

json recover_request_id(const std::string& text) {
    json raw = json::parse(text, nullptr, false);
    if (raw.is_discarded() || !raw.is_object()) {
        return nullptr;
    }
    auto id_it = raw.find("id");
    if (id_it == raw.end() || !is_valid_id(*id_it)) {
        return nullptr;
    }
    return *id_it;
}

Response make_result_response(const json& id, const json& result) {
    Response response;
    response.id = id;
    response.result = result;
    return response;
}

Response make_error_response(const json& id, ErrorCode code, const std::string& message,
                             const json& data) {
    Response response;
    response.id = id;
    response.error = Error{code, message, data};
    return response;
}

int http_status_for(const Response& response) {
    if (!response.error) {
        return 200;
    }
    switch (response.error->code) {
        case ErrorCode::InvalidRequest:
        case ErrorCode::InvalidParams:
            return 400;
        case ErrorCode::MethodNotFound:
            return 404;
        case ErrorCode::InternalError:
            return 500;
    }
    return 500;
}

json canonical_number(double value) {
    if (std::isfinite(value) && std::trunc(value) == value &&
        std::fabs(value) < 9007199254740992.0) {  // 2^53, exact in a double
        return static_cast<std::int64_t>(value);
    }
    return value;
}

} // namespace calcmcp
