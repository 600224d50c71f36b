#include <calcmcp/cors.hpp>
#include <httplib.h>

namespace calcmcp {

CorsPolicy::CorsPolicy(bool enabled, std::vector<std::string> origins, std::string allowed_headers)
    : enabled_(enabled), origins_(std::move(origins)), allowed_headers_(std::move(allowed_headers)) {
}

bool CorsPolicy::is_origin_allowed(const std::string& origin) const {
    for (const auto& allowed : origins_) {
        if (allowed == "*" || allowed == origin) {
            return true;
        }
    }
    return false;
}

bool CorsPolicy::apply(const httplib::Request& req, httplib::Response& res) const {
    if (!enabled_) {
        return false;
    }

    std::string origin = req.get_header_value("Origin");
    if (!origin.empty() && is_origin_allowed(origin)) {
        res.set_header("Access-Control-Allow-Origin", origin);
    }
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", allowed_headers_);
    res.set_header("Access-Control-Max-Age", "86400");

    if (req.method == "OPTIONS") {
        res.status = 200;
        return true;
    }
    return false;
}

} // namespace calcmcp
