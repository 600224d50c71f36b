#ifndef CALCMCP_CORS_HPP
#define CALCMCP_CORS_HPP

#include <string>
#include <vector>

namespace httplib {
struct Request;
struct Response;
}

namespace calcmcp {

// Origin allow-list shared by the HTTP transports.
class CorsPolicy {
public:
    CorsPolicy(bool enabled, std::vector<std::string> origins, std::string allowed_headers);

    bool enabled() const { return enabled_; }

    // "*" matches any origin
    bool is_origin_allowed(const std::string& origin) const;

    // Adds the CORS headers to res. Returns true when the request was a
    // pre-flight that has been answered and must not be routed further.
    bool apply(const httplib::Request& req, httplib::Response& res) const;

private:
    bool enabled_;
    std::vector<std::string> origins_;
    std::string allowed_headers_;
};

} // namespace calcmcp

#endif // CALCMCP_CORS_HPP
